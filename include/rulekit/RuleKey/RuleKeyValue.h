//===- RuleKeyValue.h -------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef RULEKIT_RULEKEY_RULEKEYVALUE_H
#define RULEKIT_RULEKEY_RULEKEYVALUE_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/BuildTarget.h"
#include "rulekit/RuleKey/HashCode.h"
#include "rulekit/RuleKey/SourcePath.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cassert>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rulekit {
namespace rulekey {

class BuildRule;
class RuleKeyAppendable;

/// A value which may contribute to a rule key.
///
/// The set of kinds is closed; a value of any other type must first be
/// converted into one of these, typically by implementing
/// \see RuleKeyAppendable. Values are cheap to copy.
class RuleKeyValue {
public:
  enum class Kind {
    /// An absent value.
    Null = 0,

    Boolean,

    /// A fixed-width integer, see \see IntegerType.
    Integer,

    /// UTF-8 text.
    String,

    /// Raw bytes.
    Bytes,

    /// A named enumerant of a named enumeration.
    Enum,

    /// A raw digest.
    HashCode,

    /// A raw rule key value, as opposed to a reference to a rule.
    RuleKey,

    BuildTarget,

    /// The type name of a rule.
    BuildRuleType,

    /// A source path contributing by content.
    SourcePath,

    /// A source path contributing by name only.
    NonHashableSourcePath,

    /// A reference to another rule, contributing that rule's key.
    Rule,

    /// A structured value contributing its own fields.
    Appendable,

    /// An ordered list of values.
    Sequence,

    /// An unordered set of key/value entries.
    Mapping,

    /// A possibly absent value.
    Optional,
  };

  enum class IntegerType {
    Int8 = 0, UInt8, Int16, UInt16, Int32, UInt32, Int64, UInt64
  };

private:
  Kind kind = Kind::Null;
  IntegerType integerType = IntegerType::Int32;

  /// The payload of Boolean and Integer values.
  uint64_t scalar = 0;

  /// The payload of String, Bytes, BuildRuleType, HashCode and RuleKey
  /// values, and the enumerant name of Enum values.
  std::string text;

  /// The enumeration name of Enum values.
  std::string typeName;

  std::shared_ptr<const rulekey::BuildTarget> target;
  std::shared_ptr<const rulekey::SourcePath> sourcePath;
  std::shared_ptr<const RuleKeyAppendable> appendable;
  const BuildRule* rule = nullptr;

  /// The elements of a Sequence, the alternating keys and values of a
  /// Mapping, or the contained value of a present Optional.
  std::vector<RuleKeyValue> elements;

  explicit RuleKeyValue(Kind kind) : kind(kind) {}

  template<typename T>
  static IntegerType getIntegerTypeFor() {
    static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 ||
                  sizeof(T) == 8, "unsupported integer width");
    bool isSigned = std::is_signed<T>::value;
    switch (sizeof(T)) {
    case 1: return isSigned ? IntegerType::Int8 : IntegerType::UInt8;
    case 2: return isSigned ? IntegerType::Int16 : IntegerType::UInt16;
    case 4: return isSigned ? IntegerType::Int32 : IntegerType::UInt32;
    default: return isSigned ? IntegerType::Int64 : IntegerType::UInt64;
    }
  }

public:
  /// Create a Null value.
  RuleKeyValue() {}

  RuleKeyValue(bool value) : kind(Kind::Boolean), scalar(value ? 1 : 0) {}

  template<typename T,
           typename std::enable_if<std::is_integral<T>::value &&
                                   !std::is_same<T, bool>::value &&
                                   !std::is_same<T, char>::value,
                                   int>::type = 0>
  RuleKeyValue(T value)
    : kind(Kind::Integer), integerType(getIntegerTypeFor<T>()),
      scalar(static_cast<uint64_t>(value)) {}

  /// A plain char is always hashed as a signed 8-bit integer, whatever the
  /// signedness of char on the host.
  RuleKeyValue(char value)
    : kind(Kind::Integer), integerType(IntegerType::Int8),
      scalar(static_cast<uint64_t>(static_cast<signed char>(value))) {}

  RuleKeyValue(const char* value) : kind(Kind::String), text(value) {}
  RuleKeyValue(StringRef value) : kind(Kind::String), text(value) {}
  RuleKeyValue(const std::string& value) : kind(Kind::String), text(value) {}

  RuleKeyValue(const rulekey::HashCode& value)
    : kind(Kind::HashCode), text(value.getBytes()) {}
  RuleKeyValue(const rulekey::RuleKey& value)
    : kind(Kind::RuleKey), text(value.getHashCode().getBytes()) {}

  RuleKeyValue(const rulekey::BuildTarget& value)
    : kind(Kind::BuildTarget),
      target(std::make_shared<rulekey::BuildTarget>(value)) {}

  RuleKeyValue(const rulekey::SourcePath& value)
    : kind(Kind::SourcePath),
      sourcePath(std::make_shared<rulekey::SourcePath>(value)) {}

  RuleKeyValue(std::shared_ptr<const RuleKeyAppendable> value)
    : kind(Kind::Appendable), appendable(std::move(value)) {
    assert(appendable && "null appendable");
  }

  RuleKeyValue(std::vector<RuleKeyValue> values)
    : kind(Kind::Sequence), elements(std::move(values)) {}

  /// @name Factories
  /// @{

  static RuleKeyValue makeNull() { return RuleKeyValue(); }

  static RuleKeyValue makeBytes(ArrayRef<uint8_t> value) {
    RuleKeyValue result(Kind::Bytes);
    result.text.assign(value.begin(), value.end());
    return result;
  }

  static RuleKeyValue makeEnum(StringRef typeName, StringRef enumerantName) {
    RuleKeyValue result(Kind::Enum);
    result.typeName = typeName.str();
    result.text = enumerantName.str();
    return result;
  }

  static RuleKeyValue makeBuildRuleType(StringRef type) {
    RuleKeyValue result(Kind::BuildRuleType);
    result.text = type.str();
    return result;
  }

  static RuleKeyValue
  makeNonHashableSourcePath(const rulekey::SourcePath& path) {
    RuleKeyValue result(Kind::NonHashableSourcePath);
    result.sourcePath = std::make_shared<rulekey::SourcePath>(path);
    return result;
  }

  /// Create a reference to \arg rule, which must outlive the value.
  static RuleKeyValue makeRule(const BuildRule& rule) {
    RuleKeyValue result(Kind::Rule);
    result.rule = &rule;
    return result;
  }

  static RuleKeyValue makeOptional(const Optional<RuleKeyValue>& value) {
    RuleKeyValue result(Kind::Optional);
    if (value.hasValue())
      result.elements.push_back(*value);
    return result;
  }

  template<typename Iterator>
  static RuleKeyValue makeSequence(Iterator begin, Iterator end) {
    RuleKeyValue result(Kind::Sequence);
    for (; begin != end; ++begin)
      result.elements.push_back(RuleKeyValue(*begin));
    return result;
  }

  template<typename T>
  static RuleKeyValue makeSequence(const std::vector<T>& values) {
    return makeSequence(values.begin(), values.end());
  }

  static RuleKeyValue
  makeMapping(ArrayRef<std::pair<RuleKeyValue, RuleKeyValue>> entries) {
    RuleKeyValue result(Kind::Mapping);
    for (const auto& entry: entries) {
      result.elements.push_back(entry.first);
      result.elements.push_back(entry.second);
    }
    return result;
  }

  template<typename K, typename V>
  static RuleKeyValue makeMapping(const std::map<K, V>& values) {
    RuleKeyValue result(Kind::Mapping);
    for (const auto& entry: values) {
      result.elements.push_back(RuleKeyValue(entry.first));
      result.elements.push_back(RuleKeyValue(entry.second));
    }
    return result;
  }

  /// @}

  /// @name Accessors
  /// @{

  Kind getKind() const { return kind; }

  /// Check whether this is a sequence with no elements, which contributes
  /// nothing when used as a field.
  bool isEmptySequence() const {
    return kind == Kind::Sequence && elements.empty();
  }

  bool getBoolean() const {
    assert(kind == Kind::Boolean);
    return scalar != 0;
  }

  IntegerType getIntegerType() const {
    assert(kind == Kind::Integer);
    return integerType;
  }

  /// Get the integer payload, zero or sign extended to 64 bits.
  uint64_t getIntegerBits() const {
    assert(kind == Kind::Integer);
    return scalar;
  }

  /// Get the payload of text-like values.
  StringRef getText() const { return text; }

  StringRef getEnumTypeName() const {
    assert(kind == Kind::Enum);
    return typeName;
  }

  const rulekey::BuildTarget& getBuildTarget() const {
    assert(kind == Kind::BuildTarget);
    return *target;
  }

  const rulekey::SourcePath& getSourcePath() const {
    assert(kind == Kind::SourcePath || kind == Kind::NonHashableSourcePath);
    return *sourcePath;
  }

  const BuildRule& getRule() const {
    assert(kind == Kind::Rule);
    return *rule;
  }

  const RuleKeyAppendable& getAppendable() const {
    assert(kind == Kind::Appendable);
    return *appendable;
  }

  /// Get the elements of a sequence.
  ArrayRef<RuleKeyValue> getElements() const {
    assert(kind == Kind::Sequence);
    return elements;
  }

  size_t getNumMappingEntries() const {
    assert(kind == Kind::Mapping);
    return elements.size() / 2;
  }
  const RuleKeyValue& getMappingKey(size_t index) const {
    assert(kind == Kind::Mapping);
    return elements[index * 2];
  }
  const RuleKeyValue& getMappingValue(size_t index) const {
    assert(kind == Kind::Mapping);
    return elements[index * 2 + 1];
  }

  bool hasOptionalValue() const {
    assert(kind == Kind::Optional);
    return !elements.empty();
  }
  const RuleKeyValue& getOptionalValue() const {
    assert(hasOptionalValue());
    return elements[0];
  }

  /// @}

  /// Print a human readable description, for diagnostics.
  void print(raw_ostream& os) const;
};

StringRef getRuleKeyValueKindName(RuleKeyValue::Kind kind);

}
}

#endif
