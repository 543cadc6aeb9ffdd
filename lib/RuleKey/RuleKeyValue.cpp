//===-- RuleKeyValue.cpp --------------------------------------------------===//
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

#include "rulekit/RuleKey/RuleKeyValue.h"

#include "rulekit/RuleKey/BuildRule.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace rulekit;
using namespace rulekit::rulekey;

StringRef rulekit::rulekey::getRuleKeyValueKindName(RuleKeyValue::Kind kind) {
  switch (kind) {
#define CASE(name) case RuleKeyValue::Kind::name: return #name
    CASE(Null);
    CASE(Boolean);
    CASE(Integer);
    CASE(String);
    CASE(Bytes);
    CASE(Enum);
    CASE(HashCode);
    CASE(RuleKey);
    CASE(BuildTarget);
    CASE(BuildRuleType);
    CASE(SourcePath);
    CASE(NonHashableSourcePath);
    CASE(Rule);
    CASE(Appendable);
    CASE(Sequence);
    CASE(Mapping);
    CASE(Optional);
#undef CASE
  }
  llvm_unreachable("invalid rule key value kind");
}

void RuleKeyValue::print(raw_ostream& os) const {
  switch (kind) {
  case Kind::Null:
    os << "null";
    return;
  case Kind::Boolean:
    os << (getBoolean() ? "true" : "false");
    return;
  case Kind::Integer:
    switch (integerType) {
    case IntegerType::Int8: os << int64_t(int8_t(scalar)); break;
    case IntegerType::Int16: os << int64_t(int16_t(scalar)); break;
    case IntegerType::Int32: os << int64_t(int32_t(scalar)); break;
    case IntegerType::Int64: os << int64_t(scalar); break;
    default: os << scalar; break;
    }
    return;
  case Kind::String:
    os << '"';
    os.write_escaped(text);
    os << '"';
    return;
  case Kind::Bytes:
  case Kind::HashCode:
    os << "0x" << llvm::toHex(text, /*LowerCase=*/true);
    return;
  case Kind::Enum:
    os << typeName << "." << text;
    return;
  case Kind::RuleKey:
    os << "RuleKey(" << llvm::toHex(text, /*LowerCase=*/true) << ")";
    return;
  case Kind::BuildTarget:
    os << *target;
    return;
  case Kind::BuildRuleType:
    os << "type(" << text << ")";
    return;
  case Kind::SourcePath:
    os << "path(" << *sourcePath << ")";
    return;
  case Kind::NonHashableSourcePath:
    os << "non-hashable(" << *sourcePath << ")";
    return;
  case Kind::Rule:
    os << "rule(" << rule->getFullyQualifiedName() << ")";
    return;
  case Kind::Appendable:
    os << "appendable";
    return;
  case Kind::Sequence: {
    os << "[";
    bool first = true;
    for (const auto& element: elements) {
      if (!first)
        os << ", ";
      first = false;
      element.print(os);
    }
    os << "]";
    return;
  }
  case Kind::Mapping:
    os << "{";
    for (size_t i = 0, e = getNumMappingEntries(); i != e; ++i) {
      if (i != 0)
        os << ", ";
      getMappingKey(i).print(os);
      os << ": ";
      getMappingValue(i).print(os);
    }
    os << "}";
    return;
  case Kind::Optional:
    if (hasOptionalValue()) {
      os << "optional(";
      getOptionalValue().print(os);
      os << ")";
    } else {
      os << "optional()";
    }
    return;
  }
  llvm_unreachable("invalid rule key value kind");
}
