//===- RuleKeyHasher.h ------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_RULEKEYHASHER_H
#define RULEKIT_RULEKEY_RULEKEYHASHER_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/HashCode.h"
#include "rulekit/RuleKey/HashFunction.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>

namespace rulekit {
namespace rulekey {

/// The tags which prefix every item in the canonical rule key encoding.
///
/// The numeric values are part of the persisted key format and must never be
/// changed or reused.
enum class RuleKeyTag : uint8_t {
  Key = 0x01,
  Null = 0x02,
  Boolean = 0x03,

  Int8 = 0x10,
  UInt8 = 0x11,
  Int16 = 0x12,
  UInt16 = 0x13,
  Int32 = 0x14,
  UInt32 = 0x15,
  Int64 = 0x16,
  UInt64 = 0x17,

  String = 0x20,
  Bytes = 0x21,
  Enum = 0x22,
  HashCode = 0x23,
  RuleKey = 0x24,
  RuleReference = 0x25,
  BuildTarget = 0x26,
  BuildRuleType = 0x27,

  Path = 0x30,
  ArchiveMemberPath = 0x31,
  NonHashingPath = 0x32,
  BuildTargetSourcePath = 0x33,

  Container = 0x40,
  Wrapper = 0x41,
  AppendableStart = 0x42,
  AppendableEnd = 0x43,
};

enum class ContainerKind : uint8_t {
  List = 0x01,
  Map = 0x02,
};

enum class WrapperKind : uint8_t {
  Optional = 0x01,
};

/// Low level writer of the canonical rule key encoding.
///
/// Every put* method feeds one tagged item into the underlying hash
/// function. Multi-byte integers are written big-endian at their declared
/// width, and strings and byte arrays carry a 32-bit big-endian length prefix,
/// so distinct item sequences always produce distinct byte streams.
class RuleKeyHasher {
  std::unique_ptr<HashFunction> function;

  /// The buffer receiving a copy of the emitted bytes, if any.
  SmallVectorImpl<uint8_t>* recording = nullptr;

  /// Scratch space for the item currently being encoded.
  SmallVector<uint8_t, 64> scratch;

  bool finished = false;

  void writeTag(RuleKeyTag tag);
  void writeByte(uint8_t value);
  void writeFixed(uint64_t value, unsigned numBytes);
  void writeLengthPrefixed(StringRef data);
  void flush();

  RuleKeyHasher& putTagged(RuleKeyTag tag, uint64_t value, unsigned numBytes);

  // Copying is disabled.
  RuleKeyHasher(const RuleKeyHasher&) RULEKIT_DELETED_FUNCTION;
  void operator=(const RuleKeyHasher&) RULEKIT_DELETED_FUNCTION;

public:
  explicit RuleKeyHasher(std::unique_ptr<HashFunction> function);
  ~RuleKeyHasher();

  /// Get the name of the underlying hash function.
  StringRef getHashFunctionName() const { return function->getName(); }

  /// Mirror all bytes subsequently emitted into \arg buffer, or stop
  /// mirroring if null.
  void setRecording(SmallVectorImpl<uint8_t>* buffer) { recording = buffer; }

  /// @name Item Writers
  /// @{

  RuleKeyHasher& putKey(StringRef key);
  RuleKeyHasher& putNull();
  RuleKeyHasher& putBoolean(bool value);

  RuleKeyHasher& putNumber(int8_t value);
  RuleKeyHasher& putNumber(uint8_t value);
  RuleKeyHasher& putNumber(int16_t value);
  RuleKeyHasher& putNumber(uint16_t value);
  RuleKeyHasher& putNumber(int32_t value);
  RuleKeyHasher& putNumber(uint32_t value);
  RuleKeyHasher& putNumber(int64_t value);
  RuleKeyHasher& putNumber(uint64_t value);

  RuleKeyHasher& putString(StringRef value);
  RuleKeyHasher& putBytes(ArrayRef<uint8_t> value);
  RuleKeyHasher& putEnum(StringRef typeName, StringRef enumerantName);
  RuleKeyHasher& putHashCode(const HashCode& value);

  /// Put a raw rule key value, as opposed to a reference to a rule.
  RuleKeyHasher& putRuleKey(const RuleKey& value);

  /// Put a reference to another rule, identified by its finalized key.
  RuleKeyHasher& putRuleReference(const RuleKey& ruleKey);

  RuleKeyHasher& putBuildTarget(StringRef fullyQualifiedName);
  RuleKeyHasher& putBuildRuleType(StringRef type);

  /// Put a hashable path, represented only by its content hash.
  RuleKeyHasher& putPath(const HashCode& contentHash);

  /// Put an archive member as the archive content hash and the member path,
  /// encoded as two sub-fields.
  RuleKeyHasher& putArchiveMemberPath(const HashCode& archiveHash,
                                      StringRef memberPath);

  /// Put a path which contributes by name only.
  RuleKeyHasher& putNonHashingPath(StringRef path);

  /// Put the output of a rule, as the producing rule's key plus the output
  /// path.
  RuleKeyHasher& putBuildTargetSourcePath(const RuleKey& producer,
                                          StringRef outputPath);

  RuleKeyHasher& putContainer(ContainerKind kind, uint64_t size);
  RuleKeyHasher& putWrapper(WrapperKind kind);
  RuleKeyHasher& putAppendableStart();
  RuleKeyHasher& putAppendableEnd();

  /// @}

  /// Finish hashing and return the digest.
  ///
  /// No items may be put after this call.
  HashCode finish();

  /// Finish hashing and return the result as a rule key.
  RuleKey hash() { return RuleKey(finish()); }
};

}
}

#endif
