//===- FileHashCache.h ------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_FILEHASHCACHE_H
#define RULEKIT_RULEKEY_FILEHASHCACHE_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/HashCode.h"
#include "rulekit/RuleKey/HashFunction.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace rulekit {
namespace rulekey {

/// Provides the content hashes of files referenced by rule keys.
///
/// Implementations must be safe to use from multiple threads.
class FileHashCache {
public:
  virtual ~FileHashCache();

  /// Get the content hash of the file at \arg absolutePath.
  virtual Expected<HashCode> get(StringRef absolutePath) = 0;

  /// Get the content hash of the member \arg memberPath of the archive at
  /// \arg archivePath.
  virtual Expected<HashCode> getForArchiveMember(StringRef archivePath,
                                                 StringRef memberPath) = 0;
};

/// A cache with fixed, client supplied contents.
class InMemoryFileHashCache : public FileHashCache {
  std::mutex mutex;
  llvm::StringMap<HashCode> files;
  std::map<std::pair<std::string, std::string>, HashCode> members;

public:
  void set(StringRef absolutePath, const HashCode& hash);
  void setArchiveMember(StringRef archivePath, StringRef memberPath,
                        const HashCode& hash);

  Expected<HashCode> get(StringRef absolutePath) override;
  Expected<HashCode> getForArchiveMember(StringRef archivePath,
                                         StringRef memberPath) override;
};

/// A cache which reads and hashes files on first use.
class DefaultFileHashCache : public FileHashCache {
  HashFunctionFactory hashFunctionFactory;

  std::mutex mutex;
  llvm::StringMap<HashCode> files;
  std::map<std::pair<std::string, std::string>, HashCode> members;

  HashCode hashBytes(StringRef data);

public:
  explicit DefaultFileHashCache(
      HashFunctionKind kind = HashFunctionKind::SHA1);
  explicit DefaultFileHashCache(HashFunctionFactory hashFunctionFactory);

  Expected<HashCode> get(StringRef absolutePath) override;
  Expected<HashCode> getForArchiveMember(StringRef archivePath,
                                         StringRef memberPath) override;

  /// Discard the cached hashes for \arg absolutePath, e.g. after the file
  /// changed.
  void invalidate(StringRef absolutePath);

  void invalidateAll();
};

}
}

#endif
