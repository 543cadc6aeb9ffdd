//===-- FileHashCache.cpp -------------------------------------------------===//
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

#include "rulekit/RuleKey/FileHashCache.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Object/Archive.h"
#include "llvm/Support/MemoryBuffer.h"

using namespace rulekit;
using namespace rulekit::rulekey;

FileHashCache::~FileHashCache() {}

static Error makeMissingError(const Twine& what) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "no content hash for " + what);
}

#pragma mark - InMemoryFileHashCache

void InMemoryFileHashCache::set(StringRef absolutePath, const HashCode& hash) {
  std::lock_guard<std::mutex> guard(mutex);
  files[absolutePath] = hash;
}

void InMemoryFileHashCache::setArchiveMember(StringRef archivePath,
                                             StringRef memberPath,
                                             const HashCode& hash) {
  std::lock_guard<std::mutex> guard(mutex);
  members[{ archivePath.str(), memberPath.str() }] = hash;
}

Expected<HashCode> InMemoryFileHashCache::get(StringRef absolutePath) {
  std::lock_guard<std::mutex> guard(mutex);
  auto it = files.find(absolutePath);
  if (it == files.end())
    return makeMissingError("'" + absolutePath + "'");
  return it->second;
}

Expected<HashCode>
InMemoryFileHashCache::getForArchiveMember(StringRef archivePath,
                                           StringRef memberPath) {
  std::lock_guard<std::mutex> guard(mutex);
  auto it = members.find({ archivePath.str(), memberPath.str() });
  if (it == members.end())
    return makeMissingError("'" + archivePath + "(" + memberPath + ")'");
  return it->second;
}

#pragma mark - DefaultFileHashCache

DefaultFileHashCache::DefaultFileHashCache(HashFunctionKind kind)
  : hashFunctionFactory(rulekey::getHashFunctionFactory(kind)) {}

DefaultFileHashCache::DefaultFileHashCache(
    HashFunctionFactory hashFunctionFactory)
  : hashFunctionFactory(std::move(hashFunctionFactory)) {}

HashCode DefaultFileHashCache::hashBytes(StringRef data) {
  auto function = hashFunctionFactory();
  function->update(llvm::arrayRefFromStringRef(data));
  return function->finish();
}

Expected<HashCode> DefaultFileHashCache::get(StringRef absolutePath) {
  {
    std::lock_guard<std::mutex> guard(mutex);
    auto it = files.find(absolutePath);
    if (it != files.end())
      return it->second;
  }

  // Hash outside the lock; a racing thread computes the same value.
  auto buffer = llvm::MemoryBuffer::getFile(absolutePath, /*IsText=*/false,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer) {
    return llvm::createStringError(buffer.getError(),
                                   "unable to read '%s': %s",
                                   absolutePath.str().c_str(),
                                   buffer.getError().message().c_str());
  }
  HashCode hash = hashBytes((*buffer)->getBuffer());

  std::lock_guard<std::mutex> guard(mutex);
  return files.insert({ absolutePath, hash }).first->second;
}

Expected<HashCode>
DefaultFileHashCache::getForArchiveMember(StringRef archivePath,
                                          StringRef memberPath) {
  auto key = std::make_pair(archivePath.str(), memberPath.str());
  {
    std::lock_guard<std::mutex> guard(mutex);
    auto it = members.find(key);
    if (it != members.end())
      return it->second;
  }

  auto buffer = llvm::MemoryBuffer::getFile(archivePath, /*IsText=*/false,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer) {
    return llvm::createStringError(buffer.getError(),
                                   "unable to read '%s': %s",
                                   archivePath.str().c_str(),
                                   buffer.getError().message().c_str());
  }

  auto archive = llvm::object::Archive::create((*buffer)->getMemBufferRef());
  if (!archive) {
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(), "unable to open archive '" +
        archivePath + "': " + llvm::toString(archive.takeError()));
  }

  Optional<HashCode> found;
  Error err = Error::success();
  for (const auto& child: (*archive)->children(err)) {
    auto name = child.getName();
    if (!name) {
      llvm::consumeError(std::move(err));
      return name.takeError();
    }
    if (*name != memberPath)
      continue;
    auto contents = child.getBuffer();
    if (!contents) {
      llvm::consumeError(std::move(err));
      return contents.takeError();
    }
    found = hashBytes(*contents);
    break;
  }
  if (err)
    return std::move(err);
  if (!found.hasValue()) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "archive '" + archivePath +
                                   "' has no member '" + memberPath + "'");
  }

  std::lock_guard<std::mutex> guard(mutex);
  return members.insert({ key, *found }).first->second;
}

void DefaultFileHashCache::invalidate(StringRef absolutePath) {
  std::lock_guard<std::mutex> guard(mutex);
  files.erase(absolutePath);
  for (auto it = members.begin(); it != members.end();) {
    if (it->first.first == absolutePath)
      it = members.erase(it);
    else
      ++it;
  }
}

void DefaultFileHashCache::invalidateAll() {
  std::lock_guard<std::mutex> guard(mutex);
  files.clear();
  members.clear();
}
