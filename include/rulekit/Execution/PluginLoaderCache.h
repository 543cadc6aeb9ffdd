//===- PluginLoaderCache.h --------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_PLUGINLOADERCACHE_H
#define RULEKIT_EXECUTION_PLUGINLOADERCACHE_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <mutex>

namespace rulekit {
namespace execution {

/// A reference counted cache of loaded toolchain plugin modules.
///
/// The cache is created holding one reference. Each context sharing the cache
/// takes a reference with \see addRef() and gives it back with \see close();
/// the modules are unloaded exactly once, when the last reference is closed.
class PluginLoaderCache {
  std::mutex mutex;
  unsigned refCount = 1;
  bool released = false;
  llvm::StringMap<void*> modules;

  // Copying is disabled.
  PluginLoaderCache(const PluginLoaderCache&) RULEKIT_DELETED_FUNCTION;
  void operator=(const PluginLoaderCache&) RULEKIT_DELETED_FUNCTION;

public:
  PluginLoaderCache() {}
  ~PluginLoaderCache();

  /// Take an additional reference.
  ///
  /// It is a fatal error to add a reference to a released cache.
  void addRef();

  /// Give back one reference, unloading all modules if it was the last.
  ///
  /// It is a fatal error to close more references than were taken.
  ///
  /// \returns The errors from unloading modules, if any.
  Error close();

  unsigned getRefCount();
  bool isReleased();

  /// Get the loaded module at \arg path, loading it on first use.
  Expected<void*> getOrLoad(StringRef path);

  /// Look up \arg symbol in the module at \arg path.
  Expected<void*> lookupSymbol(StringRef path, StringRef symbol);

  size_t getNumLoadedModules();
};

}
}

#endif
