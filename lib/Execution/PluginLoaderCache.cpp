//===-- PluginLoaderCache.cpp ---------------------------------------------===//
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

#include "rulekit/Execution/PluginLoaderCache.h"

#include "llvm/Support/ErrorHandling.h"

#include <dlfcn.h>

using namespace rulekit;
using namespace rulekit::execution;

static std::string getDynamicLoaderError() {
  const char* message = ::dlerror();
  return message ? message : "unknown error";
}

PluginLoaderCache::~PluginLoaderCache() {}

void PluginLoaderCache::addRef() {
  std::lock_guard<std::mutex> guard(mutex);
  if (released) {
    llvm::report_fatal_error("plugin loader cache used after release");
  }
  ++refCount;
}

Error PluginLoaderCache::close() {
  llvm::StringMap<void*> toUnload;
  {
    std::lock_guard<std::mutex> guard(mutex);
    if (refCount == 0) {
      llvm::report_fatal_error("plugin loader cache closed too many times");
    }
    if (--refCount != 0)
      return Error::success();
    released = true;
    std::swap(toUnload, modules);
  }

  Error result = Error::success();
  for (auto& entry: toUnload) {
    if (::dlclose(entry.getValue()) != 0) {
      result = llvm::joinErrors(
          std::move(result),
          llvm::createStringError(llvm::inconvertibleErrorCode(),
                                  "unable to unload plugin '" +
                                  entry.getKey() + "': " +
                                  getDynamicLoaderError()));
    }
  }
  return result;
}

unsigned PluginLoaderCache::getRefCount() {
  std::lock_guard<std::mutex> guard(mutex);
  return refCount;
}

bool PluginLoaderCache::isReleased() {
  std::lock_guard<std::mutex> guard(mutex);
  return released;
}

Expected<void*> PluginLoaderCache::getOrLoad(StringRef path) {
  std::lock_guard<std::mutex> guard(mutex);
  if (released) {
    llvm::report_fatal_error("plugin loader cache used after release");
  }

  auto it = modules.find(path);
  if (it != modules.end())
    return it->getValue();

  void* handle = ::dlopen(path.str().c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unable to load plugin '" + path + "': " +
                                   getDynamicLoaderError());
  }
  modules[path] = handle;
  return handle;
}

Expected<void*> PluginLoaderCache::lookupSymbol(StringRef path,
                                                StringRef symbol) {
  auto handle = getOrLoad(path);
  if (!handle)
    return handle.takeError();

  // Clear any stale error, since a symbol may legitimately be null.
  ::dlerror();
  void* address = ::dlsym(*handle, symbol.str().c_str());
  if (const char* message = ::dlerror()) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unable to find symbol '" + symbol +
                                   "' in plugin '" + path + "': " + message);
  }
  return address;
}

size_t PluginLoaderCache::getNumLoadedModules() {
  std::lock_guard<std::mutex> guard(mutex);
  return modules.size();
}
