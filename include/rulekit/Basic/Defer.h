//===- Defer.h --------------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_BASIC_DEFER_H
#define RULEKIT_BASIC_DEFER_H

#include <utility>
#include <type_traits>

namespace rulekit {
namespace basic {

template <typename T>
class ScopeDefer {
  T deferredWork;
  bool active = true;
  void operator=(ScopeDefer&) = delete;
public:
  ScopeDefer(T&& work) : deferredWork(std::move(work)) { }
  ScopeDefer(ScopeDefer&& other)
      : deferredWork(std::move(other.deferredWork)), active(other.active) {
    other.active = false;
  }
  ~ScopeDefer() { if (active) deferredWork(); }

  /// Drop the deferred work without running it.
  void dismiss() { active = false; }
};

template <typename T>
ScopeDefer<typename std::decay<T>::type> makeScopeDefer(T&& work) {
  return ScopeDefer<typename std::decay<T>::type>(std::forward<T>(work));
}

namespace impl {
  struct ScopeDeferTask {};
  template<typename T>
  ScopeDefer<typename std::decay<T>::type> operator+(ScopeDeferTask, T&& work) {
    return ScopeDefer<typename std::decay<T>::type>(std::forward<T>(work));
  }
}

}
}

// These generate a unique variable name for each use of defer in the
// translation unit.
#define RULEKIT_DEFER_VAR_NAME(C) _defer_##C
#define RULEKIT_DEFER_INTERMEDIATE(C) RULEKIT_DEFER_VAR_NAME(C)
#define RULEKIT_DEFER_UNIQUE_VAR_NAME RULEKIT_DEFER_INTERMEDIATE(__COUNTER__)

/// Runs the following function/lambda body when the current scope exits.
/// Typical use looks like:
///
///   rulekit_defer {
///     deferred work
///   };
///
#define rulekit_defer \
  auto RULEKIT_DEFER_UNIQUE_VAR_NAME = \
      rulekit::basic::impl::ScopeDeferTask() + [&]()

#endif
