//===- IsolatedEventBus.h ---------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_EXECUTION_ISOLATEDEVENTBUS_H
#define RULEKIT_EXECUTION_ISOLATEDEVENTBUS_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/Execution/BuildEvent.h"

#include "llvm/ADT/StringRef.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rulekit {
namespace execution {

/// Receiver of build events.
///
/// Listeners are called on the posting thread, possibly concurrently, and
/// must be thread-safe.
class BuildEventListener {
public:
  virtual ~BuildEventListener();

  virtual void handleEvent(const BuildEvent& event) = 0;
};

/// The event bus of one build invocation.
///
/// Events may be posted from any thread. Each event is delivered to the
/// listeners registered when it was posted; listeners may post further events
/// or (un)register listeners from within \see handleEvent().
class IsolatedEventBus {
  std::string buildId;

  std::mutex listenersMutex;
  std::vector<std::shared_ptr<BuildEventListener>> listeners;

  std::atomic<uint64_t> numPostedEvents{0};

  // Copying is disabled.
  IsolatedEventBus(const IsolatedEventBus&) RULEKIT_DELETED_FUNCTION;
  void operator=(const IsolatedEventBus&) RULEKIT_DELETED_FUNCTION;

public:
  explicit IsolatedEventBus(StringRef buildId);
  ~IsolatedEventBus();

  StringRef getBuildId() const { return buildId; }

  void registerListener(std::shared_ptr<BuildEventListener> listener);

  /// Remove \arg listener.
  ///
  /// \returns True if the listener was registered.
  bool unregisterListener(const BuildEventListener& listener);

  size_t getNumListeners();

  /// Stamp \arg event and deliver it to all listeners.
  void post(std::shared_ptr<BuildEvent> event);

  /// Post \arg event with an explicit timestamp, for replay and tests.
  void postWithTimestamp(std::shared_ptr<BuildEvent> event,
                         uint64_t timestampMicros);

  uint64_t getNumPostedEvents() const { return numPostedEvents; }
};

}
}

#endif
