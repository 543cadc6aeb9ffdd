//===-- IsolatedEventBus.cpp ----------------------------------------------===//
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

#include "rulekit/Execution/IsolatedEventBus.h"

#include <algorithm>
#include <chrono>

using namespace rulekit;
using namespace rulekit::execution;

BuildEventListener::~BuildEventListener() {}

IsolatedEventBus::IsolatedEventBus(StringRef buildId) : buildId(buildId) {}

IsolatedEventBus::~IsolatedEventBus() {}

void IsolatedEventBus::registerListener(
    std::shared_ptr<BuildEventListener> listener) {
  std::lock_guard<std::mutex> guard(listenersMutex);
  listeners.push_back(std::move(listener));
}

bool IsolatedEventBus::unregisterListener(const BuildEventListener& listener) {
  std::lock_guard<std::mutex> guard(listenersMutex);
  auto it = std::find_if(listeners.begin(), listeners.end(),
                         [&](const std::shared_ptr<BuildEventListener>& l) {
                           return l.get() == &listener;
                         });
  if (it == listeners.end())
    return false;
  listeners.erase(it);
  return true;
}

size_t IsolatedEventBus::getNumListeners() {
  std::lock_guard<std::mutex> guard(listenersMutex);
  return listeners.size();
}

void IsolatedEventBus::post(std::shared_ptr<BuildEvent> event) {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  postWithTimestamp(
      std::move(event),
      std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

void IsolatedEventBus::postWithTimestamp(std::shared_ptr<BuildEvent> event,
                                         uint64_t timestampMicros) {
  event->configure(timestampMicros, buildId);
  ++numPostedEvents;

  // Dispatch outside the lock, so listeners may re-enter the bus.
  std::vector<std::shared_ptr<BuildEventListener>> snapshot;
  {
    std::lock_guard<std::mutex> guard(listenersMutex);
    snapshot = listeners;
  }
  for (const auto& listener: snapshot) {
    listener->handleEvent(*event);
  }
}
