//===- ShutdownSignalAwaiter.h ----------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef SANDLANE_BASIC_SHUTDOWNSIGNALAWAITER_H
#define SANDLANE_BASIC_SHUTDOWNSIGNALAWAITER_H

#include "sandlane/Basic/Compiler.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace sandlane {
namespace basic {

/// Watches for SIGINT and SIGTERM for as long as it is alive.
///
/// The signal handler only writes to a pipe; the handler function runs on a
/// dedicated thread, so it may do anything. Only one awaiter may exist at a
/// time.
class ShutdownSignalAwaiter {
  ShutdownSignalAwaiter(const ShutdownSignalAwaiter&) SANDLANE_DELETED_FUNCTION;
  void operator=(const ShutdownSignalAwaiter&) SANDLANE_DELETED_FUNCTION;

  void (*previousInterruptHandler)(int);
  void (*previousTerminateHandler)(int);
  static int signalWatchingPipe[2];
  static std::atomic<int> pendingSignal;
  std::thread handlerThread;
  std::function<void(int)> handler;

  std::mutex receivedMutex;
  std::condition_variable receivedCondition;
  int receivedSignal = 0;

  /// Called when a signal is received, wakes up the handler thread.
  static void signalHandler(int signal);

  /// Blocking function that waits for indications that signals have arrived
  /// and process them.
  void waitForSignal();

public:
  /// Start watching for signals.
  ///
  /// \param handler If given, called with the signal number whenever a
  /// signal arrives.
  explicit ShutdownSignalAwaiter(std::function<void(int)> handler = {});

  /// Stops watching for signals and restores the previous handlers.
  ~ShutdownSignalAwaiter();

  /// Wait until a signal has arrived, or \p timeoutMs milliseconds have
  /// passed; zero waits forever.
  ///
  /// \returns The first signal received, or zero on timeout.
  int wait(uint64_t timeoutMs = 0);
};

}
}

#endif
