//===-- ShutdownSignalAwaiter.cpp -----------------------------------------===//
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

#include "sandlane/Basic/ShutdownSignalAwaiter.h"

#include "sandlane/Basic/PlatformUtility.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>

using namespace sandlane;
using namespace sandlane::basic;

int ShutdownSignalAwaiter::signalWatchingPipe[2]{-1, -1};
std::atomic<int> ShutdownSignalAwaiter::pendingSignal{0};

void ShutdownSignalAwaiter::signalHandler(int signal) {
  pendingSignal = signal;

  // Write to wake up the signal monitoring thread; nothing can be done from
  // here if that fails.
  char byte{};
  (void)sys::write(signalWatchingPipe[1], &byte, 1);
}

ShutdownSignalAwaiter::ShutdownSignalAwaiter(std::function<void(int)> handler)
    : handler(std::move(handler)) {
  if (sys::pipe(signalWatchingPipe) < 0) {
    perror("pipe");
  }

  previousInterruptHandler = std::signal(SIGINT, &signalHandler);
  previousTerminateHandler = std::signal(SIGTERM, &signalHandler);

  handlerThread = std::thread(&ShutdownSignalAwaiter::waitForSignal, this);
}

void ShutdownSignalAwaiter::waitForSignal() {
  while (true) {
    char byte;
    int res = sys::read(signalWatchingPipe[0], &byte, 1);
    if (res < 0 && errno == EINTR)
      continue;

    // If nothing was read, the pipe has been closed and we should shut down.
    if (res <= 0)
      break;

    int signal = pendingSignal.exchange(0);
    if (signal == 0)
      continue;

    {
      std::lock_guard<std::mutex> guard(receivedMutex);
      if (receivedSignal == 0)
        receivedSignal = signal;
    }
    receivedCondition.notify_all();

    if (handler)
      handler(signal);
  }
}

int ShutdownSignalAwaiter::wait(uint64_t timeoutMs) {
  std::unique_lock<std::mutex> lock(receivedMutex);
  auto received = [&] { return receivedSignal != 0; };
  if (timeoutMs == 0) {
    receivedCondition.wait(lock, received);
  } else {
    receivedCondition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                               received);
  }
  return receivedSignal;
}

ShutdownSignalAwaiter::~ShutdownSignalAwaiter() {
  // Deregister the signal handlers.
  std::signal(SIGINT, previousInterruptHandler);
  std::signal(SIGTERM, previousTerminateHandler);

  // Close the write end to stop the handler thread, and wait for it.
  sys::close(signalWatchingPipe[1]);
  signalWatchingPipe[1] = -1;
  handlerThread.join();

  sys::close(signalWatchingPipe[0]);
  signalWatchingPipe[0] = -1;
}
