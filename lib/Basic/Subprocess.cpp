//===-- Subprocess.cpp ----------------------------------------------------===//
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

#include "sandlane/Basic/Subprocess.h"

#include "sandlane/Basic/PlatformUtility.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef __GLIBC_PREREQ
#define __GLIBC_PREREQ(maj, min) 0
#endif

static int posix_spawn_file_actions_addchdir_polyfill(
    posix_spawn_file_actions_t * __restrict file_actions,
    const char * __restrict path) {
#if (defined(__GLIBC__) && !__GLIBC_PREREQ(2, 29)) || defined(__OpenBSD__) || (defined(__ANDROID__) && __ANDROID_API__ < 34)
  // Older C libraries do not provide posix_spawn_file_actions_addchdir_np.
  return ENOSYS;
#elif defined(__GLIBC__) || defined(__APPLE__) || defined(__FreeBSD__) || defined(__ANDROID__) || defined(__musl__)
  return posix_spawn_file_actions_addchdir_np(file_actions, path);
#else
  // POSIX.1-2024 spelling.
  return posix_spawn_file_actions_addchdir(file_actions, path);
#endif
}

using namespace sandlane;
using namespace sandlane::basic;

ProcessDelegate::~ProcessDelegate() {
}

ProcessGroup::~ProcessGroup() {
  // Wait for all processes in the process group to terminate
  std::unique_lock<std::mutex> lock(mutex);
  while (!processes.empty()) {
    processesCondition.wait(lock);
  }
}

void ProcessGroup::signalAll(int signal) {
  std::lock_guard<std::mutex> lock(mutex);

  for (const auto& it: processes) {
    // If we are interrupting, only interupt processes which are believed to
    // be safe to interrupt.
    if (signal == SIGINT && !it.second.canSafelyInterrupt)
      continue;

    // We are killing the whole process group here, this depends on us
    // spawning each process in its own group earlier.
    ::kill(-it.first, signal);
  }
}

StringRef basic::getProcessStatusName(ProcessStatus status) {
  switch (status) {
  case ProcessStatus::Succeeded: return "succeeded";
  case ProcessStatus::Failed: return "failed";
  case ProcessStatus::Cancelled: return "cancelled";
  case ProcessStatus::TimedOut: return "timed-out";
  }
  return "unknown";
}

namespace {

/// Remember to automatically close the descriptor when it goes out of scope.
/// This helps to keep the file descriptor alive until forwarded to the process.
/// After that we don't need to keep it around.
class ManagedDescriptor {
  using fdTraits = sys::FileDescriptorTraits<>;

public:
  using FileDescriptor = fdTraits::DescriptorType;

private:
  FileDescriptor _descriptor = fdTraits::InvalidDescriptor;

public:
  ManagedDescriptor() {}

  /// Must not ever copy to avoid double-closure.
  ManagedDescriptor(const ManagedDescriptor &) SANDLANE_DELETED_FUNCTION;
  void operator=(const ManagedDescriptor &) SANDLANE_DELETED_FUNCTION;

  ~ManagedDescriptor() { close(); }

  /// Copy the underlying descriptor out.
  FileDescriptor unsafeDescriptor() const {
    return _descriptor;
  }

  /// Whether descriptor has been initialized to a valid value and not closed.
  bool isValid() const {
    return fdTraits::IsValid(_descriptor);
  }

  /// Replace the existing descriptor with a given one,
  /// invalidating the passed descriptor.
  ManagedDescriptor &reset(FileDescriptor &fd) {
    close();
    _descriptor = fd;
    fd = fdTraits::InvalidDescriptor;
    return *this;
  }

  /// Explicitly close the descriptor.
  bool close() {
    if (!isValid()) {
      return false;
    }

    auto fd = _descriptor;
    _descriptor = fdTraits::InvalidDescriptor;
    fdTraits::Close(fd);
    return true;
  }
};

/// Kills a process group if it outlives its deadline.
class TimeoutWatchdog {
  std::mutex mutex;
  std::condition_variable cv;
  bool finished = false;
  std::atomic<bool> fired{false};
  std::thread thread;

public:
  TimeoutWatchdog(sys::ProcessID pid, uint64_t timeoutMs) {
    if (timeoutMs == 0)
      return;
    thread = std::thread([this, pid, timeoutMs] {
      std::unique_lock<std::mutex> lock(mutex);
      auto deadline = std::chrono::steady_clock::now() +
        std::chrono::milliseconds(timeoutMs);
      if (cv.wait_until(lock, deadline, [this] { return finished; }))
        return;
      fired = true;
      ::kill(-pid, SIGKILL);
    });
  }

  ~TimeoutWatchdog() { stop(); }

  /// Stop the watchdog; must be called before the process is reaped so the
  /// process group id can not be recycled underneath us.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      finished = true;
    }
    cv.notify_all();
    if (thread.joinable())
      thread.join();
  }

  bool didFire() const { return fired; }
};

}

// Read the merged output until every writer has closed the pipe.
static void captureExecutedProcessOutput(ProcessDelegate& delegate,
                                         ManagedDescriptor& outputPipe,
                                         ProcessHandle handle,
                                         ProcessContext* ctx) {
  pollfd readfd = { outputPipe.unsafeDescriptor(), POLLIN, 0 };
  while (true) {
    int pollResult = poll(&readfd, 1, -1);
    if (pollResult == -1) {
      int err = errno;
      if (err == EAGAIN || err == EINTR)
        continue;
      delegate.processHadError(ctx, handle,
                               Twine("failed to poll (") + sys::strerror(err) +
                               ")");
      break;
    }

    char buf[4096];
    ssize_t numBytes =
        sys::FileDescriptorTraits<>::Read(outputPipe.unsafeDescriptor(), buf,
                                          sizeof(buf));
    if (numBytes < 0) {
      int err = errno;
      if (err == EINTR)
        continue;
      delegate.processHadError(ctx, handle,
                               Twine("unable to read process output (") +
                                   sys::strerror(err) + ")");
      break;
    }

    if (numBytes == 0)
      break;

    // Notify the client of the output.
    delegate.processHadOutput(ctx, handle, StringRef(buf, numBytes));
  }
  // We have receieved the zero byte read that indicates an EOF.
  outputPipe.close();
}

// Wait for the process to exit and report its result.
static void cleanUpExecutedProcess(ProcessDelegate& delegate,
                                   ProcessGroup& pgrp, sys::ProcessID pid,
                                   ProcessHandle handle, ProcessContext* ctx,
                                   TimeoutWatchdog& watchdog,
                                   ProcessCompletionFn&& completionFn) {
  // Wait for the command to complete, without reaping it yet.
  siginfo_t info;
  int waitResult = waitid(P_PID, pid, &info, WEXITED | WNOWAIT);
  while (waitResult == -1 && errno == EINTR)
    waitResult = waitid(P_PID, pid, &info, WEXITED | WNOWAIT);

  // The process is now a zombie, its id can not be reused until reaped.
  watchdog.stop();

  struct rusage usage;
  int status = 0, result = wait4(pid, &status, 0, &usage);
  while (result == -1 && errno == EINTR)
    result = wait4(pid, &status, 0, &usage);

  // Update the set of spawned processes.
  pgrp.remove(pid);

  if (result == -1) {
    auto processResult = ProcessResult::makeFailed();
    delegate.processHadError(ctx, handle,
                             Twine("unable to wait for process (") +
                                 sys::strerror(errno) + ")");
    delegate.processFinished(ctx, handle, processResult);
    completionFn(processResult);
    return;
  }

  // We report additional info with the result
  //   - user time, in µs
  //   - sys time, in µs
  //   - memory usage, in bytes
  uint64_t utime = (uint64_t(usage.ru_utime.tv_sec) * 1000000 +
                    uint64_t(usage.ru_utime.tv_usec));
  uint64_t stime = (uint64_t(usage.ru_stime.tv_sec) * 1000000 +
                    uint64_t(usage.ru_stime.tv_usec));
#if defined(__APPLE__)
  uint64_t maxrss = usage.ru_maxrss;
#else
  uint64_t maxrss = uint64_t(usage.ru_maxrss) * 1024;
#endif

  int exitCode = -1, signal = 0;
  if (WIFEXITED(status)) {
    exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    signal = WTERMSIG(status);
    exitCode = 128 + signal;
  }

  ProcessStatus processStatus;
  if (watchdog.didFire()) {
    processStatus = ProcessStatus::TimedOut;
  } else if (signal == SIGINT || signal == SIGKILL) {
    processStatus = ProcessStatus::Cancelled;
  } else {
    processStatus = (exitCode == 0) ? ProcessStatus::Succeeded
                                    : ProcessStatus::Failed;
  }
  ProcessResult processResult(processStatus, exitCode, signal, pid, utime,
                              stime, maxrss);
  delegate.processFinished(ctx, handle, processResult);
  completionFn(processResult);
}

void basic::spawnProcess(
    ProcessDelegate& delegate,
    ProcessContext* ctx,
    ProcessGroup& pgrp,
    ProcessHandle handle,
    ArrayRef<StringRef> commandLine,
    POSIXEnvironment environment,
    ProcessAttributes attr,
    ProcessCompletionFn&& completionFn
) {
  sys::ProcessID pid = (sys::ProcessID)-1;

  if (commandLine.size() == 0) {
    auto result = ProcessResult::makeFailed();
    delegate.processStarted(ctx, handle, pid);
    delegate.processHadError(ctx, handle, Twine("no arguments for command"));
    delegate.processFinished(ctx, handle, result);
    completionFn(result);
    return;
  }

  // Form the complete C string command line.
  std::vector<std::string> argsStorage(commandLine.begin(), commandLine.end());
  std::vector<const char*> args(argsStorage.size() + 1);
  for (size_t i = 0; i != argsStorage.size(); ++i) {
    args[i] = argsStorage[i].c_str();
  }
  args[argsStorage.size()] = nullptr;

  // Initialize the spawn attributes.
  posix_spawnattr_t attributes;
  posix_spawnattr_init(&attributes);

  // Unmask all signals.
  sigset_t noSignals;
  sigemptyset(&noSignals);
  posix_spawnattr_setsigmask(&attributes, &noSignals);

  // Reset all signals to default behavior.
  //
  // On Linux, this can only be used to reset signals that are legal to
  // modify, so we have to take care about the set we use.
#if defined(__linux__)
  sigset_t mostSignals;
  sigemptyset(&mostSignals);
  for (int i = 1; i < SIGSYS; ++i) {
    if (i == SIGKILL || i == SIGSTOP) continue;
    sigaddset(&mostSignals, i);
  }
  posix_spawnattr_setsigdefault(&attributes, &mostSignals);
#else
  sigset_t mostSignals;
  sigfillset(&mostSignals);
  sigdelset(&mostSignals, SIGKILL);
  sigdelset(&mostSignals, SIGSTOP);
  posix_spawnattr_setsigdefault(&attributes, &mostSignals);
#endif

  // Establish a separate process group.
  posix_spawnattr_setpgroup(&attributes, 0);
  posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGMASK |
                                        POSIX_SPAWN_SETSIGDEF |
                                        POSIX_SPAWN_SETPGROUP);

  // Setup the file actions.
  posix_spawn_file_actions_t fileActions;
  posix_spawn_file_actions_init(&fileActions);

  const auto workingDir = attr.workingDir.str();
  bool workingDirectoryUnsupported = false;
  if (!workingDir.empty() &&
      posix_spawn_file_actions_addchdir_polyfill(&fileActions,
                                                 workingDir.c_str()) != 0) {
    workingDirectoryUnsupported = true;
  }

  // Open /dev/null as stdin.
  posix_spawn_file_actions_addopen(&fileActions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);

  // The parent end of the output pipe is retained and read by the parent.
  ManagedDescriptor outputPipeParentEnd;

  // Export a task ID to subprocesses.
  environment.setIfMissing("SANDLANE_TASK_ID", Twine::utohexstr(handle.id).str());

  // Resolve the executable path, if necessary.
  if (!llvm::sys::path::is_absolute(argsStorage[0]) &&
      argsStorage[0].find('/') == std::string::npos) {
    auto res = llvm::sys::findProgramByName(argsStorage[0]);
    if (!res.getError()) {
      argsStorage[0] = *res;
      args[0] = argsStorage[0].c_str();
    }
  }

  // Spawn the command.
  bool wasCancelled;
  do {
    // We need to hold the spawn processes lock when we spawn, to ensure that
    // we don't create a process in between when we are cancelled.
    std::lock_guard<std::mutex> guard(pgrp.mutex);
    wasCancelled = pgrp.isClosed();

    // If we have been cancelled since we started, skip startup.
    if (wasCancelled) { break; }

    ManagedDescriptor outputPipeChildEnd;
    int outputPipe[2]{ -1, -1 };
    if (sys::pipe(outputPipe) < 0) {
      int err = errno;
      posix_spawn_file_actions_destroy(&fileActions);
      posix_spawnattr_destroy(&attributes);
      auto result = ProcessResult::makeFailed();
      delegate.processStarted(ctx, handle, pid);
      delegate.processHadError(ctx, handle,
                               Twine("unable to open output pipe (") +
                                   sys::strerror(err) + ")");
      delegate.processFinished(ctx, handle, result);
      completionFn(result);
      return;
    }
    outputPipeParentEnd.reset(outputPipe[0]);
    outputPipeChildEnd.reset(outputPipe[1]);

    // Open the write end of the pipe as stdout and stderr.
    posix_spawn_file_actions_adddup2(&fileActions,
                                     outputPipeChildEnd.unsafeDescriptor(),
                                     STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&fileActions,
                                     outputPipeChildEnd.unsafeDescriptor(),
                                     STDERR_FILENO);

    int result = workingDirectoryUnsupported ? ENOSYS : 0;
    if (result == 0) {
      result =
          posix_spawn(&pid, args[0], /*file_actions=*/&fileActions,
                      /*attrp=*/&attributes, const_cast<char**>(args.data()),
                      const_cast<char* const*>(environment.getEnvp()));
    }

    delegate.processStarted(ctx, handle, result == 0 ? pid : -1);
    if (result != 0) {
      auto processResult = ProcessResult::makeFailed();
      delegate.processHadError(
          ctx, handle,
          workingDirectoryUnsupported
              ? Twine("working-directory unsupported on this platform")
              : Twine("unable to spawn process '") + argsStorage[0] + "' (" +
                    sys::strerror(result) + ")");
      delegate.processFinished(ctx, handle, processResult);
      pid = (sys::ProcessID)-1;
    } else {
      ProcessInfo info{ attr.canSafelyInterrupt };
      pgrp.add(std::move(guard), pid, info);
    }

    // Close the child end of the forwarded output pipe.
    outputPipeChildEnd.close();
  } while(false);

  posix_spawn_file_actions_destroy(&fileActions);
  posix_spawnattr_destroy(&attributes);

  // If we failed to launch a process, clean up and abort.
  if (pid == (sys::ProcessID)-1) {
    outputPipeParentEnd.close();
    auto result = wasCancelled ? ProcessResult::makeCancelled()
                               : ProcessResult::makeFailed();
    if (wasCancelled) {
      delegate.processStarted(ctx, handle, pid);
      delegate.processFinished(ctx, handle, result);
    }
    completionFn(result);
    return;
  }

  TimeoutWatchdog watchdog(pid, attr.timeoutMs);
  captureExecutedProcessOutput(delegate, outputPipeParentEnd, handle, ctx);
  cleanUpExecutedProcess(delegate, pgrp, pid, handle, ctx, watchdog,
                         std::move(completionFn));
}
