//===- Subprocess.h ---------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_BASIC_SUBPROCESS_H
#define SANDLANE_BASIC_SUBPROCESS_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"
#include "sandlane/Basic/POSIXEnvironment.h"
#include "sandlane/Basic/PlatformUtility.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <inttypes.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace sandlane {
  namespace basic {

    // MARK: Process Info

    /// Handle used to communicate information about a launched process.
    struct ProcessHandle {
      /// Opaque ID.
      uint64_t id;
    };

    struct ProcessInfo {
      /// Whether the process can be safely interrupted.
      bool canSafelyInterrupt;
    };


    // MARK: Process Group

    /// The set of live processes spawned on behalf of one owner, so that they
    /// can be signalled together on cancellation.
    class ProcessGroup {
      ProcessGroup(const ProcessGroup&) SANDLANE_DELETED_FUNCTION;
      void operator=(const ProcessGroup&) SANDLANE_DELETED_FUNCTION;
      ProcessGroup& operator=(ProcessGroup&&) SANDLANE_DELETED_FUNCTION;

      std::unordered_map<sys::ProcessID, ProcessInfo> processes;
      std::condition_variable processesCondition;
      bool closed = false;

    public:
      ProcessGroup() {}
      ~ProcessGroup();

      std::mutex mutex;

      /// Prevent any further process from being spawned in this group.
      void close() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
      }
      bool isClosed() const { return closed; }

      void add(std::lock_guard<std::mutex>&& lock, sys::ProcessID pid,
               ProcessInfo info) {
        processes.emplace(std::make_pair(pid, info));
      }

      void remove(sys::ProcessID pid) {
        {
          std::lock_guard<std::mutex> lock(mutex);
          processes.erase(pid);
        }
        processesCondition.notify_all();
      }

      void signalAll(int signal);
    };


    // MARK: Process Execution

    /// Status of a process execution.
    enum class ProcessStatus {
      Succeeded = 0,
      Failed,
      Cancelled,
      TimedOut,
    };

    /// Result of a process execution.
    struct ProcessResult {

      /// The final status of the command
      ProcessStatus status;

      /// Process exit code, or 128 plus the signal number if the process was
      /// terminated by a signal.
      int exitCode;

      /// The terminating signal, or zero.
      int signal;

      /// Process identifier (can be -1 for failure reasons)
      sys::ProcessID pid;

      /// User time (in us)
      uint64_t utime;

      /// System time (in us)
      uint64_t stime;

      /// Max RSS (in bytes)
      uint64_t maxrss;

      ProcessResult(ProcessStatus status, int exitCode = -1, int signal = 0,
                    sys::ProcessID pid = (sys::ProcessID)-1, uint64_t utime = 0,
                    uint64_t stime = 0, uint64_t maxrss = 0)
          : status(status), exitCode(exitCode), signal(signal), pid(pid),
            utime(utime), stime(stime), maxrss(maxrss) {}

      static ProcessResult makeFailed(int exitCode = -1) {
        return ProcessResult(ProcessStatus::Failed, exitCode);
      }

      static ProcessResult makeCancelled(int exitCode = -1) {
        return ProcessResult(ProcessStatus::Cancelled, exitCode);
      }
    };

    /// Get the lowercase name of a process status.
    StringRef getProcessStatusName(ProcessStatus status);


    typedef std::function<void(ProcessResult)> ProcessCompletionFn;


    /// Opaque context passed on to the delegate
    struct ProcessContext;

    /// Delegate interface for process execution.
    ///
    /// All delegate interfaces are invoked synchronously by the subprocess
    /// methods, on the thread which called \see spawnProcess().
    class ProcessDelegate {
      // DO NOT COPY
      ProcessDelegate(const ProcessDelegate&) SANDLANE_DELETED_FUNCTION;
      void operator=(const ProcessDelegate&) SANDLANE_DELETED_FUNCTION;
      ProcessDelegate& operator=(ProcessDelegate&& rhs) SANDLANE_DELETED_FUNCTION;

    public:
      ProcessDelegate() {}
      virtual ~ProcessDelegate();

      /// Called when the external process has started executing.
      ///
      /// The subprocess code guarantees that any processStarted() call will be
      /// paired with exactly one \see processFinished() call.
      ///
      /// \param ctx - Opaque context passed on to the delegate
      /// \param handle - A unique handle used in subsequent delegate calls to
      /// identify the process.
      /// \param pid - The process identifier, or -1 if the spawn failed.
      virtual void processStarted(ProcessContext* ctx, ProcessHandle handle,
                                  sys::ProcessID pid) = 0;

      /// Called to report an error in the management of a command process.
      virtual void processHadError(ProcessContext* ctx, ProcessHandle handle,
                                   const Twine& message) = 0;

      /// Called to report a command processes' (merged) standard output and
      /// error.
      virtual void processHadOutput(ProcessContext* ctx, ProcessHandle handle,
                                    StringRef data) = 0;

      /// Called when the process has finished executing.
      ///
      /// \param result - Whether the process suceeded, failed, timed out or
      /// was cancelled, along with its resource usage.
      virtual void processFinished(ProcessContext* ctx, ProcessHandle handle,
                                   const ProcessResult& result) = 0;
    };


    struct ProcessAttributes {
      /// If true, whether it is safe to attempt to SIGINT the process to cancel
      /// it. If false, the process won't be interrupted during cancellation and
      /// will be given a chance to complete (if it fails to complete it will
      /// ultimately be sent a SIGKILL).
      bool canSafelyInterrupt;

      /// If set, the working directory to change into before spawning.
      StringRef workingDir = {};

      /// If non-zero, the number of milliseconds after which the process group
      /// is killed and the result reported as timed out.
      uint64_t timeoutMs = 0;
    };

    /// Execute the given command line.
    ///
    /// This will launch and execute the given command line and wait for it to
    /// complete. Standard input is `/dev/null` and the merged standard output
    /// and error are reported through the delegate. The process is placed in
    /// its own process group.
    ///
    /// \param delegate The process delegate.
    ///
    /// \param ctx The context object passed to the delegate.
    ///
    /// \param pgrp The process group in which to track this process.
    ///
    /// \param handle The handle object passed to the delegate.
    ///
    /// \param commandLine The command line to execute.
    ///
    /// \param environment The environment to launch with.
    ///
    /// \param attributes Additional attributes for the process to be spawned.
    ///
    /// \param completionFn A function run following the completion of the
    /// process, after the delegate has been told.
    void spawnProcess(ProcessDelegate& delegate,
                      ProcessContext* ctx,
                      ProcessGroup& pgrp,
                      ProcessHandle handle,
                      ArrayRef<StringRef> commandLine,
                      POSIXEnvironment environment,
                      ProcessAttributes attributes,
                      ProcessCompletionFn&& completionFn);

  }
}

#endif
