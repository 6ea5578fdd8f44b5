//===- ExecutionCoordinator.h -----------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_EXECUTION_EXECUTIONCOORDINATOR_H
#define SANDLANE_EXECUTION_EXECUTIONCOORDINATOR_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"
#include "sandlane/Execution/ProcessDescription.h"

#include "llvm/Support/Error.h"

namespace sandlane {
namespace admission {
  class AdmissionController;
}
namespace basic {
  class FileSystem;
  class Logger;
}
namespace sandbox {
  class SandboxProvider;
}

namespace execution {

class ExecutionOptions;

/// Runs processes inside materialized sandboxes, under admission control.
///
/// Each execution materializes the process inputs through the sandbox
/// provider, waits for an execution slot, substitutes the granted unit count
/// into the command line, runs the process inside the sandbox and finally
/// returns the slot and the sandbox.
///
/// The coordinator is thread safe; \see execute() blocks the calling thread
/// and is expected to be called concurrently from many.
class ExecutionCoordinator {
  void *impl;

  ExecutionCoordinator(const ExecutionCoordinator&) SANDLANE_DELETED_FUNCTION;
  void operator=(const ExecutionCoordinator&) SANDLANE_DELETED_FUNCTION;

public:
  /// Create a coordinator; every collaborator must outlive it.
  ExecutionCoordinator(admission::AdmissionController& controller,
                       sandbox::SandboxProvider& provider,
                       basic::FileSystem& fs, basic::Logger& logger,
                       const ExecutionOptions& options);
  ~ExecutionCoordinator();

  /// Execute a process, blocking until it has finished.
  ///
  /// A process which ran but failed is not an error; see the result status.
  ///
  /// \returns The result, or an AdmissionError or SandboxError if the process
  /// could not be started.
  Expected<ExecutionResult> execute(const ProcessDescription& description);

  /// Cancel every pending and running execution, and any later one.
  void cancel();
};

}
}

#endif
