//===- ProcessDescription.h -------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_EXECUTION_PROCESSDESCRIPTION_H
#define SANDLANE_EXECUTION_PROCESSDESCRIPTION_H

#include "sandlane/Admission/ConcurrencyRequirement.h"
#include "sandlane/Basic/Subprocess.h"
#include "sandlane/Execution/OutputCapture.h"
#include "sandlane/Sandbox/FileSet.h"
#include "sandlane/Sandbox/SandboxHandle.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sandlane {
namespace execution {

/// A process to execute inside a sandbox.
struct ProcessDescription {
  /// A short human readable description, used in logs and records.
  std::string description;

  /// The command line; occurrences of the concurrency placeholder are
  /// replaced with the granted unit count.
  std::vector<std::string> args;

  /// Environment assignments, applied in order.
  std::vector<std::pair<std::string, std::string>> env;

  /// Whether the coordinator's own environment is passed on (below \see env).
  bool inheritEnvironment = false;

  /// The working directory, relative to the sandbox root.
  std::string workingDirectory;

  admission::ConcurrencyRequirement requirement;

  /// The inputs to materialize before the process starts.
  sandbox::FileSet inputs;

  /// The outputs to capture from the sandbox once the process has finished.
  OutputDeclaration outputs;

  /// If non-zero, the process is killed after this many milliseconds.
  uint64_t timeoutMs = 0;

  /// The sandbox to use; a unique one is chosen if empty.
  std::string sandboxID;
};

/// The outcome of an execution.
struct ExecutionResult {
  basic::ProcessStatus status = basic::ProcessStatus::Failed;

  /// The exit code, or 128 plus the signal number.
  int exitCode = -1;

  /// The merged standard output and error.
  std::string output;

  /// Errors reported while managing the process (e.g. a failed spawn).
  std::string errors;

  /// The outputs captured from the sandbox.
  std::vector<CapturedOutput> outputs;

  /// The declared outputs the process did not produce.
  std::vector<std::string> missingOutputs;

  /// Whether the declared outputs satisfied their match mode.
  bool outputsMatched = true;

  /// The number of resource units the process ran with.
  unsigned grantedUnits = 0;

  /// The sandbox the process ran in.
  sandbox::SandboxHandle sandbox;

  /// The sandbox state after completion: Completed if retained, otherwise
  /// Discarded.
  sandbox::SandboxState finalState = sandbox::SandboxState::Discarded;

  /// User and system time (in us), and max RSS (in bytes).
  uint64_t utime = 0;
  uint64_t stime = 0;
  uint64_t maxrss = 0;

  /// Wall clock duration of the process, in milliseconds.
  uint64_t durationMs = 0;

  bool succeeded() const {
    return status == basic::ProcessStatus::Succeeded && outputsMatched;
  }
};

}
}

#endif
