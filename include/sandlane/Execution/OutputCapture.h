//===- OutputCapture.h ------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_EXECUTION_OUTPUTCAPTURE_H
#define SANDLANE_EXECUTION_OUTPUTCAPTURE_H

#include "sandlane/Basic/Hashing.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sandlane {
namespace basic {
  class FileSystem;
  class Logger;
}

namespace execution {

/// How declared outputs are checked once a process has finished.
enum class OutputsMatchMode {
  /// Every declared output must exist, or the execution fails.
  All,

  /// Warn about declared outputs which do not exist.
  AllWarn,

  /// At least one declared output must exist, or the execution fails.
  AtLeastOne,

  /// Warn if no declared output exists.
  AtLeastOneWarn,

  /// Capture whatever exists, without checking.
  AllowEmpty,
};

StringRef getOutputsMatchModeName(OutputsMatchMode mode);

/// Parse the name of a match mode, as produced by
/// \see getOutputsMatchModeName().
Optional<OutputsMatchMode> parseOutputsMatchMode(StringRef name);

/// A file captured from a sandbox after its process finished.
struct CapturedOutput {
  /// The path relative to the process working directory.
  std::string path;

  basic::Digest digest;

  uint64_t size = 0;

  bool isExecutable = false;

  bool operator==(const CapturedOutput& rhs) const {
    return path == rhs.path && digest == rhs.digest && size == rhs.size &&
      isExecutable == rhs.isExecutable;
  }
};

/// The outputs a process declared, and where to put them.
struct OutputDeclaration {
  /// Files, relative to the working directory.
  std::vector<std::string> files;

  /// Directories, relative to the working directory; every regular file below
  /// one is captured.
  std::vector<std::string> directories;

  OutputsMatchMode mode = OutputsMatchMode::AllWarn;

  /// If non-empty, captured files are copied below this directory.
  std::string destination;

  bool empty() const { return files.empty() && directories.empty(); }

  /// Normalize the declared paths in place.
  ///
  /// \returns A SandboxError (InvalidPath) if a path leaves the working
  /// directory.
  Error normalize();
};

/// What was found for a declaration.
struct OutputCaptureResult {
  /// The captured files, sorted by path.
  std::vector<CapturedOutput> files;

  /// The declared files and directories which did not exist.
  std::vector<std::string> missing;

  /// Whether the declaration was satisfied according to its mode; warning
  /// modes are always satisfied.
  bool satisfied = true;

  /// Describes the missing outputs, when the mode objected to them.
  std::string message;
};

/// Capture the declared outputs below \p workingDirectory.
///
/// Symbolic links are never followed. Missing outputs are reported through
/// \p logger as the declaration's mode asks.
///
/// \returns The capture, or an error if an existing output could not be read
/// or copied.
Expected<OutputCaptureResult>
captureOutputs(basic::FileSystem& fs, basic::Logger& logger,
               StringRef workingDirectory,
               const OutputDeclaration& declaration);

}
}

#endif
