//===- Materializer.h -------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_MATERIALIZER_H
#define SANDLANE_SANDBOX_MATERIALIZER_H

#include "sandlane/Basic/LLVM.h"
#include "sandlane/Sandbox/SandboxProvider.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <string>

namespace sandlane {
namespace basic {
  class FileSystem;
  class Logger;
}

namespace sandbox {

class RetentionDB;

struct MaterializerOptions {
  /// The directory holding one subdirectory per sandbox.
  std::string root;

  /// What to do with sandboxes whose process has completed.
  RetentionPolicy retention = RetentionPolicy::Never;

  /// How long a retained sandbox is kept, in seconds.
  uint64_t retentionSeconds = 86400;

  /// The clock used to stamp retained sandboxes, in seconds since the epoch.
  /// Defaults to the system clock.
  std::function<uint64_t()> clock;
};

/// Writes process inputs into per-process sandbox directories.
///
/// The materializer is the only component which opens sandbox files for
/// writing. Every file is written to a temporary name, closed, given its
/// permissions and renamed into place, so a Ready sandbox never contains a
/// file still open for writing.
///
/// A failure while writing moves the sandbox to Discarded and removes its
/// directory; nothing is retried.
class Materializer : public SandboxProvider {
  void *impl;

public:
  /// \param fs The file system to write through, which must outlive the
  /// materializer.
  /// \param logger The diagnostic sink, which must outlive the materializer.
  /// \param db The record of retained sandboxes, which must outlive the
  /// materializer.
  Materializer(basic::FileSystem& fs, basic::Logger& logger, RetentionDB& db,
               MaterializerOptions options);
  ~Materializer() override;

  const std::string& getRoot() const;

  /// Get the absolute path a sandbox id is materialized at.
  std::string getSandboxPath(StringRef id) const;

  /// Get the current state of a sandbox; unknown ids are Empty.
  ///
  /// A sandbox which reaches Discarded is forgotten, so its id reads as
  /// Empty afterwards.
  SandboxState getState(StringRef id) const;

  /// Get the number of sandbox ids currently tracked.
  size_t getRecordCount() const;

  /// Adopt the sandboxes recorded in the retention database (by a previous
  /// run) as Completed, forgetting records whose directory has vanished.
  ///
  /// \returns The number of sandboxes adopted.
  Expected<unsigned> restoreRetained();

  /// @name SandboxProvider API
  /// @{

  Expected<SandboxHandle> materialize(StringRef id,
                                      const FileSet& files) override;
  Error beginExecution(StringRef id) override;
  Expected<SandboxState> completeExecution(StringRef id,
                                           bool succeeded) override;
  Error discard(StringRef id) override;
  Expected<unsigned> expireRetained(uint64_t now) override;

  /// @}
};

}
}

#endif
