//===- SandboxProvider.h ----------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_SANDBOXPROVIDER_H
#define SANDLANE_SANDBOX_SANDBOXPROVIDER_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"
#include "sandlane/Sandbox/FileSet.h"
#include "sandlane/Sandbox/SandboxHandle.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>

namespace sandlane {
namespace sandbox {

/// Abstract interface to whatever prepares sandboxes for execution: the
/// in-process \see Materializer, or the sandboxer sidecar through
/// \see SandboxerClient.
///
/// Operations on one sandbox id are serialized; operations on distinct ids may
/// proceed concurrently. All failures are reported as \see SandboxError.
class SandboxProvider {
  // DO NOT COPY
  SandboxProvider(const SandboxProvider&) SANDLANE_DELETED_FUNCTION;
  void operator=(const SandboxProvider&) SANDLANE_DELETED_FUNCTION;

public:
  SandboxProvider() {}
  virtual ~SandboxProvider();

  /// Write \p files into the sandbox \p id.
  ///
  /// Returns once every file is fully written and closed. Materializing the
  /// same file set into a Ready sandbox is a no-op reported with
  /// `reused = true`; a different file set replaces the sandbox contents.
  virtual Expected<SandboxHandle> materialize(StringRef id,
                                              const FileSet& files) = 0;

  /// Move a Ready sandbox to Executing.
  virtual Error beginExecution(StringRef id) = 0;

  /// Move an Executing sandbox to Completed, then apply the retention policy.
  ///
  /// \returns Completed if the sandbox was retained, Discarded if it was
  /// removed.
  virtual Expected<SandboxState> completeExecution(StringRef id,
                                                   bool succeeded) = 0;

  /// Remove the sandbox, whatever its state.
  virtual Error discard(StringRef id) = 0;

  /// Discard retained sandboxes older than the retention age at time \p now
  /// (seconds since the epoch).
  ///
  /// \returns The number of sandboxes discarded.
  virtual Expected<unsigned> expireRetained(uint64_t now) = 0;
};

}
}

#endif
