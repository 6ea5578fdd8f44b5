//===- SandboxHandle.h ------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_SANDBOXHANDLE_H
#define SANDLANE_SANDBOX_SANDBOXHANDLE_H

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/Hashing.h"
#include "sandlane/Basic/LLVM.h"
#include "sandlane/Sandbox/FileSet.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sandlane {
namespace sandbox {

/// The lifecycle state of a sandbox.
///
///   Empty -> Materializing -> Ready -> Executing -> Completed
///
/// Any state may move to Discarded on explicit teardown, on materialization
/// failure, or on retention expiry. Only a Ready sandbox may begin executing.
enum class SandboxState : uint8_t {
  Empty = 0,
  Materializing,
  Ready,
  Executing,
  Completed,
  Discarded,
};

StringRef getSandboxStateName(SandboxState state);

/// What happens to a sandbox once its process has completed.
enum class RetentionPolicy : uint8_t {
  /// Always remove the sandbox.
  Never = 0,

  /// Keep the sandbox of a failed process for inspection.
  OnFailure,

  /// Keep every sandbox.
  Always,
};

StringRef getRetentionPolicyName(RetentionPolicy policy);

/// Parse `never`, `on-failure` or `always`.
Optional<RetentionPolicy> parseRetentionPolicy(StringRef name);

/// Check whether a sandbox is retained under \p policy.
bool shouldRetain(RetentionPolicy policy, bool succeeded);

/// One materialized entry, as reported back to the execution layer.
struct MaterializedFile {
  std::string path;
  InputEntry::Kind kind;

  /// The digest of the written contents (or of the link target); null for
  /// directories.
  basic::Digest digest;

  uint64_t size;
  bool isExecutable;
};

/// Identifies a sandbox directory prepared for one process execution.
struct SandboxHandle {
  std::string id;

  /// The absolute path of the sandbox directory.
  std::string path;

  /// The fingerprint of the materialized file set.
  basic::Digest fingerprint;

  /// The materialized entries, sorted by path.
  std::vector<MaterializedFile> files;

  /// Whether the materialization was a no-op on an already Ready sandbox.
  bool reused = false;
};

}

namespace basic {

template<>
struct BinaryCodingTraits<sandbox::MaterializedFile> {
  typedef sandbox::MaterializedFile T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.path);
    coder.write(uint8_t(value.kind));
    coder.write(value.digest);
    coder.write(value.size);
    coder.write(value.isExecutable);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    uint8_t kind;
    coder.read(value.path);
    coder.read(kind);
    value.kind = sandbox::InputEntry::Kind(kind);
    coder.read(value.digest);
    coder.read(value.size);
    coder.read(value.isExecutable);
  }
};

template<>
struct BinaryCodingTraits<sandbox::SandboxHandle> {
  typedef sandbox::SandboxHandle T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.id);
    coder.write(value.path);
    coder.write(value.fingerprint);
    coder.write(value.files);
    coder.write(value.reused);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.id);
    coder.read(value.path);
    coder.read(value.fingerprint);
    coder.read(value.files);
    coder.read(value.reused);
  }
};

}
}

#endif
