//===- SandboxError.h -------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_SANDBOXERROR_H
#define SANDLANE_SANDBOX_SANDBOXERROR_H

#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>

namespace sandlane {
namespace sandbox {

enum class SandboxErrorCode : uint32_t {
  /// A sandbox id or entry path is malformed or escapes the sandbox.
  InvalidPath = 1,

  /// Writing, copying or linking a sandbox entry failed.
  IOFailure,

  /// The operation is not legal in the sandbox's current state.
  InvalidState,

  /// The sandboxer is enabled but can not be reached.
  SidecarUnavailable,

  /// A malformed or unexpected message was exchanged with the sandboxer.
  ProtocolError,
};

StringRef getSandboxErrorCodeName(SandboxErrorCode code);

/// Error payload for failures of the sandbox materializer and its sidecar.
class SandboxError : public llvm::ErrorInfo<SandboxError> {
  SandboxErrorCode code;
  std::string message;

public:
  static char ID;

  SandboxError(SandboxErrorCode code, const Twine& message)
      : code(code), message(message.str()) {}

  SandboxErrorCode getCode() const { return code; }
  const std::string& getMessage() const { return message; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

inline Error makeSandboxError(SandboxErrorCode code, const Twine& message) {
  return llvm::make_error<SandboxError>(code, message);
}

}
}

#endif
