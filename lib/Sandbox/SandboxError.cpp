//===-- SandboxError.cpp --------------------------------------------------===//
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

#include "sandlane/Sandbox/SandboxError.h"

#include "llvm/Support/raw_ostream.h"

using namespace sandlane;
using namespace sandlane::sandbox;

char SandboxError::ID = 0;

StringRef sandbox::getSandboxErrorCodeName(SandboxErrorCode code) {
  switch (code) {
  case SandboxErrorCode::InvalidPath: return "invalid-path";
  case SandboxErrorCode::IOFailure: return "io-failure";
  case SandboxErrorCode::InvalidState: return "invalid-state";
  case SandboxErrorCode::SidecarUnavailable: return "sidecar-unavailable";
  case SandboxErrorCode::ProtocolError: return "protocol-error";
  }
  return "unknown";
}

void SandboxError::log(raw_ostream& os) const {
  os << getSandboxErrorCodeName(code) << ": " << message;
}

std::error_code SandboxError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}
