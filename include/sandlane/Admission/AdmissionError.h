//===- AdmissionError.h -----------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_ADMISSION_ADMISSIONERROR_H
#define SANDLANE_ADMISSION_ADMISSIONERROR_H

#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <string>

namespace sandlane {
namespace admission {

enum class AdmissionErrorCode {
  /// The requirement can never be satisfied by the pool (a permanent
  /// rejection, never retried).
  Unsatisfiable = 1,

  /// The pending submission was cancelled before it was granted.
  Cancelled,

  /// The requirement itself is malformed (zero counts, `min > max`, or text
  /// which does not parse).
  InvalidRequirement,
};

StringRef getAdmissionErrorCodeName(AdmissionErrorCode code);

/// Error payload for failures of the admission controller.
class AdmissionError : public llvm::ErrorInfo<AdmissionError> {
  AdmissionErrorCode code;
  std::string message;

public:
  static char ID;

  AdmissionError(AdmissionErrorCode code, const Twine& message)
      : code(code), message(message.str()) {}

  AdmissionErrorCode getCode() const { return code; }
  const std::string& getMessage() const { return message; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

inline Error makeAdmissionError(AdmissionErrorCode code, const Twine& message) {
  return llvm::make_error<AdmissionError>(code, message);
}

}
}

#endif
