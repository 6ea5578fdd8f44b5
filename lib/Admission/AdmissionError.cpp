//===-- AdmissionError.cpp ------------------------------------------------===//
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

#include "sandlane/Admission/AdmissionError.h"

#include "llvm/Support/raw_ostream.h"

using namespace sandlane;
using namespace sandlane::admission;

char AdmissionError::ID = 0;

StringRef admission::getAdmissionErrorCodeName(AdmissionErrorCode code) {
  switch (code) {
  case AdmissionErrorCode::Unsatisfiable: return "unsatisfiable";
  case AdmissionErrorCode::Cancelled: return "cancelled";
  case AdmissionErrorCode::InvalidRequirement: return "invalid-requirement";
  }
  return "unknown";
}

void AdmissionError::log(raw_ostream& os) const {
  os << getAdmissionErrorCodeName(code) << ": " << message;
}

std::error_code AdmissionError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}
