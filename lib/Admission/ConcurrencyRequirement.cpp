//===-- ConcurrencyRequirement.cpp ----------------------------------------===//
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

#include "sandlane/Admission/ConcurrencyRequirement.h"

#include "sandlane/Admission/AdmissionError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace sandlane;
using namespace sandlane::admission;

const char* const admission::DefaultConcurrencyPlaceholder =
  "{sandlane_concurrency}";
const char* const admission::ConcurrencyEnvironmentVariable =
  "SANDLANE_CONCURRENCY";

static Error makeParseError(StringRef text, const Twine& reason) {
  return makeAdmissionError(AdmissionErrorCode::InvalidRequirement,
                            "invalid concurrency requirement '" + text +
                            "': " + reason);
}

// Parse a positive unit count.
static bool parseCount(StringRef text, unsigned& result) {
  text = text.trim();
  if (text.getAsInteger(10, result))
    return false;
  return result != 0;
}

Expected<ConcurrencyRequirement>
ConcurrencyRequirement::parse(StringRef text) {
  StringRef input = text.trim();
  if (input == "exclusive")
    return makeExclusive();

  StringRef name, arguments;
  size_t open = input.find('(');
  if (open == StringRef::npos || !input.endswith(")"))
    return makeParseError(text, "expected 'exclusive', 'exactly(N)' or "
                          "'range(MIN,MAX)'");
  name = input.substr(0, open).rtrim();
  arguments = input.slice(open + 1, input.size() - 1);

  if (name == "exactly") {
    unsigned count;
    if (!parseCount(arguments, count))
      return makeParseError(text, "count must be a positive integer");
    return makeExactly(count);
  }

  if (name == "range") {
    StringRef minText, maxText;
    std::tie(minText, maxText) = arguments.split(',');
    unsigned min, max;
    if (!parseCount(minText, min) || !parseCount(maxText, max))
      return makeParseError(text, "bounds must be positive integers");
    if (min > max)
      return makeParseError(text, "minimum exceeds maximum");
    return makeRange(min, max);
  }

  return makeParseError(text, "unknown requirement kind '" + name + "'");
}

bool ConcurrencyRequirement::isValid() const {
  switch (kind) {
  case Kind::Exclusive:
    return true;
  case Kind::Exactly:
    return minUnits != 0;
  case Kind::Range:
    return minUnits != 0 && minUnits <= maxUnits;
  }
  return false;
}

bool ConcurrencyRequirement::isSatisfiable(unsigned totalUnits) const {
  if (!isValid())
    return false;
  // An exclusive process is granted whatever the pool holds.
  if (kind == Kind::Exclusive)
    return true;
  return minUnits <= totalUnits;
}

unsigned ConcurrencyRequirement::getUnitsNeeded(unsigned totalUnits) const {
  if (kind == Kind::Exclusive)
    return totalUnits;
  return minUnits;
}

unsigned
ConcurrencyRequirement::getGrantableUnits(unsigned freeUnits,
                                          unsigned totalUnits) const {
  switch (kind) {
  case Kind::Exclusive:
    // Only an idle pool can be handed over.
    return freeUnits == totalUnits ? totalUnits : 0;
  case Kind::Exactly:
    return minUnits <= freeUnits ? minUnits : 0;
  case Kind::Range:
    if (freeUnits < minUnits)
      return 0;
    return std::min(freeUnits, maxUnits);
  }
  return 0;
}

std::string ConcurrencyRequirement::str() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  switch (kind) {
  case Kind::Exclusive:
    os << "exclusive";
    break;
  case Kind::Exactly:
    os << "exactly(" << minUnits << ")";
    break;
  case Kind::Range:
    os << "range(" << minUnits << "," << maxUnits << ")";
    break;
  }
  return os.str();
}

unsigned admission::substituteConcurrencyPlaceholder(
    std::vector<std::string>& args, StringRef token, unsigned units) {
  if (token.empty())
    return 0;

  std::string replacement = llvm::utostr(units);
  unsigned count = 0;
  for (auto& arg: args) {
    size_t pos = 0;
    while ((pos = arg.find(token.data(), pos, token.size())) !=
           std::string::npos) {
      arg.replace(pos, token.size(), replacement);
      pos += replacement.size();
      ++count;
    }
  }
  return count;
}
