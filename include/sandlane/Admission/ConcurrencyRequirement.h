//===- ConcurrencyRequirement.h ---------------------------------*- C++ -*-===//
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
//
// This file defines the declared concurrency requirement of a process.
//
//===----------------------------------------------------------------------===//

#ifndef SANDLANE_ADMISSION_CONCURRENCYREQUIREMENT_H
#define SANDLANE_ADMISSION_CONCURRENCYREQUIREMENT_H

#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sandlane {
namespace admission {

/// The placeholder token substituted with the granted unit count when no other
/// token is configured.
extern const char* const DefaultConcurrencyPlaceholder;

/// The environment variable through which spawned processes learn their
/// granted unit count.
extern const char* const ConcurrencyEnvironmentVariable;

/// The number of resource units a process needs while it runs.
///
/// A requirement is one of:
///
///   exclusive        The process must be the only one running; it is granted
///                    every unit of the pool.
///   exactly(N)       The process needs exactly N units.
///   range(MIN,MAX)   The process accepts any unit count in [MIN, MAX], and is
///                    granted the largest one available.
///
/// The textual forms above are accepted by \see parse() and produced by
/// \see str().
class ConcurrencyRequirement {
public:
  enum class Kind : uint8_t {
    Exclusive = 0,
    Exactly,
    Range,
  };

private:
  Kind kind;
  unsigned minUnits;
  unsigned maxUnits;

  ConcurrencyRequirement(Kind kind, unsigned minUnits, unsigned maxUnits)
      : kind(kind), minUnits(minUnits), maxUnits(maxUnits) {}

public:
  /// Create a default requirement of exactly one unit.
  ConcurrencyRequirement() : ConcurrencyRequirement(Kind::Exactly, 1, 1) {}

  static ConcurrencyRequirement makeExclusive() {
    return ConcurrencyRequirement(Kind::Exclusive, 0, 0);
  }
  static ConcurrencyRequirement makeExactly(unsigned count) {
    return ConcurrencyRequirement(Kind::Exactly, count, count);
  }
  static ConcurrencyRequirement makeRange(unsigned min, unsigned max) {
    return ConcurrencyRequirement(Kind::Range, min, max);
  }

  /// Parse the textual form of a requirement.
  static Expected<ConcurrencyRequirement> parse(StringRef text);

  Kind getKind() const { return kind; }
  bool isExclusive() const { return kind == Kind::Exclusive; }
  bool isExactly() const { return kind == Kind::Exactly; }
  bool isRange() const { return kind == Kind::Range; }

  /// Get the unit count of an `exactly` requirement.
  unsigned getCount() const { return minUnits; }

  /// Get the lower bound of a `range` requirement (or the count of an
  /// `exactly` requirement).
  unsigned getMinUnits() const { return minUnits; }

  /// Get the upper bound of a `range` requirement (or the count of an
  /// `exactly` requirement).
  unsigned getMaxUnits() const { return maxUnits; }

  /// Check the requirement is well formed: counts are positive and ranges are
  /// not inverted.
  bool isValid() const;

  /// Check whether a pool of \p totalUnits could ever grant this requirement.
  bool isSatisfiable(unsigned totalUnits) const;

  /// Get the minimum number of units which must be free for a grant, on a pool
  /// of \p totalUnits.
  unsigned getUnitsNeeded(unsigned totalUnits) const;

  /// Get the number of units granted when \p freeUnits are free on a pool of
  /// \p totalUnits, or zero if the requirement does not currently fit.
  unsigned getGrantableUnits(unsigned freeUnits, unsigned totalUnits) const;

  std::string str() const;

  bool operator==(const ConcurrencyRequirement& rhs) const {
    return kind == rhs.kind && minUnits == rhs.minUnits &&
      maxUnits == rhs.maxUnits;
  }
  bool operator!=(const ConcurrencyRequirement& rhs) const {
    return !(*this == rhs);
  }
};

/// Replace every occurrence of \p token in \p args with \p units.
///
/// \returns The number of replacements made.
unsigned substituteConcurrencyPlaceholder(std::vector<std::string>& args,
                                          StringRef token, unsigned units);

}
}

#endif
