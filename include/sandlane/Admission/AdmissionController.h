//===- AdmissionController.h ------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_ADMISSION_ADMISSIONCONTROLLER_H
#define SANDLANE_ADMISSION_ADMISSIONCONTROLLER_H

#include "sandlane/Admission/ConcurrencyRequirement.h"
#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <functional>

namespace sandlane {
namespace admission {

/// The runtime record of one admitted process.
struct ExecutionSlot {
  /// The identifier used to release the slot.
  uint64_t id;

  /// The requirement the slot was granted for.
  ConcurrencyRequirement requirement;

  /// The concrete number of units reserved for the process.
  unsigned grantedUnits;
};

/// Identifies a pending submission, for cancellation.
typedef uint64_t AdmissionTicket;

/// Called exactly once for each submission which was queued: with the granted
/// slot, or with None if the submission was cancelled.
///
/// Handlers are invoked without any controller lock held, on the thread which
/// released capacity (or cancelled), and may call back into the controller.
typedef std::function<void(Optional<ExecutionSlot>)> GrantHandler;

/// The outcome of a successful (not rejected) submission.
class Admission {
  Optional<ExecutionSlot> slot;
  AdmissionTicket ticket = 0;

public:
  static Admission makeGranted(ExecutionSlot slot) {
    Admission result;
    result.slot = slot;
    return result;
  }
  static Admission makePending(AdmissionTicket ticket) {
    Admission result;
    result.ticket = ticket;
    return result;
  }

  bool isGranted() const { return slot.hasValue(); }
  bool isPending() const { return !isGranted(); }

  /// Get the slot of an immediately granted submission.
  const ExecutionSlot& getSlot() const { return slot.getValue(); }

  /// Get the ticket of a queued submission.
  AdmissionTicket getTicket() const { return ticket; }
};

/// Gates concurrent process execution on declared concurrency requirements.
///
/// The controller owns a fixed pool of resource units. Submissions which fit
/// are granted immediately. Submissions which do not fit yet are queued, and
/// the queue is reconsidered in strict submission order whenever capacity is
/// returned: the walk grants each head request which now fits and stops at the
/// first which does not. A new submission never overtakes queued ones.
///
/// Requirements the pool can never satisfy are rejected with
/// \see AdmissionErrorCode::Unsatisfiable instead of being queued.
///
/// All methods are thread-safe.
class AdmissionController {
  void *impl;

  // DO NOT COPY
  AdmissionController(const AdmissionController&) SANDLANE_DELETED_FUNCTION;
  void operator=(const AdmissionController&) SANDLANE_DELETED_FUNCTION;

public:
  /// \param totalUnits The size of the pool, at least one.
  explicit AdmissionController(unsigned totalUnits);

  /// Destroy the controller, cancelling all pending submissions.
  ~AdmissionController();

  /// Submit a process for admission.
  ///
  /// \param onGrant Invoked later if (and only if) the submission is queued.
  /// \returns The immediate grant or the pending ticket, or an
  /// AdmissionError if the requirement is rejected.
  Expected<Admission> submit(const ConcurrencyRequirement& requirement,
                             GrantHandler onGrant);

  /// Submit a process for admission and wait until it is granted.
  ///
  /// \returns The slot, or an AdmissionError if the requirement is rejected or
  /// the submission is cancelled while waiting.
  Expected<ExecutionSlot> acquire(const ConcurrencyRequirement& requirement);

  /// Return the units of a granted slot to the pool, and reconsider the
  /// pending queue.
  ///
  /// \returns False if the slot is not currently running.
  bool release(const ExecutionSlot& slot);

  /// Remove a pending submission; its handler is invoked with None.
  ///
  /// \returns False if the ticket is not pending (already granted, already
  /// cancelled, or unknown).
  bool cancel(AdmissionTicket ticket);

  /// Cancel every pending submission.
  ///
  /// \returns The number of submissions cancelled.
  unsigned cancelAll();

  unsigned getTotalUnits() const;
  unsigned getFreeUnits() const;
  unsigned getRunningCount() const;
  unsigned getPendingCount() const;
};

}
}

#endif
