//===-- AdmissionController.cpp -------------------------------------------===//
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

#include "sandlane/Admission/AdmissionController.h"

#include "sandlane/Admission/AdmissionError.h"

#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace sandlane;
using namespace sandlane::admission;

namespace {

class AdmissionControllerImpl {
  struct PendingRequest {
    AdmissionTicket ticket;
    ConcurrencyRequirement requirement;
    GrantHandler handler;
  };

  /// A grant or cancellation to deliver once the lock is dropped.
  typedef std::pair<GrantHandler, Optional<ExecutionSlot>> Notification;

  const unsigned totalUnits;

  /// The mutex protecting all of the state below.
  mutable std::mutex mutex;

  unsigned freeUnits;

  /// Whether an exclusive slot is running.
  bool exclusiveActive = false;

  /// The running slots, by id.
  std::unordered_map<uint64_t, ExecutionSlot> running;

  /// The queue of blocked submissions, in submission order.
  std::deque<PendingRequest> pending;

  /// The next identifier to vend; tickets and slot ids share the space.
  uint64_t nextID = 1;

  /// Reserve units for \p requirement if it fits right now.
  ///
  /// The mutex must be held.
  Optional<ExecutionSlot> tryGrant(const ConcurrencyRequirement& requirement) {
    if (exclusiveActive)
      return None;

    unsigned units;
    if (requirement.isExclusive()) {
      if (!running.empty())
        return None;
      units = totalUnits;
    } else {
      units = requirement.getGrantableUnits(freeUnits, totalUnits);
      if (units == 0)
        return None;
    }

    freeUnits -= units;
    if (requirement.isExclusive())
      exclusiveActive = true;

    ExecutionSlot slot{ nextID++, requirement, units };
    running.emplace(slot.id, slot);
    return slot;
  }

  /// Walk the pending queue in order, granting each head request which fits.
  ///
  /// The mutex must be held.
  void reconsiderPending(std::vector<Notification>& notifications) {
    while (!pending.empty()) {
      auto slot = tryGrant(pending.front().requirement);
      if (!slot.hasValue())
        break;
      notifications.emplace_back(std::move(pending.front().handler), slot);
      pending.pop_front();
    }
  }

  static void deliver(std::vector<Notification>& notifications) {
    for (auto& notification: notifications) {
      if (notification.first)
        notification.first(notification.second);
    }
  }

public:
  explicit AdmissionControllerImpl(unsigned totalUnits)
      : totalUnits(totalUnits), freeUnits(totalUnits) {}

  ~AdmissionControllerImpl() {
    cancelAll();
  }

  Expected<Admission> submit(const ConcurrencyRequirement& requirement,
                             GrantHandler onGrant) {
    if (!requirement.isValid()) {
      return makeAdmissionError(AdmissionErrorCode::InvalidRequirement,
                                "malformed concurrency requirement '" +
                                Twine(requirement.str()) + "'");
    }
    if (totalUnits == 0 || !requirement.isSatisfiable(totalUnits)) {
      return makeAdmissionError(AdmissionErrorCode::Unsatisfiable,
                                "concurrency requirement '" +
                                Twine(requirement.str()) + "' needs more than "
                                "the " + Twine(totalUnits) +
                                " available units");
    }

    std::lock_guard<std::mutex> guard(mutex);

    // Never overtake a queued submission.
    if (pending.empty()) {
      auto slot = tryGrant(requirement);
      if (slot.hasValue())
        return Admission::makeGranted(slot.getValue());
    }

    AdmissionTicket ticket = nextID++;
    pending.push_back(PendingRequest{ ticket, requirement, std::move(onGrant) });
    return Admission::makePending(ticket);
  }

  Expected<ExecutionSlot> acquire(const ConcurrencyRequirement& requirement) {
    auto promise = std::make_shared<std::promise<Optional<ExecutionSlot>>>();
    auto future = promise->get_future();

    auto admission = submit(requirement, [promise](Optional<ExecutionSlot> slot) {
        promise->set_value(slot);
      });
    if (!admission)
      return admission.takeError();
    if (admission->isGranted())
      return admission->getSlot();

    auto slot = future.get();
    if (!slot.hasValue()) {
      return makeAdmissionError(AdmissionErrorCode::Cancelled,
                                "admission of '" + Twine(requirement.str()) +
                                "' was cancelled");
    }
    return slot.getValue();
  }

  bool release(const ExecutionSlot& slot) {
    std::vector<Notification> notifications;
    {
      std::lock_guard<std::mutex> guard(mutex);
      auto it = running.find(slot.id);
      if (it == running.end())
        return false;

      freeUnits += it->second.grantedUnits;
      if (it->second.requirement.isExclusive())
        exclusiveActive = false;
      running.erase(it);

      reconsiderPending(notifications);
    }
    deliver(notifications);
    return true;
  }

  bool cancel(AdmissionTicket ticket) {
    std::vector<Notification> notifications;
    {
      std::lock_guard<std::mutex> guard(mutex);
      auto it = pending.begin();
      for (; it != pending.end(); ++it) {
        if (it->ticket == ticket)
          break;
      }
      if (it == pending.end())
        return false;

      notifications.emplace_back(std::move(it->handler), None);
      pending.erase(it);

      // Removing a blocked head may let the requests behind it through.
      reconsiderPending(notifications);
    }
    deliver(notifications);
    return true;
  }

  unsigned cancelAll() {
    std::vector<Notification> notifications;
    {
      std::lock_guard<std::mutex> guard(mutex);
      for (auto& request: pending)
        notifications.emplace_back(std::move(request.handler), None);
      pending.clear();
    }
    deliver(notifications);
    return unsigned(notifications.size());
  }

  unsigned getTotalUnits() const { return totalUnits; }

  unsigned getFreeUnits() const {
    std::lock_guard<std::mutex> guard(mutex);
    return freeUnits;
  }

  unsigned getRunningCount() const {
    std::lock_guard<std::mutex> guard(mutex);
    return unsigned(running.size());
  }

  unsigned getPendingCount() const {
    std::lock_guard<std::mutex> guard(mutex);
    return unsigned(pending.size());
  }
};

}

#pragma mark - AdmissionController

AdmissionController::AdmissionController(unsigned totalUnits)
    : impl(new AdmissionControllerImpl(totalUnits)) {}

AdmissionController::~AdmissionController() {
  delete static_cast<AdmissionControllerImpl*>(impl);
}

Expected<Admission>
AdmissionController::submit(const ConcurrencyRequirement& requirement,
                            GrantHandler onGrant) {
  return static_cast<AdmissionControllerImpl*>(impl)->submit(
      requirement, std::move(onGrant));
}

Expected<ExecutionSlot>
AdmissionController::acquire(const ConcurrencyRequirement& requirement) {
  return static_cast<AdmissionControllerImpl*>(impl)->acquire(requirement);
}

bool AdmissionController::release(const ExecutionSlot& slot) {
  return static_cast<AdmissionControllerImpl*>(impl)->release(slot);
}

bool AdmissionController::cancel(AdmissionTicket ticket) {
  return static_cast<AdmissionControllerImpl*>(impl)->cancel(ticket);
}

unsigned AdmissionController::cancelAll() {
  return static_cast<AdmissionControllerImpl*>(impl)->cancelAll();
}

unsigned AdmissionController::getTotalUnits() const {
  return static_cast<AdmissionControllerImpl*>(impl)->getTotalUnits();
}

unsigned AdmissionController::getFreeUnits() const {
  return static_cast<AdmissionControllerImpl*>(impl)->getFreeUnits();
}

unsigned AdmissionController::getRunningCount() const {
  return static_cast<AdmissionControllerImpl*>(impl)->getRunningCount();
}

unsigned AdmissionController::getPendingCount() const {
  return static_cast<AdmissionControllerImpl*>(impl)->getPendingCount();
}
