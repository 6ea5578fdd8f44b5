//===-- SandboxHandle.cpp -------------------------------------------------===//
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

#include "sandlane/Sandbox/SandboxHandle.h"

using namespace sandlane;
using namespace sandlane::sandbox;

StringRef sandbox::getSandboxStateName(SandboxState state) {
  switch (state) {
  case SandboxState::Empty: return "empty";
  case SandboxState::Materializing: return "materializing";
  case SandboxState::Ready: return "ready";
  case SandboxState::Executing: return "executing";
  case SandboxState::Completed: return "completed";
  case SandboxState::Discarded: return "discarded";
  }
  return "unknown";
}

StringRef sandbox::getRetentionPolicyName(RetentionPolicy policy) {
  switch (policy) {
  case RetentionPolicy::Never: return "never";
  case RetentionPolicy::OnFailure: return "on-failure";
  case RetentionPolicy::Always: return "always";
  }
  return "unknown";
}

Optional<RetentionPolicy> sandbox::parseRetentionPolicy(StringRef name) {
  if (name == "never")
    return RetentionPolicy::Never;
  if (name == "on-failure" || name == "on_failure")
    return RetentionPolicy::OnFailure;
  if (name == "always")
    return RetentionPolicy::Always;
  return None;
}

bool sandbox::shouldRetain(RetentionPolicy policy, bool succeeded) {
  switch (policy) {
  case RetentionPolicy::Never: return false;
  case RetentionPolicy::OnFailure: return !succeeded;
  case RetentionPolicy::Always: return true;
  }
  return false;
}
