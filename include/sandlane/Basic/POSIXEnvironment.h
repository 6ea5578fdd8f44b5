//===- POSIXEnvironment.h ---------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_BASIC_POSIXENVIRONMENT_H
#define SANDLANE_BASIC_POSIXENVIRONMENT_H

#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"

#include <cassert>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandlane {
namespace basic {

/// A helper class for constructing a POSIX-style environment.
///
/// Spawned processes receive exactly the assignments made here; nothing is
/// inherited from the parent implicitly.
class POSIXEnvironment {
  /// The actual environment, this is only populated once frozen.
  std::vector<const char*> env;

  /// The underlying string storage, one `KEY=VALUE` entry per key.
  std::vector<std::string> envStorage;

  /// The index of each known key in \see envStorage.
  std::unordered_map<std::string, size_t> keys;

  /// Whether the environment pointer has been vended, and assignments can no
  /// longer be mutated.
  bool isFrozen = false;

  static std::string makeAssignment(StringRef key, StringRef value) {
    llvm::SmallString<256> assignment;
    assignment += key;
    assignment += '=';
    assignment += value;
    return assignment.str().str();
  }

public:
  POSIXEnvironment() {}

  /// Add a key to the environment, if missing.
  ///
  /// If the key has already been defined, it will **NOT** be inserted.
  void setIfMissing(StringRef key, StringRef value) {
    assert(!isFrozen);
    if (keys.emplace(key.str(), envStorage.size()).second)
      envStorage.emplace_back(makeAssignment(key, value));
  }

  /// Add a key to the environment, replacing any previous definition.
  void set(StringRef key, StringRef value) {
    assert(!isFrozen);
    auto it = keys.find(key.str());
    if (it == keys.end()) {
      setIfMissing(key, value);
      return;
    }
    envStorage[it->second] = makeAssignment(key, value);
  }

  /// Get a POSIX style envirnonment pointer.
  ///
  /// This pointer is only valid for the lifetime of the environment itself.
  const char* const* getEnvp() {
    isFrozen = true;

    // Form the final environment.
    env.clear();
    for (const auto& entry : envStorage) {
      env.emplace_back(entry.c_str());
    }
    env.emplace_back(nullptr);
    return env.data();
  }
};

}
}

#endif
