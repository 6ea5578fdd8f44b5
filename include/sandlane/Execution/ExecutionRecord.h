//===- ExecutionRecord.h ----------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_EXECUTION_EXECUTIONRECORD_H
#define SANDLANE_EXECUTION_EXECUTIONRECORD_H

#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace llvm {
namespace json {
class Value;
}
}

namespace sandlane {
namespace basic {
  class FileSystem;
}

namespace execution {

struct ExecutionResult;
struct ProcessDescription;

/// The inspectable summary of one execution.
///
/// Records are written as one JSON document per execution, named after the
/// sandbox, into the configured records directory.
struct ExecutionRecord {
  struct Input {
    std::string path;
    std::string kind;
    std::string digest;
    uint64_t size = 0;
    bool isExecutable = false;
  };

  struct Output {
    std::string path;
    std::string digest;
    uint64_t size = 0;
    bool isExecutable = false;
  };

  std::string description;
  std::string sandboxID;
  std::string sandboxPath;
  std::string requirement;
  unsigned grantedUnits = 0;
  std::string fingerprint;
  std::vector<Input> inputs;
  std::vector<Output> outputs;
  std::vector<std::string> missingOutputs;
  bool outputsMatched = true;
  std::string status;
  int exitCode = -1;
  std::string finalState;
  uint64_t startTime = 0;
  uint64_t durationMs = 0;
  uint64_t utime = 0;
  uint64_t stime = 0;
  uint64_t maxrss = 0;

  /// Summarize a finished execution started at \p startTime (in seconds since
  /// the epoch).
  static ExecutionRecord make(const ProcessDescription& description,
                              const ExecutionResult& result,
                              uint64_t startTime);

  llvm::json::Value toJSON() const;

  /// Parse a record previously produced by \see toJSON().
  static Expected<ExecutionRecord> fromJSON(StringRef data);

  /// Get the name of the record's file within a records directory.
  std::string getFileName() const;

  /// Write the record into \p directory, creating it if needed.
  Error write(basic::FileSystem& fs, StringRef directory) const;
};

}
}

#endif
