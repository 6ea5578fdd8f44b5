//===- RetentionDB.h --------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_RETENTIONDB_H
#define SANDLANE_SANDBOX_RETENTIONDB_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/Hashing.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sandlane {
namespace sandbox {

/// A sandbox kept on disk after its process completed.
struct RetentionRecord {
  std::string id;
  std::string path;
  basic::Digest fingerprint;

  /// Whether the process which used the sandbox succeeded.
  bool succeeded;

  /// When the sandbox was retained, in seconds since the epoch.
  uint64_t retainedAt;
};

/// Persistent record of retained sandboxes, so that their expiry survives a
/// restart of the process hosting the materializer.
///
/// Implementations must be thread-safe.
class RetentionDB {
  // DO NOT COPY
  RetentionDB(const RetentionDB&) SANDLANE_DELETED_FUNCTION;
  void operator=(const RetentionDB&) SANDLANE_DELETED_FUNCTION;

public:
  RetentionDB() {}
  virtual ~RetentionDB();

  /// Record (or replace) the retention of a sandbox.
  ///
  /// \param error_out [out] On failure, a message describing the problem.
  /// \returns True on success.
  virtual bool recordRetained(const RetentionRecord& record,
                              std::string* error_out) = 0;

  /// Forget the sandbox with the given id, if recorded.
  virtual bool removeRecord(StringRef id, std::string* error_out) = 0;

  /// Get every record, ordered by retention time.
  virtual bool getRecords(std::vector<RetentionRecord>* records_out,
                          std::string* error_out) = 0;

  /// Get the records retained strictly before \p cutoff.
  virtual bool getRecordsRetainedBefore(uint64_t cutoff,
                                        std::vector<RetentionRecord>* records_out,
                                        std::string* error_out) = 0;
};

/// Create a retention database backed by the SQLite file at \p path.
///
/// The database is opened lazily; a file with a different schema version is
/// recreated from scratch.
std::unique_ptr<RetentionDB> createSQLiteRetentionDB(StringRef path);

/// Create a retention database which only lives as long as the process.
std::unique_ptr<RetentionDB> createInMemoryRetentionDB();

}
}

#endif
