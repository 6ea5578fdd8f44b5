//===-- RetentionDB.cpp ---------------------------------------------------===//
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

#include "sandlane/Sandbox/RetentionDB.h"

#include "sandlane/Basic/PlatformUtility.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <mutex>

#include <sqlite3.h>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;

RetentionDB::~RetentionDB() {}

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

namespace {

class SQLiteRetentionDB : public RetentionDB {
  /// Version History:
  /// * 1: Initial revision.
  static const int currentSchemaVersion = 1;

  std::string path;

  sqlite3 *db = nullptr;

  /// The mutex to protect all access to the database and statements.
  std::mutex dbMutex;

  sqlite3_stmt* insertRecordStmt = nullptr;
  sqlite3_stmt* deleteRecordStmt = nullptr;
  sqlite3_stmt* findAllRecordsStmt = nullptr;
  sqlite3_stmt* findRecordsBeforeStmt = nullptr;

  std::string getCurrentErrorMessage() {
    const char* err_message = sqlite3_errmsg(db);
    const char* filename = sqlite3_db_filename(db, "main");

    std::string out;
    llvm::raw_string_ostream outStream(out);
    outStream << "accessing retention database \""
              << (filename ? filename : path.c_str()) << "\": "
              << err_message;
    outStream.flush();
    return out;
  }

  bool open(std::string *error_out) {
    // The db is opened lazily whenever an operation on it occurs.
    if (db) return true;

    int result = sqlite3_open(path.c_str(), &db);
    if (result != SQLITE_OK) {
      *error_out = "unable to open retention database: " +
        std::string(sqlite3_errstr(result));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    sqlite3_busy_timeout(db, 5000);

    // Check the schema version, if the database already exists.
    int version = -1;
    sqlite3_stmt* stmt;
    result = sqlite3_prepare_v2(
      db, "SELECT version FROM info LIMIT 1", -1, &stmt, nullptr);
    if (result == SQLITE_OK) {
      result = sqlite3_step(stmt);
      if (result == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
      } else if (result != SQLITE_DONE) {
        *error_out = getCurrentErrorMessage();
        sqlite3_finalize(stmt);
        close();
        return false;
      }
      sqlite3_finalize(stmt);
    } else if (result != SQLITE_ERROR) {
      *error_out = getCurrentErrorMessage();
      close();
      return false;
    }

    if (version != currentSchemaVersion) {
      // Always recreate the database from scratch when the schema changes.
      close();
      if (sys::unlink(path.c_str()) == -1 && errno != ENOENT) {
        *error_out = std::string("unable to unlink existing database: ") +
          sys::strerror(errno);
        return false;
      }
      result = sqlite3_open(path.c_str(), &db);
      if (result != SQLITE_OK) {
        *error_out = getCurrentErrorMessage();
        close();
        return false;
      }
      sqlite3_busy_timeout(db, 5000);

      // Create the schema in a single transaction.
      char *cError = nullptr;
      result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr, &cError);
      if (result == SQLITE_OK) {
        result = sqlite3_exec(
          db, ("CREATE TABLE info ("
               "id INTEGER PRIMARY KEY, "
               "version INTEGER);"),
          nullptr, nullptr, &cError);
      }
      if (result == SQLITE_OK) {
        char* query = sqlite3_mprintf("INSERT INTO info VALUES (0, %d);",
                                      currentSchemaVersion);
        result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
        sqlite3_free(query);
      }
      if (result == SQLITE_OK) {
        result = sqlite3_exec(
          db, ("CREATE TABLE retained_sandboxes ("
               "id STRING PRIMARY KEY, "
               "path STRING, "
               "fingerprint BLOB, "
               "succeeded INTEGER, "
               "retained_at INTEGER);"),
          nullptr, nullptr, &cError);
      }
      if (result == SQLITE_OK) {
        result = sqlite3_exec(
          db, ("CREATE INDEX retained_at_idx ON retained_sandboxes "
               "(retained_at);"),
          nullptr, nullptr, &cError);
      }
      if (result == SQLITE_OK) {
        result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
      }
      if (result != SQLITE_OK) {
        *error_out = (std::string("unable to initialize retention database (") +
                      (cError ? cError : "unknown error") + ")");
        sqlite3_free(cError);
        close();
        return false;
      }
    }

    // Initialize prepared statements.
    result = sqlite3_prepare_v2(
      db, ("INSERT OR REPLACE INTO retained_sandboxes "
           "(id, path, fingerprint, succeeded, retained_at) "
           "VALUES (?, ?, ?, ?, ?);"),
      -1, &insertRecordStmt, nullptr);
    if (result == SQLITE_OK) {
      result = sqlite3_prepare_v2(
        db, "DELETE FROM retained_sandboxes WHERE id == ?;",
        -1, &deleteRecordStmt, nullptr);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_prepare_v2(
        db, ("SELECT id, path, fingerprint, succeeded, retained_at "
             "FROM retained_sandboxes ORDER BY retained_at, id;"),
        -1, &findAllRecordsStmt, nullptr);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_prepare_v2(
        db, ("SELECT id, path, fingerprint, succeeded, retained_at "
             "FROM retained_sandboxes WHERE retained_at < ? "
             "ORDER BY retained_at, id;"),
        -1, &findRecordsBeforeStmt, nullptr);
    }
    if (result != SQLITE_OK) {
      *error_out = getCurrentErrorMessage();
      close();
      return false;
    }

    return true;
  }

  void close() {
    sqlite3_finalize(insertRecordStmt);
    insertRecordStmt = nullptr;
    sqlite3_finalize(deleteRecordStmt);
    deleteRecordStmt = nullptr;
    sqlite3_finalize(findAllRecordsStmt);
    findAllRecordsStmt = nullptr;
    sqlite3_finalize(findRecordsBeforeStmt);
    findRecordsBeforeStmt = nullptr;

    if (db) {
      int result = sqlite3_close(db);
      (void)result; // use the variable if we're building without asserts
      assert(result == SQLITE_OK && "retention database has unfinalized statements");
      db = nullptr;
    }
  }

  /// Step a prepared query, collecting every row.
  bool collectRecords(sqlite3_stmt* stmt,
                      std::vector<RetentionRecord>* records_out,
                      std::string* error_out) {
    records_out->clear();
    while (true) {
      int result = sqlite3_step(stmt);
      if (result == SQLITE_DONE)
        break;
      if (result != SQLITE_ROW) {
        *error_out = getCurrentErrorMessage();
        sqlite3_reset(stmt);
        return false;
      }

      assert(sqlite3_column_count(stmt) == 5);
      RetentionRecord record;
      record.id = std::string(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)),
        sqlite3_column_bytes(stmt, 0));
      record.path = std::string(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)),
        sqlite3_column_bytes(stmt, 1));
      const void* blob = sqlite3_column_blob(stmt, 2);
      size_t blobSize = sqlite3_column_bytes(stmt, 2);
      if (blob && blobSize == record.fingerprint.bytes.size())
        memcpy(record.fingerprint.bytes.data(), blob, blobSize);
      record.succeeded = sqlite3_column_int(stmt, 3) != 0;
      record.retainedAt = sqlite3_column_int64(stmt, 4);
      records_out->push_back(std::move(record));
    }
    sqlite3_reset(stmt);
    return true;
  }

public:
  SQLiteRetentionDB(StringRef path) : path(path) {}

  virtual ~SQLiteRetentionDB() {
    std::lock_guard<std::mutex> guard(dbMutex);
    close();
  }

  virtual bool recordRetained(const RetentionRecord& record,
                              std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    int result;
    result = sqlite3_reset(insertRecordStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(insertRecordStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertRecordStmt, /*index=*/1,
                               record.id.data(), record.id.size(),
                               SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertRecordStmt, /*index=*/2,
                               record.path.data(), record.path.size(),
                               SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_blob(insertRecordStmt, /*index=*/3,
                               record.fingerprint.bytes.data(),
                               record.fingerprint.bytes.size(),
                               SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_int(insertRecordStmt, /*index=*/4,
                              record.succeeded ? 1 : 0);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_int64(insertRecordStmt, /*index=*/5,
                                record.retainedAt);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(insertRecordStmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      sqlite3_reset(insertRecordStmt);
      return false;
    }
    sqlite3_reset(insertRecordStmt);
    return true;
  }

  virtual bool removeRecord(StringRef id, std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    int result;
    result = sqlite3_reset(deleteRecordStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(deleteRecordStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(deleteRecordStmt, /*index=*/1,
                               id.data(), id.size(), SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(deleteRecordStmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      sqlite3_reset(deleteRecordStmt);
      return false;
    }
    sqlite3_reset(deleteRecordStmt);
    return true;
  }

  virtual bool getRecords(std::vector<RetentionRecord>* records_out,
                          std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    int result = sqlite3_reset(findAllRecordsStmt);
    checkSQLiteResultOKReturnFalse(result);
    return collectRecords(findAllRecordsStmt, records_out, error_out);
  }

  virtual bool getRecordsRetainedBefore(uint64_t cutoff,
                                        std::vector<RetentionRecord>* records_out,
                                        std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    int result;
    result = sqlite3_reset(findRecordsBeforeStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_int64(findRecordsBeforeStmt, /*index=*/1, cutoff);
    checkSQLiteResultOKReturnFalse(result);
    return collectRecords(findRecordsBeforeStmt, records_out, error_out);
  }
};

class InMemoryRetentionDB : public RetentionDB {
  std::mutex recordsMutex;
  llvm::StringMap<RetentionRecord> records;

  static bool isOlder(const RetentionRecord& a, const RetentionRecord& b) {
    if (a.retainedAt != b.retainedAt)
      return a.retainedAt < b.retainedAt;
    return a.id < b.id;
  }

public:
  virtual bool recordRetained(const RetentionRecord& record,
                              std::string*) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    records[record.id] = record;
    return true;
  }

  virtual bool removeRecord(StringRef id, std::string*) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    records.erase(id);
    return true;
  }

  virtual bool getRecords(std::vector<RetentionRecord>* records_out,
                          std::string* error_out) override {
    return getRecordsRetainedBefore(UINT64_MAX, records_out, error_out);
  }

  virtual bool getRecordsRetainedBefore(uint64_t cutoff,
                                        std::vector<RetentionRecord>* records_out,
                                        std::string*) override {
    std::lock_guard<std::mutex> guard(recordsMutex);
    records_out->clear();
    for (const auto& entry: records) {
      if (cutoff == UINT64_MAX || entry.second.retainedAt < cutoff)
        records_out->push_back(entry.second);
    }
    std::sort(records_out->begin(), records_out->end(), isOlder);
    return true;
  }
};

}

std::unique_ptr<RetentionDB> sandbox::createSQLiteRetentionDB(StringRef path) {
  return std::make_unique<SQLiteRetentionDB>(path);
}

std::unique_ptr<RetentionDB> sandbox::createInMemoryRetentionDB() {
  return std::make_unique<InMemoryRetentionDB>();
}
