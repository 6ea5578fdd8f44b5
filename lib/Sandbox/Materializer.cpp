//===-- Materializer.cpp --------------------------------------------------===//
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

#include "sandlane/Sandbox/Materializer.h"

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Hashing.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Sandbox/RetentionDB.h"
#include "sandlane/Sandbox/SandboxError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;

SandboxProvider::~SandboxProvider() {}

namespace {

/// The state of one sandbox id.
struct SandboxRecord {
  /// Serializes all operations on the sandbox.
  std::mutex mutex;

  SandboxState state = SandboxState::Empty;

  /// The handle of the last successful materialization.
  SandboxHandle handle;

  /// Whether the record has been dropped from the map; a retired record is
  /// never used again.
  bool retired = false;
};

class MaterializerImpl {
  FileSystem& fs;
  Logger& logger;
  RetentionDB& db;
  MaterializerOptions options;

  /// The mutex protecting the record map (but not the records).
  mutable std::mutex recordsMutex;

  /// The live records; discarded sandboxes are removed.
  std::unordered_map<std::string, std::shared_ptr<SandboxRecord>> records;

  uint64_t now() const {
    if (options.clock)
      return options.clock();
    return uint64_t(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
  }

  std::shared_ptr<SandboxRecord> getRecord(StringRef id) {
    std::lock_guard<std::mutex> guard(recordsMutex);
    auto& record = records[id.str()];
    if (!record)
      record = std::make_shared<SandboxRecord>();
    return record;
  }

  std::shared_ptr<SandboxRecord> findRecord(StringRef id) const {
    std::lock_guard<std::mutex> guard(recordsMutex);
    auto it = records.find(id.str());
    if (it == records.end())
      return nullptr;
    return it->second;
  }

  /// Get the record for an id, creating it if needed, and lock it.
  std::shared_ptr<SandboxRecord>
  lockRecord(StringRef id, std::unique_lock<std::mutex>& lock) {
    while (true) {
      auto record = getRecord(id);
      std::unique_lock<std::mutex> candidate(record->mutex);
      if (record->retired)
        continue;
      lock = std::move(candidate);
      return record;
    }
  }

  /// Find and lock the record for an id, if it exists.
  std::shared_ptr<SandboxRecord>
  lockExistingRecord(StringRef id, std::unique_lock<std::mutex>& lock) const {
    while (true) {
      auto record = findRecord(id);
      if (!record)
        return nullptr;
      std::unique_lock<std::mutex> candidate(record->mutex);
      if (record->retired)
        continue;
      lock = std::move(candidate);
      return record;
    }
  }

  /// Move a locked record to Discarded and drop it from the map.
  void retireRecord(StringRef id, SandboxRecord& record) {
    record.state = SandboxState::Discarded;
    record.handle = SandboxHandle();
    record.retired = true;

    std::lock_guard<std::mutex> guard(recordsMutex);
    auto it = records.find(id.str());
    if (it != records.end() && it->second.get() == &record)
      records.erase(it);
  }

  Error checkID(StringRef id) const {
    if (!isValidSandboxID(id)) {
      return makeSandboxError(SandboxErrorCode::InvalidPath,
                              "invalid sandbox id '" + id + "'");
    }
    return Error::success();
  }

  /// Remove a sandbox directory, if present.
  Error removeDirectory(StringRef id, const std::string& path) {
    if (fs.getLinkInfo(path).isMissing())
      return Error::success();
    if (!fs.remove(path)) {
      return makeSandboxError(SandboxErrorCode::IOFailure,
                              "unable to remove sandbox '" + id + "' at '" +
                              path + "'");
    }
    return Error::success();
  }

  void forgetRetention(StringRef id) {
    std::string error;
    if (!db.removeRecord(id, &error))
      logger.warning("unable to forget retained sandbox '" + id + "': " +
                     error);
  }

  /// Fail a materialization: tear down whatever was written.
  Error failMaterialization(SandboxRecord& record, StringRef id,
                            const std::string& path, const Twine& message) {
    retireRecord(id, record);
    if (!fs.remove(path) && !fs.getLinkInfo(path).isMissing())
      logger.warning("unable to remove failed sandbox '" + id + "' at '" +
                     path + "'");
    logger.error("materializing sandbox '" + id + "': " + message);
    return makeSandboxError(SandboxErrorCode::IOFailure,
                            "materializing sandbox '" + id + "': " + message);
  }

  /// Create the parent directory of an entry.
  std::error_code createParents(const std::string& entryPath) {
    StringRef parent = llvm::sys::path::parent_path(entryPath);
    if (parent.empty())
      return std::error_code();
    return fs.createDirectories(parent.str());
  }

  /// Write one entry, filling in its report.
  ///
  /// \returns An error message, or an empty string on success.
  std::string writeEntry(const std::string& sandboxPath,
                         const InputEntry& entry, MaterializedFile& file) {
    SmallString<256> fullPath(sandboxPath);
    llvm::sys::path::append(fullPath, entry.getPath());
    std::string target = fullPath.str().str();

    file.path = entry.getPath();
    file.kind = entry.getKind();
    file.isExecutable = entry.isExecutable();
    file.size = 0;

    std::error_code ec;
    if (entry.getKind() == InputEntry::Kind::Directory) {
      ec = fs.createDirectories(target);
    } else {
      ec = createParents(target);
    }
    if (ec)
      return "unable to create directory for '" + entry.getPath() + "': " +
        ec.message();

    switch (entry.getKind()) {
    case InputEntry::Kind::Content:
      ec = fs.writeFileContents(target, entry.getContents(),
                                entry.isExecutable());
      if (ec)
        break;
      file.digest = Digest::ofData(entry.getContents());
      file.size = entry.getContents().size();
      break;

    case InputEntry::Kind::Copy: {
      ec = fs.copyFile(entry.getSourcePath(), target, entry.isExecutable());
      if (ec)
        break;
      // Report what actually landed in the sandbox.
      auto digest = Digest::ofFile(target);
      if (!digest) {
        ec = digest.getError();
        break;
      }
      file.digest = *digest;
      file.size = fs.getFileInfo(target).size;
      break;
    }

    case InputEntry::Kind::Symlink:
      ec = fs.createSymlink(entry.getTarget(), target);
      if (ec)
        break;
      file.digest = Digest::ofData(entry.getTarget());
      file.size = entry.getTarget().size();
      break;

    case InputEntry::Kind::Directory:
      break;
    }

    if (ec)
      return "unable to write " +
        getInputEntryKindName(entry.getKind()).str() + " entry '" +
        entry.getPath() + "': " + ec.message();
    return std::string();
  }

public:
  MaterializerImpl(FileSystem& fs, Logger& logger, RetentionDB& db,
                   MaterializerOptions options)
      : fs(fs), logger(logger), db(db), options(std::move(options)) {}

  const std::string& getRoot() const { return options.root; }

  std::string getSandboxPath(StringRef id) const {
    SmallString<256> path(options.root);
    llvm::sys::path::append(path, id);
    return path.str().str();
  }

  SandboxState getState(StringRef id) const {
    std::unique_lock<std::mutex> lock;
    auto record = lockExistingRecord(id, lock);
    if (!record)
      return SandboxState::Empty;
    return record->state;
  }

  size_t getRecordCount() const {
    std::lock_guard<std::mutex> guard(recordsMutex);
    return records.size();
  }

  Expected<unsigned> restoreRetained() {
    std::vector<RetentionRecord> retained;
    std::string error;
    if (!db.getRecords(&retained, &error))
      return makeSandboxError(SandboxErrorCode::IOFailure, error);

    unsigned count = 0;
    for (const auto& entry: retained) {
      if (!isValidSandboxID(entry.id) ||
          !fs.getFileInfo(getSandboxPath(entry.id)).isDirectory()) {
        forgetRetention(entry.id);
        continue;
      }

      std::unique_lock<std::mutex> lock;
      auto record = lockRecord(entry.id, lock);
      if (record->state != SandboxState::Empty)
        continue;
      record->state = SandboxState::Completed;
      record->handle.id = entry.id;
      record->handle.path = getSandboxPath(entry.id);
      record->handle.fingerprint = entry.fingerprint;
      ++count;
    }
    if (count)
      logger.note("restored " + Twine(count) + " retained sandbox(es)");
    return count;
  }

  Expected<SandboxHandle> materialize(StringRef id, const FileSet& files) {
    if (auto err = checkID(id))
      return std::move(err);

    FileSet normalized = files;
    if (auto err = normalized.normalize())
      return std::move(err);

    std::unique_lock<std::mutex> lock;
    auto recordRef = lockRecord(id, lock);
    auto& record = *recordRef;
    std::string path = getSandboxPath(id);

    if (record.state == SandboxState::Executing) {
      return makeSandboxError(SandboxErrorCode::InvalidState,
                              "sandbox '" + id + "' is executing");
    }

    auto fingerprint = normalized.computeFingerprint();
    if (!fingerprint) {
      std::string message = llvm::toString(fingerprint.takeError());
      return failMaterialization(record, id, path, message);
    }

    // An identical file set in a Ready sandbox is left untouched.
    if (record.state == SandboxState::Ready &&
        record.handle.fingerprint == *fingerprint &&
        fs.getFileInfo(path).isDirectory()) {
      logger.debug("sandbox '" + id + "' is up to date");
      SandboxHandle handle = record.handle;
      handle.reused = true;
      return handle;
    }

    record.state = SandboxState::Materializing;
    if (auto err = removeDirectory(id, path)) {
      std::string message = llvm::toString(std::move(err));
      return failMaterialization(record, id, path, message);
    }
    forgetRetention(id);

    if (auto ec = fs.createDirectories(path)) {
      return failMaterialization(record, id, path,
                                 "unable to create sandbox directory: " +
                                 ec.message());
    }

    SandboxHandle handle;
    handle.id = id.str();
    handle.path = path;
    handle.fingerprint = *fingerprint;
    handle.files.reserve(normalized.size());
    for (const auto& entry: normalized.getEntries()) {
      MaterializedFile file;
      std::string message = writeEntry(path, entry, file);
      if (!message.empty())
        return failMaterialization(record, id, path, message);
      handle.files.push_back(std::move(file));
    }

    record.state = SandboxState::Ready;
    record.handle = handle;
    logger.debug("materialized sandbox '" + id + "' (" +
                 Twine(unsigned(handle.files.size())) + " entries, " +
                 handle.fingerprint.str() + ")");
    return handle;
  }

  Error beginExecution(StringRef id) {
    if (auto err = checkID(id))
      return err;

    std::unique_lock<std::mutex> lock;
    auto record = lockExistingRecord(id, lock);
    if (!record) {
      return makeSandboxError(SandboxErrorCode::InvalidState,
                              "unknown sandbox '" + id + "'");
    }

    if (record->state != SandboxState::Ready) {
      return makeSandboxError(SandboxErrorCode::InvalidState,
                              "sandbox '" + id + "' is " +
                              getSandboxStateName(record->state) +
                              ", not ready");
    }
    record->state = SandboxState::Executing;
    return Error::success();
  }

  Expected<SandboxState> completeExecution(StringRef id, bool succeeded) {
    if (auto err = checkID(id))
      return std::move(err);

    std::unique_lock<std::mutex> lock;
    auto record = lockExistingRecord(id, lock);
    if (!record) {
      return makeSandboxError(SandboxErrorCode::InvalidState,
                              "unknown sandbox '" + id + "'");
    }

    if (record->state != SandboxState::Executing) {
      return makeSandboxError(SandboxErrorCode::InvalidState,
                              "sandbox '" + id + "' is " +
                              getSandboxStateName(record->state) +
                              ", not executing");
    }
    record->state = SandboxState::Completed;

    if (shouldRetain(options.retention, succeeded)) {
      RetentionRecord retained{ id.str(), record->handle.path,
                                record->handle.fingerprint, succeeded, now() };
      std::string error;
      if (!db.recordRetained(retained, &error)) {
        logger.warning("unable to record retained sandbox '" + id + "': " +
                       error);
      }
      logger.note("retaining sandbox '" + id + "' at '" +
                  record->handle.path + "'");
      return SandboxState::Completed;
    }

    std::string path = getSandboxPath(id);
    retireRecord(id, *record);
    if (auto err = removeDirectory(id, path))
      return std::move(err);
    return SandboxState::Discarded;
  }

  Error discard(StringRef id) {
    if (auto err = checkID(id))
      return err;

    std::unique_lock<std::mutex> lock;
    auto record = lockRecord(id, lock);
    retireRecord(id, *record);
    forgetRetention(id);
    return removeDirectory(id, getSandboxPath(id));
  }

  Expected<unsigned> expireRetained(uint64_t now) {
    uint64_t cutoff = now > options.retentionSeconds ?
      now - options.retentionSeconds : 0;

    std::vector<RetentionRecord> expired;
    std::string error;
    if (!db.getRecordsRetainedBefore(cutoff, &expired, &error))
      return makeSandboxError(SandboxErrorCode::IOFailure, error);

    unsigned count = 0;
    for (const auto& entry: expired) {
      if (!isValidSandboxID(entry.id)) {
        forgetRetention(entry.id);
        continue;
      }

      std::unique_lock<std::mutex> lock;
      auto record = lockRecord(entry.id, lock);
      forgetRetention(entry.id);

      // The id has been materialized again since it was retained.
      if (record->state != SandboxState::Completed &&
          record->state != SandboxState::Empty)
        continue;

      retireRecord(entry.id, *record);
      if (auto err = removeDirectory(entry.id, getSandboxPath(entry.id))) {
        logger.warning(llvm::toString(std::move(err)));
        continue;
      }
      logger.debug("expired retained sandbox '" + entry.id + "'");
      ++count;
    }
    return count;
  }
};

}

Materializer::Materializer(FileSystem& fs, Logger& logger, RetentionDB& db,
                           MaterializerOptions options)
    : impl(new MaterializerImpl(fs, logger, db, std::move(options))) {}

Materializer::~Materializer() {
  delete static_cast<MaterializerImpl*>(impl);
}

const std::string& Materializer::getRoot() const {
  return static_cast<MaterializerImpl*>(impl)->getRoot();
}

std::string Materializer::getSandboxPath(StringRef id) const {
  return static_cast<MaterializerImpl*>(impl)->getSandboxPath(id);
}

SandboxState Materializer::getState(StringRef id) const {
  return static_cast<MaterializerImpl*>(impl)->getState(id);
}

size_t Materializer::getRecordCount() const {
  return static_cast<MaterializerImpl*>(impl)->getRecordCount();
}

Expected<unsigned> Materializer::restoreRetained() {
  return static_cast<MaterializerImpl*>(impl)->restoreRetained();
}

Expected<SandboxHandle> Materializer::materialize(StringRef id,
                                                  const FileSet& files) {
  return static_cast<MaterializerImpl*>(impl)->materialize(id, files);
}

Error Materializer::beginExecution(StringRef id) {
  return static_cast<MaterializerImpl*>(impl)->beginExecution(id);
}

Expected<SandboxState> Materializer::completeExecution(StringRef id,
                                                       bool succeeded) {
  return static_cast<MaterializerImpl*>(impl)->completeExecution(id, succeeded);
}

Error Materializer::discard(StringRef id) {
  return static_cast<MaterializerImpl*>(impl)->discard(id);
}

Expected<unsigned> Materializer::expireRetained(uint64_t now) {
  return static_cast<MaterializerImpl*>(impl)->expireRetained(now);
}
