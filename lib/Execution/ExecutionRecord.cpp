//===-- ExecutionRecord.cpp -----------------------------------------------===//
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

#include "sandlane/Execution/ExecutionRecord.h"

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Execution/ProcessDescription.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

using namespace sandlane;
using namespace sandlane::execution;

/// The version of the record format.
static const int64_t kRecordVersion = 1;

ExecutionRecord ExecutionRecord::make(const ProcessDescription& description,
                                      const ExecutionResult& result,
                                      uint64_t startTime) {
  ExecutionRecord record;
  record.description = description.description;
  record.sandboxID = result.sandbox.id;
  record.sandboxPath = result.sandbox.path;
  record.requirement = description.requirement.str();
  record.grantedUnits = result.grantedUnits;
  record.fingerprint = result.sandbox.fingerprint.str();
  for (const auto& file: result.sandbox.files) {
    Input input;
    input.path = file.path;
    input.kind = sandbox::getInputEntryKindName(file.kind).str();
    if (!file.digest.isNull())
      input.digest = file.digest.str();
    input.size = file.size;
    input.isExecutable = file.isExecutable;
    record.inputs.push_back(std::move(input));
  }
  for (const auto& file: result.outputs) {
    Output output;
    output.path = file.path;
    output.digest = file.digest.str();
    output.size = file.size;
    output.isExecutable = file.isExecutable;
    record.outputs.push_back(std::move(output));
  }
  record.missingOutputs = result.missingOutputs;
  record.outputsMatched = result.outputsMatched;
  record.status = basic::getProcessStatusName(result.status).str();
  record.exitCode = result.exitCode;
  record.finalState = sandbox::getSandboxStateName(result.finalState).str();
  record.startTime = startTime;
  record.durationMs = result.durationMs;
  record.utime = result.utime;
  record.stime = result.stime;
  record.maxrss = result.maxrss;
  return record;
}

llvm::json::Value ExecutionRecord::toJSON() const {
  llvm::json::Array inputsArray;
  for (const auto& input: inputs) {
    llvm::json::Object entry{
      {"path", input.path},
      {"kind", input.kind},
      {"size", int64_t(input.size)},
      {"executable", input.isExecutable},
    };
    if (!input.digest.empty())
      entry["digest"] = input.digest;
    inputsArray.push_back(std::move(entry));
  }

  llvm::json::Array outputsArray;
  for (const auto& output: outputs) {
    outputsArray.push_back(llvm::json::Object{
      {"path", output.path},
      {"digest", output.digest},
      {"size", int64_t(output.size)},
      {"executable", output.isExecutable},
    });
  }

  llvm::json::Array missingArray;
  for (const auto& missing: missingOutputs)
    missingArray.push_back(missing);

  return llvm::json::Object{
    {"version", kRecordVersion},
    {"description", description},
    {"sandbox", sandboxID},
    {"sandbox_path", sandboxPath},
    {"requirement", requirement},
    {"granted_units", int64_t(grantedUnits)},
    {"fingerprint", fingerprint},
    {"inputs", std::move(inputsArray)},
    {"outputs", std::move(outputsArray)},
    {"missing_outputs", std::move(missingArray)},
    {"outputs_matched", outputsMatched},
    {"status", status},
    {"exit_code", int64_t(exitCode)},
    {"final_state", finalState},
    {"start_time", int64_t(startTime)},
    {"duration_ms", int64_t(durationMs)},
    {"utime_us", int64_t(utime)},
    {"stime_us", int64_t(stime)},
    {"maxrss", int64_t(maxrss)},
  };
}

static Error makeRecordError(const Twine& message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "invalid execution record: " + message.str());
}

Expected<ExecutionRecord> ExecutionRecord::fromJSON(StringRef data) {
  auto value = llvm::json::parse(data);
  if (!value)
    return value.takeError();

  const auto* object = value->getAsObject();
  if (!object)
    return makeRecordError("expected an object");
  auto version = object->getInteger("version");
  if (!version || *version != kRecordVersion)
    return makeRecordError("unsupported version");

  ExecutionRecord record;
  bool ok = true;
  auto readString = [&](const llvm::json::Object& from, StringRef key,
                        std::string& out) {
    if (auto string = from.getString(key)) {
      out = string->str();
    } else {
      ok = false;
    }
  };
  auto readInteger = [&](const llvm::json::Object& from, StringRef key,
                         auto& out) {
    if (auto integer = from.getInteger(key)) {
      out = *integer;
    } else {
      ok = false;
    }
  };

  readString(*object, "description", record.description);
  readString(*object, "sandbox", record.sandboxID);
  readString(*object, "sandbox_path", record.sandboxPath);
  readString(*object, "requirement", record.requirement);
  readInteger(*object, "granted_units", record.grantedUnits);
  readString(*object, "fingerprint", record.fingerprint);
  readString(*object, "status", record.status);
  readInteger(*object, "exit_code", record.exitCode);
  readString(*object, "final_state", record.finalState);
  readInteger(*object, "start_time", record.startTime);
  readInteger(*object, "duration_ms", record.durationMs);
  readInteger(*object, "utime_us", record.utime);
  readInteger(*object, "stime_us", record.stime);
  readInteger(*object, "maxrss", record.maxrss);

  const auto* inputsArray = object->getArray("inputs");
  if (!inputsArray)
    return makeRecordError("missing inputs");
  for (const auto& element: *inputsArray) {
    const auto* entry = element.getAsObject();
    if (!entry)
      return makeRecordError("expected an input object");
    Input input;
    readString(*entry, "path", input.path);
    readString(*entry, "kind", input.kind);
    readInteger(*entry, "size", input.size);
    if (auto executable = entry->getBoolean("executable")) {
      input.isExecutable = *executable;
    } else {
      ok = false;
    }
    if (auto digest = entry->getString("digest"))
      input.digest = digest->str();
    record.inputs.push_back(std::move(input));
  }

  // Records written before outputs were captured have none.
  if (const auto* outputsArray = object->getArray("outputs")) {
    for (const auto& element: *outputsArray) {
      const auto* entry = element.getAsObject();
      if (!entry)
        return makeRecordError("expected an output object");
      Output output;
      readString(*entry, "path", output.path);
      readString(*entry, "digest", output.digest);
      readInteger(*entry, "size", output.size);
      if (auto executable = entry->getBoolean("executable")) {
        output.isExecutable = *executable;
      } else {
        ok = false;
      }
      record.outputs.push_back(std::move(output));
    }
  }
  if (const auto* missingArray = object->getArray("missing_outputs")) {
    for (const auto& element: *missingArray) {
      if (auto missing = element.getAsString()) {
        record.missingOutputs.push_back(missing->str());
      } else {
        ok = false;
      }
    }
  }
  if (auto matched = object->getBoolean("outputs_matched"))
    record.outputsMatched = *matched;

  if (!ok)
    return makeRecordError("missing or mistyped field");
  return record;
}

std::string ExecutionRecord::getFileName() const {
  return sandboxID + ".json";
}

Error ExecutionRecord::write(basic::FileSystem& fs,
                             StringRef directory) const {
  if (auto ec = fs.createDirectories(directory.str())) {
    return llvm::createStringError(ec, "unable to create records directory '" +
                                   directory.str() + "': " + ec.message());
  }

  std::string contents;
  llvm::raw_string_ostream os(contents);
  llvm::json::OStream stream(os, /*IndentSize=*/2);
  stream.value(toJSON());
  os << "\n";
  os.flush();

  SmallString<256> path(directory);
  llvm::sys::path::append(path, getFileName());
  if (auto ec = fs.writeFileContents(path.str().str(), contents,
                                     /*isExecutable=*/false)) {
    return llvm::createStringError(ec, "unable to write execution record '" +
                                   path.str().str() + "': " + ec.message());
  }
  return Error::success();
}
