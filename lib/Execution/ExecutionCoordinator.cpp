//===-- ExecutionCoordinator.cpp ------------------------------------------===//
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

#include "sandlane/Execution/ExecutionCoordinator.h"

#include "sandlane/Admission/AdmissionController.h"
#include "sandlane/Admission/AdmissionError.h"
#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Basic/POSIXEnvironment.h"
#include "sandlane/Execution/ExecutionOptions.h"
#include "sandlane/Execution/ExecutionRecord.h"
#include "sandlane/Execution/OutputCapture.h"
#include "sandlane/Sandbox/SandboxError.h"
#include "sandlane/Sandbox/SandboxProvider.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

#include <atomic>
#include <chrono>
#include <csignal>

using namespace sandlane;
using namespace sandlane::admission;
using namespace sandlane::basic;
using namespace sandlane::execution;
using namespace sandlane::sandbox;

namespace {

/// Collects what a spawned process reports.
class CapturingProcessDelegate : public ProcessDelegate {
public:
  std::string output;
  std::string errors;

  void processStarted(ProcessContext*, ProcessHandle, sys::ProcessID) override {
  }

  void processHadError(ProcessContext*, ProcessHandle,
                       const Twine& message) override {
    errors += message.str();
    errors += "\n";
  }

  void processHadOutput(ProcessContext*, ProcessHandle,
                        StringRef data) override {
    output += data;
  }

  void processFinished(ProcessContext*, ProcessHandle,
                       const ProcessResult&) override {
  }
};

class ExecutionCoordinatorImpl {
  AdmissionController& controller;
  SandboxProvider& provider;
  FileSystem& fs;
  Logger& logger;

  /// The placeholder replaced with the granted unit count.
  std::string concurrencyPlaceholder;

  /// The directory records are written to, if any.
  std::string recordsDir;

  /// The running processes.
  ProcessGroup processGroup;

  std::atomic<uint64_t> nextSandboxNumber{ 1 };
  std::atomic<uint64_t> nextProcessHandle{ 1 };

  std::string makeSandboxID() {
    return "exec-" + std::to_string(llvm::sys::Process::getProcessId()) + "-" +
      std::to_string(nextSandboxNumber++);
  }

  /// Tear down a sandbox whose execution could not proceed.
  void discardAfterFailure(StringRef id) {
    if (auto err = provider.discard(id)) {
      logger.warning("unable to discard sandbox '" + id + "': " +
                     llvm::toString(std::move(err)));
    }
  }

  static uint64_t now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
  }

public:
  ExecutionCoordinatorImpl(AdmissionController& controller,
                           SandboxProvider& provider, FileSystem& fs,
                           Logger& logger, const ExecutionOptions& options)
      : controller(controller), provider(provider), fs(fs), logger(logger),
        concurrencyPlaceholder(options.concurrencyPlaceholder),
        recordsDir(options.recordsDir) {}

  Expected<ExecutionResult> execute(const ProcessDescription& description) {
    const auto& requirement = description.requirement;
    StringRef name = description.description;
    if (name.empty() && !description.args.empty())
      name = description.args.front();

    // Reject what can never run before touching the disk.
    if (!requirement.isValid()) {
      return makeAdmissionError(AdmissionErrorCode::InvalidRequirement,
                                "invalid concurrency requirement '" +
                                Twine(requirement.str()) + "' for '" + name +
                                "'");
    }
    if (!requirement.isSatisfiable(controller.getTotalUnits())) {
      logger.error("'" + name + "' requires " + requirement.str() +
                   " but only " + Twine(controller.getTotalUnits()) +
                   " units exist");
      return makeAdmissionError(AdmissionErrorCode::Unsatisfiable,
                                "concurrency requirement '" +
                                Twine(requirement.str()) + "' of '" + name +
                                "' exceeds the " +
                                Twine(controller.getTotalUnits()) +
                                " available units");
    }
    if (description.args.empty()) {
      return llvm::createStringError(
          std::make_error_code(std::errc::invalid_argument),
          "no command line given for '" + name.str() + "'");
    }

    std::string workingDirectory;
    if (!description.workingDirectory.empty()) {
      auto normalized = normalizeEntryPath(description.workingDirectory);
      if (!normalized.hasValue()) {
        return makeSandboxError(SandboxErrorCode::InvalidPath,
                                "working directory '" +
                                description.workingDirectory +
                                "' is not inside the sandbox");
      }
      workingDirectory = normalized.getValue();
    }

    OutputDeclaration outputs = description.outputs;
    if (auto err = outputs.normalize())
      return std::move(err);

    std::string id = description.sandboxID.empty() ? makeSandboxID() :
      description.sandboxID;

    auto handle = provider.materialize(id, description.inputs);
    if (!handle)
      return handle.takeError();
    if (auto err = provider.beginExecution(id)) {
      discardAfterFailure(id);
      return std::move(err);
    }

    if (controller.getFreeUnits() <
        requirement.getUnitsNeeded(controller.getTotalUnits())) {
      logger.debug("'" + name + "' waiting for " + requirement.str());
    }
    auto slot = controller.acquire(requirement);
    if (!slot) {
      discardAfterFailure(id);
      return slot.takeError();
    }
    unsigned units = slot->grantedUnits;
    logger.debug("'" + name + "' admitted with " + Twine(units) + " units");

    std::vector<std::string> args = description.args;
    substituteConcurrencyPlaceholder(args, concurrencyPlaceholder, units);
    std::vector<StringRef> commandLine(args.begin(), args.end());

    POSIXEnvironment environment;
    for (const auto& entry: description.env)
      environment.set(entry.first, entry.second);
    environment.set(ConcurrencyEnvironmentVariable, std::to_string(units));
    if (description.inheritEnvironment) {
      for (const auto& entry: SandboxSettings::getProcessEnvironment())
        environment.setIfMissing(entry.getKey(), entry.getValue());
    }

    SmallString<256> cwd(handle->path);
    if (!workingDirectory.empty())
      llvm::sys::path::append(cwd, workingDirectory);

    ProcessAttributes attributes{ /*canSafelyInterrupt=*/true };
    attributes.workingDir = cwd;
    attributes.timeoutMs = description.timeoutMs;

    CapturingProcessDelegate delegate;
    ExecutionResult result;
    uint64_t startTime = now();
    auto start = std::chrono::steady_clock::now();
    spawnProcess(delegate, /*ctx=*/nullptr, processGroup,
                 ProcessHandle{ nextProcessHandle++ }, commandLine,
                 std::move(environment), attributes,
                 [&](ProcessResult processResult) {
                   result.status = processResult.status;
                   result.exitCode = processResult.exitCode;
                   result.utime = processResult.utime;
                   result.stime = processResult.stime;
                   result.maxrss = processResult.maxrss;
                 });
    result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    result.output = std::move(delegate.output);
    result.errors = std::move(delegate.errors);
    result.grantedUnits = units;
    result.sandbox = std::move(*handle);

    controller.release(*slot);

    // Outputs are collected while the sandbox still exists.
    if (!outputs.empty() && result.status == ProcessStatus::Succeeded) {
      auto captured = captureOutputs(fs, logger, cwd, outputs);
      if (!captured) {
        result.outputsMatched = false;
        result.errors += llvm::toString(captured.takeError()) + "\n";
      } else {
        result.outputs = std::move(captured->files);
        result.missingOutputs = std::move(captured->missing);
        if (!captured->satisfied) {
          result.outputsMatched = false;
          result.errors += captured->message + "\n";
        }
      }
    }

    if (!result.errors.empty())
      logger.error("'" + name + "': " + StringRef(result.errors).rtrim());

    auto state = provider.completeExecution(id, result.succeeded());
    if (!state)
      return state.takeError();
    result.finalState = *state;

    if (!recordsDir.empty()) {
      auto record = ExecutionRecord::make(description, result, startTime);
      if (auto err = record.write(fs, recordsDir)) {
        logger.warning("unable to record execution of '" + name + "': " +
                       llvm::toString(std::move(err)));
      }
    }

    return std::move(result);
  }

  void cancel() {
    processGroup.close();
    unsigned cancelled = controller.cancelAll();
    if (cancelled != 0)
      logger.note("cancelled " + Twine(cancelled) + " pending executions");
    processGroup.signalAll(SIGINT);
  }
};

}

ExecutionCoordinator::ExecutionCoordinator(AdmissionController& controller,
                                           SandboxProvider& provider,
                                           FileSystem& fs, Logger& logger,
                                           const ExecutionOptions& options)
    : impl(new ExecutionCoordinatorImpl(controller, provider, fs, logger,
                                        options))
{
}

ExecutionCoordinator::~ExecutionCoordinator() {
  delete static_cast<ExecutionCoordinatorImpl*>(impl);
}

Expected<ExecutionResult>
ExecutionCoordinator::execute(const ProcessDescription& description) {
  return static_cast<ExecutionCoordinatorImpl*>(impl)->execute(description);
}

void ExecutionCoordinator::cancel() {
  static_cast<ExecutionCoordinatorImpl*>(impl)->cancel();
}
