//===-- sandlane-run.cpp --------------------------------------------------===//
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
#include "sandlane/Basic/FileInfo.h"
#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Basic/ShutdownSignalAwaiter.h"
#include "sandlane/Execution/ExecutionCoordinator.h"
#include "sandlane/Execution/ExecutionOptions.h"
#include "sandlane/Sandbox/Materializer.h"
#include "sandlane/Sandbox/RetentionDB.h"
#include "sandlane/Sandbox/SandboxerClient.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace sandlane;
using namespace sandlane::admission;
using namespace sandlane::basic;
using namespace sandlane::execution;
using namespace sandlane::sandbox;

static void usage(StringRef programName) {
  llvm::errs() << "Usage: " << programName
               << " [options] -- <command> [<args>]\n"
               << "\n"
               << "Run a single command inside a sandbox, under admission "
               << "control.\n"
               << "\n"
               << "Options:\n";
  const struct Options {
    llvm::StringRef option, helpText;
  } options[] = {
    { "--concurrency <REQ>",
      "declare the concurrency requirement: exclusive, exactly(N) or "
      "range(MIN,MAX)" },
    { "--input <PATH>[=<SOURCE>]",
      "copy SOURCE (default PATH) into the sandbox at PATH" },
    { "--workdir <PATH>", "run in PATH, relative to the sandbox" },
    { "--timeout <MS>", "kill the command after MS milliseconds" },
    { "--sandbox-id <ID>", "use the sandbox named ID" },
    { "--env <KEY>=<VALUE>", "set an environment variable" },
    { "--inherit-env", "pass on this process' environment" },
    { "--output-file <PATH>",
      "capture PATH, relative to the working directory" },
    { "--output-dir <PATH>", "capture every file below PATH" },
    { "--outputs-match-mode <MODE>",
      "check declared outputs: all, all_warn, at_least_one, "
      "at_least_one_warn or allow_empty" },
    { "--output-dest <DIR>", "copy captured outputs below DIR" },
  };
  for (const auto& entry: options) {
    llvm::errs() << "  "
                 << llvm::format("%-*s", 30, entry.option.str().c_str())
                 << " " << entry.helpText << "\n";
  }
  ExecutionOptions::getUsage(30, llvm::errs());
}

int main(int argc, const char **argv) {
  StringRef programName = llvm::sys::path::filename(argv[0]);
  llvm::SourceMgr sourceMgr;
  auto error = [&](const Twine& message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
  };

  // Pick out the options describing the process; the rest configure the
  // coordinator.
  ProcessDescription description;
  std::vector<std::string> optionArgs;
  bool hadErrors = false;
  for (int i = 1; i < argc; ++i) {
    StringRef option = argv[i];
    if (option == "--") {
      for (; i < argc; ++i)
        optionArgs.push_back(argv[i]);
      break;
    }

    bool takesValue = option == "--concurrency" || option == "--input" ||
      option == "--workdir" || option == "--timeout" ||
      option == "--sandbox-id" || option == "--env" ||
      option == "--output-file" || option == "--output-dir" ||
      option == "--outputs-match-mode" || option == "--output-dest";
    if (option == "--inherit-env") {
      description.inheritEnvironment = true;
      continue;
    }
    if (!takesValue) {
      optionArgs.push_back(option.str());
      continue;
    }
    if (i + 1 == argc) {
      error("missing argument to '" + option + "'");
      hadErrors = true;
      break;
    }
    StringRef value = argv[++i];

    if (option == "--concurrency") {
      auto requirement = ConcurrencyRequirement::parse(value);
      if (!requirement) {
        error(llvm::toString(requirement.takeError()));
        hadErrors = true;
        break;
      }
      description.requirement = *requirement;
    } else if (option == "--input") {
      auto paths = value.split('=');
      // The sandboxer may run in another directory.
      SmallString<256> source(paths.second.empty() ? paths.first :
                              paths.second);
      if (auto ec = llvm::sys::fs::make_absolute(source)) {
        error("unable to resolve input '" + source.str() + "': " +
              ec.message());
        hadErrors = true;
        break;
      }
      bool isExecutable =
        FileInfo::getInfoForPath(source.str().str()).isExecutable();
      description.inputs.addCopy(paths.first, source, isExecutable);
    } else if (option == "--workdir") {
      description.workingDirectory = value.str();
    } else if (option == "--timeout") {
      if (value.getAsInteger(10, description.timeoutMs)) {
        error("invalid argument '" + value + "' to '" + option + "'");
        hadErrors = true;
        break;
      }
    } else if (option == "--sandbox-id") {
      description.sandboxID = value.str();
    } else if (option == "--output-file") {
      description.outputs.files.push_back(value.str());
    } else if (option == "--output-dir") {
      description.outputs.directories.push_back(value.str());
    } else if (option == "--outputs-match-mode") {
      auto mode = parseOutputsMatchMode(value);
      if (!mode.hasValue()) {
        error("invalid argument '" + value + "' to '" + option + "'");
        hadErrors = true;
        break;
      }
      description.outputs.mode = mode.getValue();
    } else if (option == "--output-dest") {
      description.outputs.destination = value.str();
    } else {
      auto assignment = value.split('=');
      description.env.emplace_back(assignment.first.str(),
                                   assignment.second.str());
    }
  }

  ExecutionOptions options;
  options.parseEnvironment(SandboxSettings::getProcessEnvironment(),
                           sourceMgr);
  if (!hadErrors)
    options.parse(optionArgs, sourceMgr);
  if (options.showUsage) {
    usage(programName);
    return 0;
  }
  if (hadErrors || options.hadErrors) {
    usage(programName);
    return 1;
  }
  if (options.positionalArgs.empty()) {
    error("no command given");
    usage(programName);
    return 1;
  }
  description.args = options.positionalArgs;

  StreamLogger logger(programName, llvm::errs(),
                      options.verbose ? LogLevel::Debug : LogLevel::Note);
  auto fs = createLocalFileSystem();

  std::unique_ptr<RetentionDB> db;
  std::unique_ptr<SandboxProvider> provider;
  if (options.useSandboxer) {
    auto client = std::make_unique<SandboxerClient>(options.getSocketPath(),
                                                    programName, logger);
    if (auto err = client->connect()) {
      logger.error(llvm::toString(std::move(err)));
      return 1;
    }
    provider = std::move(client);
  } else {
    std::string root = options.getSandboxRoot();
    if (auto ec = fs->createDirectories(root)) {
      logger.error("unable to create sandbox root '" + root + "': " +
                   ec.message());
      return 1;
    }
    if (options.retentionDBPath.empty()) {
      db = createInMemoryRetentionDB();
    } else {
      db = createSQLiteRetentionDB(options.retentionDBPath);
    }

    MaterializerOptions materializerOptions;
    materializerOptions.root = root;
    materializerOptions.retention = options.retention;
    materializerOptions.retentionSeconds = options.retentionSeconds;
    provider = std::make_unique<Materializer>(*fs, logger, *db,
                                              materializerOptions);
  }

  AdmissionController controller(options.getTotalUnits());
  ExecutionCoordinator coordinator(controller, *provider, *fs, logger,
                                   options);
  ShutdownSignalAwaiter awaiter([&](int) { coordinator.cancel(); });

  auto result = coordinator.execute(description);
  if (!result) {
    logger.error(llvm::toString(result.takeError()));
    return 1;
  }

  llvm::outs() << result->output;
  llvm::outs().flush();
  if (result->status != ProcessStatus::Succeeded) {
    logger.error("command " + getProcessStatusName(result->status) +
                 " with exit code " + Twine(result->exitCode));
  }
  if (result->finalState == SandboxState::Completed)
    logger.note("sandbox retained at '" + result->sandbox.path + "'");
  if (result->exitCode == 0 && !result->outputsMatched)
    return 1;
  return result->exitCode < 0 ? 1 : result->exitCode;
}
