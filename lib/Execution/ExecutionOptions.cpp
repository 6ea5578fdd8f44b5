//===-- ExecutionOptions.cpp ----------------------------------------------===//
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

#include "sandlane/Execution/ExecutionOptions.h"

#include "sandlane/Admission/ConcurrencyRequirement.h"
#include "sandlane/Basic/PlatformUtility.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

extern char **environ;

using namespace sandlane;
using namespace sandlane::execution;

namespace {

const struct UsageEntry {
  llvm::StringRef option, helpText;
} sharedOptions[] = {
  { "--root <PATH>", "materialize sandboxes below PATH" },
  { "--socket <PATH>", "use the sandboxer socket at PATH" },
  { "--keep-sandboxes <MODE>",
    "retain completed sandboxes: never, on-failure or always" },
  { "--retention-seconds <N>", "expire retained sandboxes after N seconds" },
  { "--retention-db <PATH>", "record retained sandboxes in the database at PATH" },
  { "-v, --verbose", "show debug messages" },
};

void printUsageEntries(ArrayRef<UsageEntry> entries, int optionWidth,
                       raw_ostream& os) {
  for (const auto& entry: entries) {
    os << "  " << llvm::format("%-*s", optionWidth, entry.option.str().c_str())
       << " " << entry.helpText << "\n";
  }
}

/// Parse a boolean setting.
Optional<bool> parseFlag(StringRef value) {
  std::string lowered = value.trim().lower();
  if (lowered == "1" || lowered == "true" || lowered == "yes" ||
      lowered == "on")
    return true;
  if (lowered.empty() || lowered == "0" || lowered == "false" ||
      lowered == "no" || lowered == "off")
    return false;
  return None;
}

}

#pragma mark - SandboxSettings

void SandboxSettings::error(llvm::SourceMgr& sourceMgr,
                            const Twine& message) {
  sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
  hadErrors = true;
}

std::string SandboxSettings::getSandboxRoot() const {
  if (!sandboxRoot.empty())
    return sandboxRoot;

  SmallString<256> path;
  llvm::sys::path::system_temp_directory(/*ErasedOnReboot=*/true, path);
  llvm::sys::path::append(path, "sandlane");
  return path.str().str();
}

std::string SandboxSettings::getSocketPath() const {
  if (!socketPath.empty())
    return socketPath;

  SmallString<256> path(getSandboxRoot());
  llvm::sys::path::append(path, "sandboxer.sock");
  return path.str().str();
}

llvm::StringMap<std::string> SandboxSettings::getProcessEnvironment() {
  llvm::StringMap<std::string> result;
  for (char** entry = environ; entry && *entry; ++entry) {
    auto assignment = StringRef(*entry).split('=');
    result[assignment.first] = assignment.second.str();
  }
  return result;
}

void SandboxSettings::parseSharedEnvironment(
    const llvm::StringMap<std::string>& environment,
    llvm::SourceMgr& sourceMgr) {
  auto it = environment.find("SANDLANE_SANDBOX_ROOT");
  if (it != environment.end())
    sandboxRoot = it->second;

  it = environment.find("SANDLANE_SANDBOXER_SOCKET");
  if (it != environment.end())
    socketPath = it->second;

  it = environment.find("SANDLANE_KEEP_SANDBOXES");
  if (it != environment.end() && !it->second.empty()) {
    if (auto policy = sandbox::parseRetentionPolicy(it->second)) {
      retention = policy.getValue();
    } else {
      error(sourceMgr, "invalid value '" + it->second +
            "' for SANDLANE_KEEP_SANDBOXES");
    }
  }

  it = environment.find("SANDLANE_RETENTION_SECONDS");
  if (it != environment.end() && !it->second.empty()) {
    if (StringRef(it->second).trim().getAsInteger(10, retentionSeconds)) {
      error(sourceMgr, "invalid value '" + it->second +
            "' for SANDLANE_RETENTION_SECONDS");
    }
  }

  it = environment.find("SANDLANE_RETENTION_DB");
  if (it != environment.end())
    retentionDBPath = it->second;

  it = environment.find("SANDLANE_VERBOSE");
  if (it != environment.end()) {
    if (auto flag = parseFlag(it->second)) {
      verbose = flag.getValue();
    } else {
      error(sourceMgr, "invalid value '" + it->second +
            "' for SANDLANE_VERBOSE");
    }
  }
}

bool SandboxSettings::parseSharedOption(StringRef option,
                                        ArrayRef<std::string>& args,
                                        llvm::SourceMgr& sourceMgr) {
  if (option == "-v" || option == "--verbose") {
    verbose = true;
    return true;
  }

  std::string* stringValue = nullptr;
  if (option == "--root") {
    stringValue = &sandboxRoot;
  } else if (option == "--socket") {
    stringValue = &socketPath;
  } else if (option == "--retention-db") {
    stringValue = &retentionDBPath;
  } else if (option != "--keep-sandboxes" &&
             option != "--retention-seconds") {
    return false;
  }

  if (args.empty()) {
    error(sourceMgr, "missing argument to '" + option + "'");
    return true;
  }
  StringRef value = args[0];
  args = args.slice(1);

  if (stringValue) {
    *stringValue = value.str();
  } else if (option == "--keep-sandboxes") {
    if (auto policy = sandbox::parseRetentionPolicy(value)) {
      retention = policy.getValue();
    } else {
      error(sourceMgr, "invalid argument '" + value + "' to '" + option + "'");
    }
  } else {
    if (value.getAsInteger(10, retentionSeconds)) {
      error(sourceMgr, "invalid argument '" + value + "' to '" + option + "'");
    }
  }
  return true;
}

#pragma mark - ExecutionOptions

ExecutionOptions::ExecutionOptions()
    : concurrencyPlaceholder(admission::DefaultConcurrencyPlaceholder) {}

unsigned ExecutionOptions::getTotalUnits() const {
  if (jobs != 0)
    return jobs;
  return basic::sys::getNumberOfCPUs();
}

void ExecutionOptions::parseEnvironment(
    const llvm::StringMap<std::string>& environment,
    llvm::SourceMgr& sourceMgr) {
  parseSharedEnvironment(environment, sourceMgr);

  auto it = environment.find("SANDLANE_JOBS");
  if (it != environment.end() && !it->second.empty()) {
    unsigned value;
    if (StringRef(it->second).trim().getAsInteger(10, value) || value == 0) {
      error(sourceMgr, "invalid value '" + it->second +
            "' for SANDLANE_JOBS");
    } else {
      jobs = value;
    }
  }

  it = environment.find("SANDLANE_SANDBOXER");
  if (it != environment.end()) {
    if (auto flag = parseFlag(it->second)) {
      useSandboxer = flag.getValue();
    } else {
      error(sourceMgr, "invalid value '" + it->second +
            "' for SANDLANE_SANDBOXER");
    }
  }

  it = environment.find("SANDLANE_CONCURRENCY_PLACEHOLDER");
  if (it != environment.end()) {
    if (it->second.empty()) {
      error(sourceMgr, "SANDLANE_CONCURRENCY_PLACEHOLDER must not be empty");
    } else {
      concurrencyPlaceholder = it->second;
    }
  }

  it = environment.find("SANDLANE_RECORDS_DIR");
  if (it != environment.end())
    recordsDir = it->second;
}

void ExecutionOptions::getUsage(int optionWidth, raw_ostream& os) {
  const UsageEntry options[] = {
    { "--help", "show this help message and exit" },
    { "-j, --jobs <JOBS>", "set how many resource units to admit against" },
    { "--sandboxer", "materialize sandboxes through the sandboxer sidecar" },
    { "--no-sandboxer", "materialize sandboxes in-process" },
    { "--placeholder <TOKEN>",
      "replace TOKEN in arguments with the granted unit count" },
    { "--records-dir <PATH>", "write execution records to PATH" },
  };
  printUsageEntries(options, optionWidth, os);
  printUsageEntries(sharedOptions, optionWidth, os);
}

void ExecutionOptions::parse(ArrayRef<std::string> args,
                             llvm::SourceMgr& sourceMgr) {
  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (option == "--") {
      for (const auto& arg: args) {
        positionalArgs.push_back(arg);
      }
      break;
    }

    if (!option.empty() && option[0] != '-') {
      positionalArgs.push_back(option);
      continue;
    }

    if (parseSharedOption(option, args, sourceMgr)) {
      if (hadErrors)
        break;
      continue;
    }

    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--sandboxer") {
      useSandboxer = true;
    } else if (option == "--no-sandboxer") {
      useSandboxer = false;
    } else if (option == "-j" || option == "--jobs") {
      if (args.empty()) {
        error(sourceMgr, "missing argument to '" + option + "'");
        break;
      }
      unsigned value;
      if (StringRef(args[0]).getAsInteger(10, value) || value == 0) {
        error(sourceMgr, "invalid argument '" + args[0] + "' to '" + option +
              "'");
        break;
      }
      jobs = value;
      args = args.slice(1);
    } else if (StringRef(option).startswith("-j")) {
      unsigned value;
      if (StringRef(option).drop_front(2).getAsInteger(10, value) ||
          value == 0) {
        error(sourceMgr, "invalid argument to '-j'");
        break;
      }
      jobs = value;
    } else if (option == "--placeholder") {
      if (args.empty() || args[0].empty()) {
        error(sourceMgr, "missing argument to '" + option + "'");
        break;
      }
      concurrencyPlaceholder = args[0];
      args = args.slice(1);
    } else if (option == "--records-dir") {
      if (args.empty()) {
        error(sourceMgr, "missing argument to '" + option + "'");
        break;
      }
      recordsDir = args[0];
      args = args.slice(1);
    } else {
      error(sourceMgr, "invalid option '" + option + "'");
      break;
    }
  }
}

#pragma mark - SandboxerInvocation

void SandboxerInvocation::parseEnvironment(
    const llvm::StringMap<std::string>& environment,
    llvm::SourceMgr& sourceMgr) {
  parseSharedEnvironment(environment, sourceMgr);
}

void SandboxerInvocation::getUsage(int optionWidth, raw_ostream& os) {
  const UsageEntry options[] = {
    { "--help", "show this help message and exit" },
    { "--expire-interval <N>",
      "expire retained sandboxes every N seconds (0 disables)" },
  };
  printUsageEntries(options, optionWidth, os);
  printUsageEntries(sharedOptions, optionWidth, os);
}

void SandboxerInvocation::parse(ArrayRef<std::string> args,
                                llvm::SourceMgr& sourceMgr) {
  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (parseSharedOption(option, args, sourceMgr)) {
      if (hadErrors)
        break;
      continue;
    }

    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--expire-interval") {
      if (args.empty()) {
        error(sourceMgr, "missing argument to '" + option + "'");
        break;
      }
      if (StringRef(args[0]).getAsInteger(10, expireIntervalSeconds)) {
        error(sourceMgr, "invalid argument '" + args[0] + "' to '" + option +
              "'");
        break;
      }
      args = args.slice(1);
    } else {
      error(sourceMgr, "invalid option '" + option + "'");
      break;
    }
  }
}
