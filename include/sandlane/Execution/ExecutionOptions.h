//===- ExecutionOptions.h ---------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_EXECUTION_EXECUTIONOPTIONS_H
#define SANDLANE_EXECUTION_EXECUTIONOPTIONS_H

#include "sandlane/Basic/LLVM.h"
#include "sandlane/Sandbox/SandboxHandle.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace llvm {
class SourceMgr;
}

namespace sandlane {
namespace execution {

/// The settings shared by the coordinator and the sandboxer sidecar.
///
/// Settings are read from the `SANDLANE_*` environment variables first, and
/// then overridden by command line options. Problems are reported through a
/// \see llvm::SourceMgr and recorded in \see hadErrors.
class SandboxSettings {
public:
  /// The directory holding the sandboxes; empty for the default.
  std::string sandboxRoot;

  /// The path of the sandboxer socket; empty for the default.
  std::string socketPath;

  /// What to do with the sandboxes of completed processes.
  sandbox::RetentionPolicy retention = sandbox::RetentionPolicy::Never;

  /// How long retained sandboxes are kept, in seconds.
  uint64_t retentionSeconds = 86400;

  /// The path of the retention database, if any.
  std::string retentionDBPath;

  /// Whether to log debug messages.
  bool verbose = false;

  /// Whether any errors were encountered.
  bool hadErrors = false;

  /// Get the sandbox root, `<tmp>/sandlane` by default.
  std::string getSandboxRoot() const;

  /// Get the sandboxer socket path, `<root>/sandboxer.sock` by default.
  std::string getSocketPath() const;

  /// Get the current process environment, for \see parseEnvironment().
  static llvm::StringMap<std::string> getProcessEnvironment();

protected:
  /// Apply the shared settings found in \p environment.
  void parseSharedEnvironment(const llvm::StringMap<std::string>& environment,
                              llvm::SourceMgr& sourceMgr);

  /// Consume \p option (and its argument, from \p args) if it is a shared
  /// setting.
  ///
  /// \returns False if the option is not a shared setting.
  bool parseSharedOption(StringRef option, ArrayRef<std::string>& args,
                         llvm::SourceMgr& sourceMgr);

  /// Report an error and mark the settings as erroneous.
  void error(llvm::SourceMgr& sourceMgr, const Twine& message);
};

/// The configuration of an execution coordinator.
class ExecutionOptions : public SandboxSettings {
public:
  /// The number of resource units to admit processes against; zero for the
  /// number of CPUs.
  unsigned jobs = 0;

  /// Whether materialization is delegated to the sandboxer sidecar.
  bool useSandboxer = false;

  /// The token replaced with the granted unit count in process arguments.
  std::string concurrencyPlaceholder;

  /// The directory execution records are written to, if any.
  std::string recordsDir;

  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// The positional arguments.
  std::vector<std::string> positionalArgs;

  ExecutionOptions();

  /// Get the total number of resource units.
  unsigned getTotalUnits() const;

  /// Apply the settings found in \p environment.
  void parseEnvironment(const llvm::StringMap<std::string>& environment,
                        llvm::SourceMgr& sourceMgr);

  /// Parse the command line arguments for the options.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);

  /// Print the usage of the options understood by \see parse().
  static void getUsage(int optionWidth, raw_ostream& os);
};

/// The configuration of the sandboxer sidecar.
class SandboxerInvocation : public SandboxSettings {
public:
  /// How often retained sandboxes are expired, in seconds; zero disables
  /// periodic expiry.
  uint64_t expireIntervalSeconds = 60;

  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// Apply the settings found in \p environment.
  void parseEnvironment(const llvm::StringMap<std::string>& environment,
                        llvm::SourceMgr& sourceMgr);

  /// Parse the command line arguments for the sidecar.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);

  /// Print the usage of the options understood by \see parse().
  static void getUsage(int optionWidth, raw_ostream& os);
};

}
}

#endif
