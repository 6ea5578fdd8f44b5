//===-- sandlane-sandboxer.cpp --------------------------------------------===//
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

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Basic/ShutdownSignalAwaiter.h"
#include "sandlane/Execution/ExecutionOptions.h"
#include "sandlane/Sandbox/Materializer.h"
#include "sandlane/Sandbox/RetentionDB.h"
#include "sandlane/Sandbox/SandboxerServer.h"

#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <string>
#include <vector>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::execution;
using namespace sandlane::sandbox;

static void usage(StringRef programName) {
  llvm::errs() << "Usage: " << programName << " [options]\n"
               << "\n"
               << "Materialize process sandboxes on behalf of execution "
               << "coordinators.\n"
               << "\n"
               << "Options:\n";
  SandboxerInvocation::getUsage(30, llvm::errs());
}

static uint64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

int main(int argc, const char **argv) {
  StringRef programName = llvm::sys::path::filename(argv[0]);
  std::vector<std::string> args;
  for (int i = 1; i != argc; ++i) {
    args.push_back(argv[i]);
  }

  llvm::SourceMgr sourceMgr;
  SandboxerInvocation invocation;
  invocation.parseEnvironment(SandboxSettings::getProcessEnvironment(),
                              sourceMgr);
  invocation.parse(args, sourceMgr);
  if (invocation.showUsage) {
    usage(programName);
    return 0;
  }
  if (invocation.hadErrors) {
    usage(programName);
    return 1;
  }

  StreamLogger logger(programName, llvm::errs(),
                      invocation.verbose ? LogLevel::Debug : LogLevel::Note);

  auto fs = createLocalFileSystem();
  std::string root = invocation.getSandboxRoot();
  if (auto ec = fs->createDirectories(root)) {
    logger.error("unable to create sandbox root '" + root + "': " +
                 ec.message());
    return 1;
  }

  std::unique_ptr<RetentionDB> db;
  if (invocation.retentionDBPath.empty()) {
    db = createInMemoryRetentionDB();
  } else {
    db = createSQLiteRetentionDB(invocation.retentionDBPath);
  }

  MaterializerOptions options;
  options.root = root;
  options.retention = invocation.retention;
  options.retentionSeconds = invocation.retentionSeconds;
  Materializer materializer(*fs, logger, *db, options);

  auto restored = materializer.restoreRetained();
  if (!restored) {
    logger.error("unable to restore retained sandboxes: " +
                 llvm::toString(restored.takeError()));
    return 1;
  }

  SandboxerServer server(materializer, logger, invocation.getSocketPath(),
                         root);
  std::string error;
  if (!server.start(&error)) {
    logger.error(error);
    return 1;
  }

  ShutdownSignalAwaiter awaiter;
  while (true) {
    int signal = awaiter.wait(invocation.expireIntervalSeconds * 1000);
    if (signal != 0) {
      logger.note("received signal " + Twine(signal) + ", shutting down");
      break;
    }

    auto expired = materializer.expireRetained(getCurrentTime());
    if (!expired) {
      logger.error("unable to expire retained sandboxes: " +
                   llvm::toString(expired.takeError()));
    } else if (*expired != 0) {
      logger.note("expired " + Twine(*expired) + " retained sandboxes");
    }
  }

  server.shutdown();
  logger.debug("served " + Twine(server.getRequestCount()) + " requests");
  return 0;
}
