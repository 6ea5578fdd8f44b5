//===- unittests/Basic/SubprocessTest.cpp ---------------------------------===//
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

#include "TempDir.h"

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Subprocess.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include "gtest/gtest.h"

#include <csignal>
#include <cstdlib>
#include <string>
#include <vector>

using namespace sandlane;
using namespace sandlane::basic;

namespace {

class RecordingDelegate : public ProcessDelegate {
public:
  std::string output;
  std::vector<std::string> errors;
  unsigned started = 0;
  unsigned finished = 0;

  void processStarted(ProcessContext*, ProcessHandle,
                      sys::ProcessID) override {
    ++started;
  }
  void processHadError(ProcessContext*, ProcessHandle,
                       const Twine& message) override {
    errors.push_back(message.str());
  }
  void processHadOutput(ProcessContext*, ProcessHandle,
                        StringRef data) override {
    output += data;
  }
  void processFinished(ProcessContext*, ProcessHandle,
                       const ProcessResult&) override {
    ++finished;
  }
};

/// Run \p script with /bin/sh, waiting for it to finish.
static ProcessResult runShell(RecordingDelegate& delegate, ProcessGroup& pgrp,
                              StringRef script, ProcessAttributes attributes,
                              POSIXEnvironment env = POSIXEnvironment()) {
  if (const char* path = ::getenv("PATH"))
    env.setIfMissing("PATH", path);
  std::vector<StringRef> commandLine{ "/bin/sh", "-c", script };
  llvm::Optional<ProcessResult> result;
  spawnProcess(delegate, nullptr, pgrp, ProcessHandle{ 1 }, commandLine,
               std::move(env), attributes,
               [&](ProcessResult value) { result = value; });
  EXPECT_TRUE(result.hasValue());
  return result.getValueOr(ProcessResult::makeFailed());
}

TEST(SubprocessTest, capturesMergedOutput) {
  RecordingDelegate delegate;
  ProcessGroup pgrp;
  auto result = runShell(delegate, pgrp, "echo out; echo err 1>&2",
                         ProcessAttributes{ true });
  EXPECT_EQ(result.status, ProcessStatus::Succeeded);
  EXPECT_EQ(result.exitCode, 0);
  EXPECT_EQ(delegate.output, "out\nerr\n");
  EXPECT_EQ(delegate.started, 1U);
  EXPECT_EQ(delegate.finished, 1U);
  EXPECT_TRUE(delegate.errors.empty());
}

TEST(SubprocessTest, reportsExitCode) {
  RecordingDelegate delegate;
  ProcessGroup pgrp;
  auto result = runShell(delegate, pgrp, "exit 3", ProcessAttributes{ true });
  EXPECT_EQ(result.status, ProcessStatus::Failed);
  EXPECT_EQ(result.exitCode, 3);
  EXPECT_EQ(result.signal, 0);
}

TEST(SubprocessTest, environmentAndStdin) {
  RecordingDelegate delegate;
  ProcessGroup pgrp;
  POSIXEnvironment env;
  env.set("GREETING", "hello");
  auto result = runShell(delegate, pgrp, "echo $GREETING; cat",
                         ProcessAttributes{ true }, std::move(env));
  // Standard input is /dev/null, so `cat` finishes immediately.
  EXPECT_EQ(result.status, ProcessStatus::Succeeded);
  EXPECT_EQ(delegate.output, "hello\n");
}

TEST(SubprocessTest, workingDirectory) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();
  ASSERT_FALSE(fs->writeFileContents(tempDir.path("marker"), "here", false));

  RecordingDelegate delegate;
  ProcessGroup pgrp;
  ProcessAttributes attributes{ true };
  std::string cwd = tempDir.str();
  attributes.workingDir = cwd;
  auto result = runShell(delegate, pgrp, "cat marker", attributes);
  EXPECT_EQ(result.status, ProcessStatus::Succeeded);
  EXPECT_EQ(delegate.output, "here");
}

TEST(SubprocessTest, timeoutKillsProcess) {
  RecordingDelegate delegate;
  ProcessGroup pgrp;
  ProcessAttributes attributes{ true };
  attributes.timeoutMs = 200;
  auto result = runShell(delegate, pgrp, "sleep 30", attributes);
  EXPECT_EQ(result.status, ProcessStatus::TimedOut);
  EXPECT_EQ(result.signal, SIGKILL);
}

TEST(SubprocessTest, spawnFailureIsReported) {
  RecordingDelegate delegate;
  ProcessGroup pgrp;
  std::vector<StringRef> commandLine{ "/does/not/exist" };
  llvm::Optional<ProcessResult> result;
  spawnProcess(delegate, nullptr, pgrp, ProcessHandle{ 1 }, commandLine,
               POSIXEnvironment(), ProcessAttributes{ true },
               [&](ProcessResult value) { result = value; });
  ASSERT_TRUE(result.hasValue());
  EXPECT_EQ(result->status, ProcessStatus::Failed);
  ASSERT_EQ(delegate.errors.size(), 1U);
  EXPECT_NE(delegate.errors[0].find("unable to spawn process"),
            std::string::npos);
}

TEST(SubprocessTest, closedGroupCancels) {
  RecordingDelegate delegate;
  ProcessGroup pgrp;
  pgrp.close();
  auto result = runShell(delegate, pgrp, "echo never",
                         ProcessAttributes{ true });
  EXPECT_EQ(result.status, ProcessStatus::Cancelled);
  EXPECT_EQ(delegate.output, "");
}

TEST(SubprocessTest, statusNames) {
  EXPECT_EQ(getProcessStatusName(ProcessStatus::Succeeded), "succeeded");
  EXPECT_EQ(getProcessStatusName(ProcessStatus::TimedOut), "timed-out");
}

}
