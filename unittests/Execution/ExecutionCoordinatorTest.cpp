//===- unittests/Execution/ExecutionCoordinatorTest.cpp -------------------===//
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

#include "../Basic/TempDir.h"
#include "../Sandbox/SandboxTestSupport.h"

#include "sandlane/Admission/AdmissionController.h"
#include "sandlane/Admission/AdmissionError.h"
#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Execution/ExecutionCoordinator.h"
#include "sandlane/Execution/ExecutionOptions.h"
#include "sandlane/Execution/ExecutionRecord.h"
#include "sandlane/Execution/ProcessDescription.h"
#include "sandlane/Sandbox/Materializer.h"
#include "sandlane/Sandbox/RetentionDB.h"
#include "sandlane/Sandbox/SandboxerClient.h"
#include "sandlane/Sandbox/SandboxerServer.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

#include <thread>

using namespace sandlane;
using namespace sandlane::admission;
using namespace sandlane::basic;
using namespace sandlane::execution;
using namespace sandlane::sandbox;
using namespace sandlane::unittests;

namespace {

class ExecutionCoordinatorTest : public ::testing::Test {
protected:
  TmpDir tempDir{"ExecutionCoordinatorTest"};
  std::unique_ptr<FileSystem> fs = createLocalFileSystem();
  NullLogger logger;
  std::unique_ptr<RetentionDB> db = createInMemoryRetentionDB();
  AdmissionController controller{4};
  ExecutionOptions options;
  std::unique_ptr<Materializer> materializer;

  void createMaterializer(RetentionPolicy retention = RetentionPolicy::Never) {
    MaterializerOptions materializerOptions;
    materializerOptions.root = tempDir.path("sandboxes");
    materializerOptions.retention = retention;
    materializer = std::make_unique<Materializer>(*fs, logger, *db,
                                                  materializerOptions);
  }

  void SetUp() override { createMaterializer(); }

  /// Describe a shell script run in the sandbox.
  static ProcessDescription makeScript(StringRef script) {
    ProcessDescription description;
    description.description = "script";
    description.args = { "/bin/sh", "-c", script.str() };
    return description;
  }
};

TEST_F(ExecutionCoordinatorTest, runsInsideSandbox) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("read line < input.txt; echo \"$line\"; "
                                "echo \"$PWD\"");
  description.inputs.addContent("input.txt", "from the sandbox\n");
  description.sandboxID = "job";

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->status, ProcessStatus::Succeeded) << result->errors;
  EXPECT_EQ(result->exitCode, 0);
  EXPECT_EQ(result->output,
            "from the sandbox\n" + materializer->getSandboxPath("job") + "\n");
  EXPECT_EQ(result->sandbox.id, "job");
  EXPECT_EQ(result->finalState, SandboxState::Discarded);
  EXPECT_TRUE(fs->getLinkInfo(materializer->getSandboxPath("job"))
              .isMissing());

  // The slot was returned.
  EXPECT_EQ(controller.getFreeUnits(), 4U);
}

TEST_F(ExecutionCoordinatorTest, substitutesGrantedUnits) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("echo \"$0 $SANDLANE_CONCURRENCY\"");
  description.args.push_back("jobs={sandlane_concurrency}");
  description.requirement = ConcurrencyRequirement::makeRange(2, 3);

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->grantedUnits, 3U);
  EXPECT_EQ(result->output, "jobs=3 3\n");

  auto exclusive = makeScript("echo \"$0 $SANDLANE_CONCURRENCY\"");
  exclusive.args.push_back("{sandlane_concurrency}");
  exclusive.requirement = ConcurrencyRequirement::makeExclusive();
  result = coordinator.execute(exclusive);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->grantedUnits, 4U);
  EXPECT_EQ(result->output, "4 4\n");
}

TEST_F(ExecutionCoordinatorTest, customPlaceholder) {
  options.concurrencyPlaceholder = "%J";
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("echo \"$0\"");
  description.args.push_back("-j%J {sandlane_concurrency}");
  description.requirement = ConcurrencyRequirement::makeExactly(2);

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->output, "-j2 {sandlane_concurrency}\n");
}

TEST_F(ExecutionCoordinatorTest, environment) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("echo \"$GREETING $SANDLANE_CONCURRENCY\"");
  description.env = { { "GREETING", "hello" },
                      { "SANDLANE_CONCURRENCY", "overridden" } };

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->output, "hello 1\n");
}

TEST_F(ExecutionCoordinatorTest, workingDirectory) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("read line < data; echo \"$line\"");
  description.inputs.addContent("sub/dir/data", "nested");
  description.workingDirectory = "./sub/dir/";

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->output, "nested\n");

  auto escaping = makeScript("true");
  escaping.workingDirectory = "../..";
  auto rejected = coordinator.execute(escaping);
  ASSERT_FALSE(bool(rejected));
  llvm::consumeError(rejected.takeError());
}

TEST_F(ExecutionCoordinatorTest, unsatisfiableIsRejectedUpFront) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("true");
  description.requirement = ConcurrencyRequirement::makeExactly(5);
  description.sandboxID = "too-big";
  description.inputs.addContent("file", "data");

  auto result = coordinator.execute(description);
  ASSERT_FALSE(bool(result));
  AdmissionErrorCode code = AdmissionErrorCode::Cancelled;
  llvm::handleAllErrors(result.takeError(), [&](const AdmissionError& e) {
    code = e.getCode();
  });
  EXPECT_EQ(code, AdmissionErrorCode::Unsatisfiable);

  // Nothing was materialized.
  EXPECT_EQ(materializer->getState("too-big"), SandboxState::Empty);
  EXPECT_TRUE(fs->getLinkInfo(materializer->getSandboxPath("too-big"))
              .isMissing());
}

TEST_F(ExecutionCoordinatorTest, failedProcessIsRetained) {
  createMaterializer(RetentionPolicy::OnFailure);
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("echo partial > output.txt; exit 3");
  description.sandboxID = "failing";

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->status, ProcessStatus::Failed);
  EXPECT_EQ(result->exitCode, 3);
  EXPECT_EQ(result->finalState, SandboxState::Completed);

  auto output = fs->getFileContents(materializer->getSandboxPath("failing") +
                                    "/output.txt");
  ASSERT_TRUE(output != nullptr);
  EXPECT_EQ(output->getBuffer(), "partial\n");
}

TEST_F(ExecutionCoordinatorTest, writesRecords) {
  options.recordsDir = tempDir.path("records");
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("true");
  description.description = "recorded";
  description.sandboxID = "recorded-job";
  description.requirement = ConcurrencyRequirement::makeExactly(2);
  description.inputs.addContent("a.txt", "a");

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());

  auto contents = fs->getFileContents(options.recordsDir +
                                      "/recorded-job.json");
  ASSERT_TRUE(contents != nullptr);
  auto record = ExecutionRecord::fromJSON(contents->getBuffer());
  ASSERT_TRUE(bool(record)) << llvm::toString(record.takeError());
  EXPECT_EQ(record->description, "recorded");
  EXPECT_EQ(record->requirement, "exactly(2)");
  EXPECT_EQ(record->grantedUnits, 2U);
  EXPECT_EQ(record->status, "succeeded");
  EXPECT_EQ(record->exitCode, 0);
  EXPECT_EQ(record->finalState, "discarded");
  ASSERT_EQ(record->inputs.size(), 1U);
  EXPECT_EQ(record->inputs[0].path, "a.txt");
}

TEST_F(ExecutionCoordinatorTest, generatesDistinctSandboxIDs) {
  createMaterializer(RetentionPolicy::Always);
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto first = coordinator.execute(makeScript("true"));
  auto second = coordinator.execute(makeScript("true"));
  ASSERT_TRUE(bool(first)) << llvm::toString(first.takeError());
  ASSERT_TRUE(bool(second)) << llvm::toString(second.takeError());
  EXPECT_TRUE(StringRef(first->sandbox.id).startswith("exec-"));
  EXPECT_NE(first->sandbox.id, second->sandbox.id);
}

TEST_F(ExecutionCoordinatorTest, timeout) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("while :; do :; done");
  description.timeoutMs = 200;

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->status, ProcessStatus::TimedOut);
  EXPECT_FALSE(result->succeeded());
  EXPECT_EQ(controller.getFreeUnits(), 4U);
}

TEST_F(ExecutionCoordinatorTest, cancelledExecutionDoesNotRun) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);
  coordinator.cancel();

  auto description = makeScript("echo ran > marker");
  description.sandboxID = "cancelled";
  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->status, ProcessStatus::Cancelled);
  EXPECT_EQ(result->output, "");
  EXPECT_EQ(result->finalState, SandboxState::Discarded);
  EXPECT_EQ(controller.getFreeUnits(), 4U);
}

TEST_F(ExecutionCoordinatorTest, concurrentExecutionsShareThePool) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  const unsigned numThreads = 6;
  std::vector<std::string> outputs(numThreads);
  std::vector<std::thread> threads;
  for (unsigned i = 0; i != numThreads; ++i) {
    threads.emplace_back([&, i]() {
      auto description = makeScript("read value < value; echo \"$value\"");
      description.inputs.addContent("value", std::to_string(i));
      description.requirement = ConcurrencyRequirement::makeExactly(2);
      auto result = coordinator.execute(description);
      if (!result) {
        outputs[i] = llvm::toString(result.takeError());
        return;
      }
      outputs[i] = result->output;
    });
  }
  for (auto& thread: threads)
    thread.join();

  for (unsigned i = 0; i != numThreads; ++i)
    EXPECT_EQ(outputs[i], std::to_string(i) + "\n");
  EXPECT_EQ(controller.getFreeUnits(), 4U);
}

TEST_F(ExecutionCoordinatorTest, capturesDeclaredOutputs) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("mkdir -p out/sub; echo a > out/a.txt; "
                                "echo b > out/sub/b.txt; echo r > result.txt; "
                                "echo ignored > other.txt");
  description.outputs.files = { "./result.txt" };
  description.outputs.directories = { "out" };
  description.outputs.mode = OutputsMatchMode::All;
  description.outputs.destination = tempDir.path("collected");

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_TRUE(result->succeeded()) << result->errors;
  EXPECT_TRUE(result->outputsMatched);
  EXPECT_TRUE(result->missingOutputs.empty());

  ASSERT_EQ(result->outputs.size(), 3U);
  EXPECT_EQ(result->outputs[0].path, "out/a.txt");
  EXPECT_EQ(result->outputs[0].digest, Digest::ofData("a\n"));
  EXPECT_EQ(result->outputs[0].size, 2U);
  EXPECT_EQ(result->outputs[1].path, "out/sub/b.txt");
  EXPECT_EQ(result->outputs[2].path, "result.txt");

  // The sandbox is gone, the copies remain.
  EXPECT_EQ(result->finalState, SandboxState::Discarded);
  auto copied = fs->getFileContents(tempDir.path("collected/out/sub/b.txt"));
  ASSERT_TRUE(copied != nullptr);
  EXPECT_EQ(copied->getBuffer(), "b\n");
  EXPECT_TRUE(fs->getLinkInfo(tempDir.path("collected/other.txt"))
              .isMissing());
}

TEST_F(ExecutionCoordinatorTest, missingOutputsFailTheExecution) {
  createMaterializer(RetentionPolicy::OnFailure);
  options.recordsDir = tempDir.path("records");
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("echo r > present.txt");
  description.sandboxID = "missing";
  description.outputs.files = { "present.txt", "absent.txt" };
  description.outputs.directories = { "absent-dir" };
  description.outputs.mode = OutputsMatchMode::All;

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->status, ProcessStatus::Succeeded);
  EXPECT_FALSE(result->outputsMatched);
  EXPECT_FALSE(result->succeeded());
  EXPECT_NE(result->errors.find("absent.txt"), std::string::npos);
  EXPECT_EQ(result->missingOutputs,
            (std::vector<std::string>{
              "absent.txt (from output files)",
              "absent-dir (from output directories)" }));
  ASSERT_EQ(result->outputs.size(), 1U);
  EXPECT_EQ(result->outputs[0].path, "present.txt");

  // The failure counts for retention.
  EXPECT_EQ(result->finalState, SandboxState::Completed);

  auto contents = fs->getFileContents(options.recordsDir + "/missing.json");
  ASSERT_TRUE(contents != nullptr);
  auto record = ExecutionRecord::fromJSON(contents->getBuffer());
  ASSERT_TRUE(bool(record)) << llvm::toString(record.takeError());
  EXPECT_FALSE(record->outputsMatched);
  ASSERT_EQ(record->outputs.size(), 1U);
  EXPECT_EQ(record->outputs[0].digest, Digest::ofData("r\n").str());
  EXPECT_EQ(record->missingOutputs.size(), 2U);
}

TEST_F(ExecutionCoordinatorTest, outputsMatchModes) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  struct {
    OutputsMatchMode mode;
    const char* script;
    bool succeeds;
  } cases[] = {
    { OutputsMatchMode::AllWarn, "echo > one", true },
    { OutputsMatchMode::All, "echo > one", false },
    { OutputsMatchMode::AtLeastOne, "echo > one", true },
    { OutputsMatchMode::AtLeastOne, "true", false },
    { OutputsMatchMode::AtLeastOneWarn, "true", true },
    { OutputsMatchMode::AllowEmpty, "true", true },
  };
  for (const auto& test: cases) {
    auto description = makeScript(test.script);
    description.outputs.files = { "one", "two" };
    description.outputs.mode = test.mode;

    auto result = coordinator.execute(description);
    ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
    EXPECT_EQ(result->succeeded(), test.succeeds)
      << getOutputsMatchModeName(test.mode).str() << ": " << test.script;
    EXPECT_EQ(result->status, ProcessStatus::Succeeded);
  }
}

TEST_F(ExecutionCoordinatorTest, outputsAreRelativeToWorkingDirectory) {
  ExecutionCoordinator coordinator(controller, *materializer, *fs, logger,
                                   options);

  auto description = makeScript("echo built > main.o");
  description.inputs.addDirectory("build");
  description.workingDirectory = "build";
  description.outputs.files = { "main.o" };
  description.outputs.mode = OutputsMatchMode::All;

  auto result = coordinator.execute(description);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_TRUE(result->succeeded()) << result->errors;
  ASSERT_EQ(result->outputs.size(), 1U);
  EXPECT_EQ(result->outputs[0].path, "main.o");

  // Declared outputs may not leave the working directory.
  auto escaping = makeScript("true");
  escaping.sandboxID = "escaping";
  escaping.outputs.files = { "../../outside" };
  auto rejected = coordinator.execute(escaping);
  ASSERT_FALSE(bool(rejected));
  EXPECT_EQ(getSandboxErrorCode(rejected.takeError()),
            SandboxErrorCode::InvalidPath);
  EXPECT_TRUE(fs->getLinkInfo(materializer->getSandboxPath("escaping"))
              .isMissing());
}

TEST_F(ExecutionCoordinatorTest, executesThroughSandboxer) {
  std::string socketPath = tempDir.path("s.sock");
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  auto err = client.connect();
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));

  options.recordsDir = tempDir.path("records");
  ExecutionCoordinator coordinator(controller, client, *fs, logger, options);

  auto source = tempDir.path("inputs/tool.sh");
  ASSERT_FALSE(fs->createDirectories(tempDir.path("inputs")));
  ASSERT_FALSE(fs->writeFileContents(source,
                                     "#!/bin/sh\necho from the tool\n", true));
  auto elsewhere = tempDir.path("elsewhere");
  ASSERT_FALSE(fs->createDirectories(elsewhere));

  // The process (and the sandboxer within it) runs from another directory.
  SmallString<256> savedDirectory;
  ASSERT_FALSE(llvm::sys::fs::current_path(savedDirectory));
  ASSERT_FALSE(llvm::sys::fs::set_current_path(elsewhere));

  auto description = makeScript("./bin/tool.sh > out.txt; cat out.txt");
  description.sandboxID = "remote";
  description.inputs.addCopy("bin/tool.sh", source, /*isExecutable=*/true);
  description.outputs.files = { "out.txt" };
  description.outputs.mode = OutputsMatchMode::All;
  auto result = coordinator.execute(description);

  auto relative = makeScript("true");
  relative.sandboxID = "relative";
  relative.inputs.addCopy("bin/tool.sh", "../inputs/tool.sh", true);
  auto rejected = coordinator.execute(relative);

  ASSERT_FALSE(llvm::sys::fs::set_current_path(savedDirectory));

  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_TRUE(result->succeeded()) << result->errors;
  EXPECT_EQ(result->output, "from the tool\n");
  EXPECT_EQ(result->sandbox.path, materializer->getSandboxPath("remote"));
  ASSERT_EQ(result->sandbox.files.size(), 1U);
  EXPECT_EQ(result->sandbox.files[0].digest,
            Digest::ofData("#!/bin/sh\necho from the tool\n"));
  ASSERT_EQ(result->outputs.size(), 1U);
  EXPECT_EQ(result->outputs[0].digest, Digest::ofData("from the tool\n"));
  EXPECT_EQ(result->finalState, SandboxState::Discarded);
  EXPECT_EQ(materializer->getState("remote"), SandboxState::Empty);
  EXPECT_TRUE(fs->getLinkInfo(materializer->getSandboxPath("remote"))
              .isMissing());
  EXPECT_FALSE(fs->getLinkInfo(options.recordsDir + "/remote.json")
               .isMissing());

  // Relative copy sources never reach the sandboxer's file system.
  ASSERT_FALSE(bool(rejected));
  EXPECT_EQ(getSandboxErrorCode(rejected.takeError()),
            SandboxErrorCode::InvalidPath);
  EXPECT_EQ(materializer->getRecordCount(), 0U);
  EXPECT_EQ(controller.getFreeUnits(), 4U);

  client.disconnect();
  server.shutdown();
}

}
