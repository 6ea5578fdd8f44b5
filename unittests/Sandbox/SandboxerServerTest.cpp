//===- unittests/Sandbox/SandboxerServerTest.cpp --------------------------===//
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
#include "SandboxTestSupport.h"

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Sandbox/Materializer.h"
#include "sandlane/Sandbox/RetentionDB.h"
#include "sandlane/Sandbox/SandboxerClient.h"
#include "sandlane/Sandbox/SandboxerServer.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"

#include "gtest/gtest.h"

#include <atomic>
#include <cstring>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;
using namespace sandlane::unittests;

namespace {

class SandboxerServerTest : public ::testing::Test {
protected:
  TmpDir tempDir{"SandboxerServerTest"};
  std::unique_ptr<FileSystem> fs = createLocalFileSystem();
  NullLogger logger;
  std::unique_ptr<RetentionDB> db = createInMemoryRetentionDB();
  std::unique_ptr<Materializer> materializer;
  std::string socketPath = tempDir.path("s.sock");

  void SetUp() override {
    MaterializerOptions options;
    options.root = tempDir.path("root");
    options.retention = RetentionPolicy::OnFailure;
    materializer = std::make_unique<Materializer>(*fs, logger, *db, options);
  }
};

TEST_F(SandboxerServerTest, lifecycleThroughClient) {
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  auto err = client.connect();
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));
  EXPECT_TRUE(client.isConnected());
  EXPECT_EQ(client.getServerRoot(), materializer->getRoot());

  FileSet files;
  files.addContent("dir/input.txt", "hello", true);
  files.addSymlink("link", "dir/input.txt");

  auto handle = client.materialize("job", files);
  ASSERT_TRUE(bool(handle)) << llvm::toString(handle.takeError());
  EXPECT_EQ(handle->id, "job");
  EXPECT_EQ(handle->path, materializer->getSandboxPath("job"));
  ASSERT_EQ(handle->files.size(), 2U);
  EXPECT_EQ(handle->files[0].path, "dir/input.txt");
  EXPECT_EQ(handle->files[0].digest, Digest::ofData("hello"));
  EXPECT_TRUE(handle->files[0].isExecutable);
  EXPECT_FALSE(handle->reused);

  auto again = client.materialize("job", files);
  ASSERT_TRUE(bool(again)) << llvm::toString(again.takeError());
  EXPECT_TRUE(again->reused);

  auto contents = fs->getFileContents(handle->path + "/dir/input.txt");
  ASSERT_TRUE(contents != nullptr);
  EXPECT_EQ(contents->getBuffer(), "hello");

  err = client.beginExecution("job");
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));
  EXPECT_EQ(materializer->getState("job"), SandboxState::Executing);

  auto state = client.completeExecution("job", /*succeeded=*/false);
  ASSERT_TRUE(bool(state)) << llvm::toString(state.takeError());
  EXPECT_EQ(*state, SandboxState::Completed);

  auto expired = client.expireRetained(UINT64_MAX);
  ASSERT_TRUE(bool(expired)) << llvm::toString(expired.takeError());
  EXPECT_EQ(*expired, 1U);
  EXPECT_TRUE(fs->getLinkInfo(handle->path).isMissing());

  ASSERT_TRUE(bool(client.materialize("other", files)));
  err = client.discard("other");
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));
  EXPECT_EQ(materializer->getState("other"), SandboxState::Empty);
  EXPECT_EQ(materializer->getRecordCount(), 0U);

  EXPECT_GE(server.getRequestCount(), 7U);
  client.disconnect();
  EXPECT_FALSE(client.isConnected());
  server.shutdown();
}

TEST_F(SandboxerServerTest, errorsCrossTheWire) {
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  ASSERT_FALSE(bool(client.connect()));

  FileSet files;
  files.addContent("a", "1");
  auto badID = client.materialize("../escape", files);
  ASSERT_FALSE(bool(badID));
  EXPECT_EQ(getSandboxErrorCode(badID.takeError()),
            SandboxErrorCode::InvalidPath);

  EXPECT_EQ(getSandboxErrorCode(client.beginExecution("unknown")),
            SandboxErrorCode::InvalidState);

  FileSet missing;
  missing.addCopy("tool", tempDir.path("does-not-exist"));
  auto failed = client.materialize("job", missing);
  ASSERT_FALSE(bool(failed));
  EXPECT_EQ(getSandboxErrorCode(failed.takeError()),
            SandboxErrorCode::IOFailure);

  // The connection survives failed requests.
  EXPECT_TRUE(client.isConnected());
  EXPECT_TRUE(bool(client.materialize("job", files)));
}

TEST_F(SandboxerServerTest, copySourcesIgnoreServerDirectory) {
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  ASSERT_FALSE(bool(client.connect()));

  // The client's input lives in its own directory; the server runs elsewhere.
  auto clientDir = tempDir.path("client");
  auto serverDir = tempDir.path("server");
  ASSERT_FALSE(fs->createDirectories(clientDir));
  ASSERT_FALSE(fs->createDirectories(serverDir));
  ASSERT_FALSE(fs->writeFileContents(clientDir + "/tool", "client tool",
                                     true));
  ASSERT_FALSE(fs->writeFileContents(serverDir + "/tool", "server tool",
                                     false));

  SmallString<256> savedDirectory;
  ASSERT_FALSE(llvm::sys::fs::current_path(savedDirectory));
  ASSERT_FALSE(llvm::sys::fs::set_current_path(serverDir));

  // A relative source would pick up the server's file, so it is refused.
  FileSet relative;
  relative.addCopy("bin/tool", "tool", true);
  auto refused = client.materialize("relative", relative);

  FileSet absolute;
  absolute.addCopy("bin/tool", clientDir + "/tool", true);
  auto handle = client.materialize("absolute", absolute);

  ASSERT_FALSE(llvm::sys::fs::set_current_path(savedDirectory));

  ASSERT_FALSE(bool(refused));
  EXPECT_EQ(getSandboxErrorCode(refused.takeError()),
            SandboxErrorCode::InvalidPath);
  EXPECT_TRUE(fs->getLinkInfo(materializer->getSandboxPath("relative"))
              .isMissing());

  ASSERT_TRUE(bool(handle)) << llvm::toString(handle.takeError());
  ASSERT_EQ(handle->files.size(), 1U);
  EXPECT_EQ(handle->files[0].digest, Digest::ofData("client tool"));
  auto contents = fs->getFileContents(handle->path + "/bin/tool");
  ASSERT_TRUE(contents != nullptr);
  EXPECT_EQ(contents->getBuffer(), "client tool");
}

TEST_F(SandboxerServerTest, concurrentRequests) {
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  ASSERT_FALSE(bool(client.connect()));

  const unsigned numThreads = 8;
  std::vector<std::string> failures(numThreads);
  std::vector<std::thread> threads;
  for (unsigned i = 0; i != numThreads; ++i) {
    threads.emplace_back([&, i]() {
      std::string id = "job-" + std::to_string(i);
      FileSet files;
      files.addContent("input", id);
      auto handle = client.materialize(id, files);
      if (!handle) {
        failures[i] = llvm::toString(handle.takeError());
        return;
      }
      if (handle->id != id) {
        failures[i] = "reply for '" + handle->id + "'";
        return;
      }
      if (auto err = client.beginExecution(id)) {
        failures[i] = llvm::toString(std::move(err));
        return;
      }
      auto state = client.completeExecution(id, true);
      if (!state)
        failures[i] = llvm::toString(state.takeError());
      else if (*state != SandboxState::Discarded)
        failures[i] = "sandbox was retained";
    });
  }
  for (auto& thread: threads)
    thread.join();

  for (const auto& failure: failures)
    EXPECT_EQ(failure, "");
}

TEST_F(SandboxerServerTest, disconnectRacesRequests) {
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  ASSERT_FALSE(bool(client.connect()));

  const unsigned numThreads = 4;
  std::atomic<bool> started{false};
  std::vector<std::string> failures(numThreads);
  std::vector<std::thread> threads;
  for (unsigned i = 0; i != numThreads; ++i) {
    threads.emplace_back([&, i]() {
      FileSet files;
      files.addContent("input", "data");
      for (unsigned n = 0; n != 200; ++n) {
        std::string id = "job-" + std::to_string(i) + "-" + std::to_string(n);
        auto handle = client.materialize(id, files);
        started = true;
        if (handle)
          continue;
        auto code = getSandboxErrorCode(handle.takeError());
        if (code != SandboxErrorCode::SidecarUnavailable)
          failures[i] = "unexpected error code " +
            std::to_string(unsigned(code));
        return;
      }
    });
  }

  while (!started)
    std::this_thread::yield();
  client.disconnect();
  for (auto& thread: threads)
    thread.join();

  for (const auto& failure: failures)
    EXPECT_EQ(failure, "");
  EXPECT_FALSE(client.isConnected());

  // The client can connect again afterwards.
  auto err = client.connect();
  ASSERT_FALSE(bool(err)) << llvm::toString(std::move(err));
  FileSet files;
  files.addContent("input", "data");
  auto handle = client.materialize("after", files);
  EXPECT_TRUE(bool(handle)) << llvm::toString(handle.takeError());
}

TEST_F(SandboxerServerTest, missingServerIsUnavailable) {
  SandboxerClient client(socketPath, "test", logger);
  EXPECT_EQ(getSandboxErrorCode(client.connect()),
            SandboxErrorCode::SidecarUnavailable);
  EXPECT_FALSE(client.isConnected());

  FileSet files;
  files.addContent("a", "1");
  auto handle = client.materialize("job", files);
  ASSERT_FALSE(bool(handle));
  EXPECT_EQ(getSandboxErrorCode(handle.takeError()),
            SandboxErrorCode::SidecarUnavailable);

  // Nothing was materialized in-process.
  EXPECT_TRUE(fs->getLinkInfo(materializer->getSandboxPath("job"))
              .isMissing());
}

TEST_F(SandboxerServerTest, serverShutdownFailsLaterRequests) {
  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  ASSERT_FALSE(bool(client.connect()));
  server.shutdown();

  FileSet files;
  files.addContent("a", "1");
  auto handle = client.materialize("job", files);
  ASSERT_FALSE(bool(handle));
  EXPECT_EQ(getSandboxErrorCode(handle.takeError()),
            SandboxErrorCode::SidecarUnavailable);
  EXPECT_EQ(getSandboxErrorCode(client.discard("job")),
            SandboxErrorCode::SidecarUnavailable);
}

TEST_F(SandboxerServerTest, refusesLiveSocket) {
  SandboxerServer first(*materializer, logger, socketPath,
                        materializer->getRoot());
  std::string error;
  ASSERT_TRUE(first.start(&error)) << error;

  SandboxerServer second(*materializer, logger, socketPath,
                         materializer->getRoot());
  EXPECT_FALSE(second.start(&error));
  EXPECT_NE(error.find("in use"), std::string::npos);

  // The first server is unaffected.
  SandboxerClient client(socketPath, "test", logger);
  EXPECT_FALSE(bool(client.connect()));
}

TEST_F(SandboxerServerTest, replacesStaleSocket) {
  // Leave a socket file nobody is listening on.
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  ASSERT_GE(fd, 0);
  struct sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  ASSERT_LT(socketPath.size(), sizeof(addr.sun_path));
  memcpy(addr.sun_path, socketPath.data(), socketPath.size());
  ASSERT_EQ(::bind(fd, (struct sockaddr*)&addr, sizeof(addr)), 0);
  ::close(fd);
  ASSERT_FALSE(fs->getLinkInfo(socketPath).isMissing());

  SandboxerServer server(*materializer, logger, socketPath,
                         materializer->getRoot());
  std::string error;
  ASSERT_TRUE(server.start(&error)) << error;

  SandboxerClient client(socketPath, "test", logger);
  EXPECT_FALSE(bool(client.connect()));

  // Shutting down removes the socket.
  client.disconnect();
  server.shutdown();
  EXPECT_TRUE(fs->getLinkInfo(socketPath).isMissing());
}

}
