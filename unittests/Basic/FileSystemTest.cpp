//===- unittests/Basic/FileSystemTest.cpp ---------------------------------===//
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
#include "sandlane/Basic/LLVM.h"
#include "sandlane/Basic/PlatformUtility.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include "gtest/gtest.h"

#include <cerrno>
#include <unistd.h>

using namespace sandlane;
using namespace sandlane::basic;

namespace {

TEST(FileSystemTest, basic) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();

  auto path = tempDir.path("hello.txt");
  EXPECT_FALSE(fs->writeFileContents(path, "Hello, world!", false));

  auto missingFileInfo = fs->getFileInfo("/does/not/exists");
  EXPECT_TRUE(missingFileInfo.isMissing());

  auto ourFileInfo = fs->getFileInfo(path);
  EXPECT_FALSE(ourFileInfo.isMissing());
  EXPECT_TRUE(ourFileInfo.isRegular());
  EXPECT_FALSE(ourFileInfo.isExecutable());
  EXPECT_EQ(ourFileInfo.size, 13U);

  auto missingFileContents = fs->getFileContents("/does/not/exist");
  EXPECT_EQ(missingFileContents.get(), nullptr);

  auto ourFileContents = fs->getFileContents(path);
  ASSERT_NE(ourFileContents.get(), nullptr);
  EXPECT_EQ(ourFileContents->getBuffer().str(), "Hello, world!");
}

TEST(FileSystemTest, writeLeavesNoTemporaries) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();

  auto path = tempDir.path("tool");
  EXPECT_FALSE(fs->writeFileContents(path, "#!/bin/sh\n", true));
  EXPECT_TRUE(fs->getFileInfo(path).isExecutable());

  // Overwriting replaces the file and its permissions.
  EXPECT_FALSE(fs->writeFileContents(path, "data", false));
  EXPECT_FALSE(fs->getFileInfo(path).isExecutable());
  EXPECT_EQ(fs->getFileContents(path)->getBuffer(), "data");

  std::error_code ec;
  unsigned count = 0;
  for (llvm::sys::fs::directory_iterator it(tempDir.str(), ec), end;
       it != end && !ec; it.increment(ec)) {
    ++count;
  }
  EXPECT_FALSE(ec);
  EXPECT_EQ(count, 1U);
}

TEST(FileSystemTest, copyFile) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();

  auto source = tempDir.path("source");
  auto copy = tempDir.path("copy");
  ASSERT_FALSE(fs->writeFileContents(source, "copied bytes", false));
  EXPECT_FALSE(fs->copyFile(source, copy, true));
  EXPECT_EQ(fs->getFileContents(copy)->getBuffer(), "copied bytes");
  EXPECT_TRUE(fs->getFileInfo(copy).isExecutable());

  EXPECT_TRUE(bool(fs->copyFile(tempDir.path("missing"),
                                tempDir.path("other"), false)));
  EXPECT_TRUE(fs->getLinkInfo(tempDir.path("other")).isMissing());
}

TEST(FileSystemTest, createDirectoriesAndSymlinks) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();

  auto nested = tempDir.path("a/b/c");
  EXPECT_FALSE(fs->createDirectories(nested));
  EXPECT_TRUE(fs->getFileInfo(nested).isDirectory());
  // Creating an existing directory succeeds.
  EXPECT_FALSE(fs->createDirectories(nested));

  // A file in the way is an error.
  auto file = tempDir.path("file");
  ASSERT_FALSE(fs->writeFileContents(file, "x", false));
  EXPECT_TRUE(bool(fs->createDirectory(file)));

  auto link = tempDir.path("a/link");
  EXPECT_FALSE(fs->createSymlink("b/c", link));
  EXPECT_TRUE(fs->getLinkInfo(link).isSymlink());
  EXPECT_TRUE(fs->getFileInfo(link).isDirectory());
}

TEST(FileSystemTest, testRecursiveRemoval) {
  TmpDir rootTempDir(__func__);
  auto fs = createLocalFileSystem();

  auto root = rootTempDir.path("root");
  ASSERT_FALSE(fs->createDirectories(root + "/subdir"));
  ASSERT_FALSE(fs->writeFileContents(root + "/test.txt", "Hello", false));
  ASSERT_FALSE(fs->writeFileContents(root + "/subdir/file_in_subdir.txt",
                                     "Hello", false));

  EXPECT_TRUE(fs->remove(root));

  sys::StatStruct statbuf;
  EXPECT_EQ(-1, sys::stat(root.c_str(), &statbuf));
  EXPECT_EQ(ENOENT, errno);
}

TEST(FileSystemTest, testRecursiveRemovalDoesNotFollowSymlinks) {
  TmpDir rootTempDir(__func__);
  auto fs = createLocalFileSystem();

  auto file = rootTempDir.path("test.txt");
  ASSERT_FALSE(fs->writeFileContents(file, "Hello", false));
  auto otherDir = rootTempDir.path("other_dir");
  ASSERT_FALSE(fs->createDirectory(otherDir));
  auto otherFile = otherDir + "/test.txt";
  ASSERT_FALSE(fs->writeFileContents(otherFile, "Hello", false));

  auto root = rootTempDir.path("root");
  ASSERT_FALSE(fs->createDirectory(root));
  EXPECT_FALSE(fs->createSymlink(file, root + "/link.txt"));
  EXPECT_FALSE(fs->createSymlink(otherDir, root + "/link_to_other_dir"));

  EXPECT_TRUE(fs->remove(root));

  sys::StatStruct statbuf;
  EXPECT_EQ(-1, sys::stat(root.c_str(), &statbuf));
  EXPECT_EQ(ENOENT, errno);
  // Verify that the symlink target still exists.
  EXPECT_EQ(0, sys::stat(file.c_str(), &statbuf));
  // Verify that we did not delete the symlinked directories contents.
  EXPECT_EQ(0, sys::stat(otherFile.c_str(), &statbuf));
}

}
