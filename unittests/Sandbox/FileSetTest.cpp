//===- unittests/Sandbox/FileSetTest.cpp ----------------------------------===//
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

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Sandbox/FileSet.h"

#include "gtest/gtest.h"

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;
using namespace sandlane::unittests;

namespace {

TEST(FileSetTest, normalizeEntryPath) {
  EXPECT_EQ(normalizeEntryPath("a/b").getValue(), "a/b");
  EXPECT_EQ(normalizeEntryPath("./a//b/.").getValue(), "a/b");
  EXPECT_EQ(normalizeEntryPath("a/b/").getValue(), "a/b");

  EXPECT_FALSE(normalizeEntryPath("").hasValue());
  EXPECT_FALSE(normalizeEntryPath(".").hasValue());
  EXPECT_FALSE(normalizeEntryPath("/etc/passwd").hasValue());
  EXPECT_FALSE(normalizeEntryPath("../outside").hasValue());
  EXPECT_FALSE(normalizeEntryPath("a/../../outside").hasValue());
  EXPECT_FALSE(normalizeEntryPath("a/..").hasValue());
}

TEST(FileSetTest, sandboxIDs) {
  EXPECT_TRUE(isValidSandboxID("exec-1234-7"));
  EXPECT_TRUE(isValidSandboxID("test_a.b"));
  EXPECT_FALSE(isValidSandboxID(""));
  EXPECT_FALSE(isValidSandboxID("."));
  EXPECT_FALSE(isValidSandboxID(".."));
  EXPECT_FALSE(isValidSandboxID("a/b"));
  EXPECT_FALSE(isValidSandboxID("with space"));
  EXPECT_FALSE(isValidSandboxID(std::string(256, 'a')));
}

TEST(FileSetTest, normalizeSortsEntries) {
  FileSet files;
  files.addContent("./src/main.c", "int main() {}");
  files.addDirectory("out");
  files.addContent("BUILD", "");
  files.addSymlink("src/link", "main.c");

  EXPECT_FALSE(bool(files.normalize()));
  ASSERT_EQ(files.size(), 4U);
  EXPECT_EQ(files.getEntries()[0].getPath(), "BUILD");
  EXPECT_EQ(files.getEntries()[1].getPath(), "out");
  EXPECT_EQ(files.getEntries()[2].getPath(), "src/link");
  EXPECT_EQ(files.getEntries()[3].getPath(), "src/main.c");
}

TEST(FileSetTest, normalizeRejectsEscapes) {
  for (StringRef path: { "../escape", "/absolute", "a/../../b", "" }) {
    FileSet files;
    files.addContent(path, "x");
    EXPECT_EQ(getSandboxErrorCode(files.normalize()),
              SandboxErrorCode::InvalidPath) << path.str();
  }
}

TEST(FileSetTest, normalizeRejectsRelativeCopySources) {
  for (StringRef source: { "tool", "./bin/tool", "../tool", "" }) {
    FileSet files;
    files.addCopy("bin/tool", source);
    EXPECT_EQ(getSandboxErrorCode(files.normalize()),
              SandboxErrorCode::InvalidPath) << source.str();
  }

  FileSet absolute;
  absolute.addCopy("bin/tool", "/usr/bin/env");
  EXPECT_FALSE(bool(absolute.normalize()));
}

TEST(FileSetTest, normalizeRejectsDuplicates) {
  FileSet files;
  files.addContent("a/b", "1");
  files.addContent("a/./b", "2");
  EXPECT_EQ(getSandboxErrorCode(files.normalize()),
            SandboxErrorCode::InvalidPath);
}

TEST(FileSetTest, normalizeRejectsNestingBelowFiles) {
  FileSet belowFile;
  belowFile.addContent("a", "file");
  belowFile.addContent("a/b", "nested");
  EXPECT_EQ(getSandboxErrorCode(belowFile.normalize()),
            SandboxErrorCode::InvalidPath);

  FileSet belowLink;
  belowLink.addSymlink("lib", "/usr/lib");
  belowLink.addContent("lib/deep/file", "escaped");
  EXPECT_EQ(getSandboxErrorCode(belowLink.normalize()),
            SandboxErrorCode::InvalidPath);

  FileSet belowDirectory;
  belowDirectory.addDirectory("a");
  belowDirectory.addContent("a/b", "fine");
  EXPECT_FALSE(bool(belowDirectory.normalize()));
}

static Digest fingerprintOf(FileSet files) {
  if (auto err = files.normalize()) {
    ADD_FAILURE() << llvm::toString(std::move(err));
    return Digest();
  }
  auto fingerprint = files.computeFingerprint();
  if (!fingerprint) {
    ADD_FAILURE() << llvm::toString(fingerprint.takeError());
    return Digest();
  }
  return *fingerprint;
}

TEST(FileSetTest, fingerprint) {
  FileSet a;
  a.addContent("x", "1");
  a.addContent("y", "2", /*isExecutable=*/true);

  // Order does not matter once normalized.
  FileSet b;
  b.addContent("./y", "2", true);
  b.addContent("x", "1");
  EXPECT_EQ(fingerprintOf(a), fingerprintOf(b));

  FileSet differentContent;
  differentContent.addContent("x", "1");
  differentContent.addContent("y", "3", true);
  EXPECT_NE(fingerprintOf(a), fingerprintOf(differentContent));

  FileSet differentMode;
  differentMode.addContent("x", "1");
  differentMode.addContent("y", "2", false);
  EXPECT_NE(fingerprintOf(a), fingerprintOf(differentMode));

  FileSet asLink;
  asLink.addContent("x", "1");
  asLink.addSymlink("y", "2");
  EXPECT_NE(fingerprintOf(a), fingerprintOf(asLink));
}

TEST(FileSetTest, fingerprintCoversCopySourceContents) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();
  auto source = tempDir.path("source");
  ASSERT_FALSE(fs->writeFileContents(source, "version 1", false));

  FileSet files;
  files.addCopy("tool", source, /*isExecutable=*/true);
  auto first = fingerprintOf(files);
  EXPECT_EQ(first, fingerprintOf(files));

  ASSERT_FALSE(fs->writeFileContents(source, "version 2", false));
  EXPECT_NE(first, fingerprintOf(files));

  // Same contents from another path fingerprint the same.
  auto other = tempDir.path("other");
  ASSERT_FALSE(fs->writeFileContents(other, "version 2", false));
  FileSet moved;
  moved.addCopy("tool", other, true);
  EXPECT_EQ(fingerprintOf(files), fingerprintOf(moved));
}

TEST(FileSetTest, fingerprintOfMissingCopySourceFails) {
  FileSet files;
  files.addCopy("tool", "/does/not/exist");
  EXPECT_FALSE(bool(files.normalize()));
  auto fingerprint = files.computeFingerprint();
  ASSERT_FALSE(bool(fingerprint));
  EXPECT_EQ(getSandboxErrorCode(fingerprint.takeError()),
            SandboxErrorCode::IOFailure);
}

TEST(FileSetTest, binaryCoding) {
  FileSet files;
  files.addContent("a", "contents", true);
  files.addCopy("b", "/source");
  files.addSymlink("c", "a");
  files.addDirectory("d");

  BinaryEncoder encoder;
  encoder.write(files);
  auto data = encoder.contents();

  BinaryDecoder decoder(data);
  FileSet decoded;
  decoder.read(decoded);
  ASSERT_TRUE(decoder.finish());
  EXPECT_EQ(decoded.getEntries(), files.getEntries());
}

}
