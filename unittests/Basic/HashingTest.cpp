//===- unittests/Basic/HashingTest.cpp ------------------------------------===//
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

// Hashing.h must compile on its own.
#include "sandlane/Basic/Hashing.h"

#include "TempDir.h"

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/FileSystem.h"

#include "gtest/gtest.h"

using namespace sandlane;
using namespace sandlane::basic;

namespace {

TEST(HashingTest, knownDigests) {
  EXPECT_EQ(Digest::ofData("").str(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(Digest::ofData("abc").str(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashingTest, stringForm) {
  auto digest = Digest::ofData("sandlane");
  auto parsed = Digest::fromString(digest.str());
  ASSERT_TRUE(parsed.hasValue());
  EXPECT_EQ(*parsed, digest);

  EXPECT_FALSE(Digest::fromString("abc").hasValue());
  EXPECT_FALSE(Digest::fromString(std::string(64, 'z')).hasValue());
  EXPECT_TRUE(Digest().isNull());
  EXPECT_FALSE(digest.isNull());
}

TEST(HashingTest, ofFile) {
  TmpDir tempDir(__func__);
  auto fs = createLocalFileSystem();
  auto path = tempDir.path("input.txt");
  ASSERT_FALSE(fs->writeFileContents(path, "abc", false));

  auto digest = Digest::ofFile(path);
  ASSERT_TRUE(bool(digest));
  EXPECT_EQ(*digest, Digest::ofData("abc"));

  EXPECT_FALSE(bool(Digest::ofFile(tempDir.path("missing"))));
}

TEST(HashingTest, builderFramesValues) {
  auto ab_c = DigestBuilder().combine("ab").combine("c").finish();
  auto a_bc = DigestBuilder().combine("a").combine("bc").finish();
  EXPECT_NE(ab_c, a_bc);

  auto again = DigestBuilder().combine("ab").combine("c").finish();
  EXPECT_EQ(ab_c, again);

  auto withFlag = DigestBuilder().combine("ab").combine(true).finish();
  auto withoutFlag = DigestBuilder().combine("ab").combine(false).finish();
  EXPECT_NE(withFlag, withoutFlag);
}

TEST(HashingTest, binaryCoding) {
  auto digest = Digest::ofData("coded");
  BinaryEncoder encoder;
  encoder.write(digest);
  auto data = encoder.contents();
  EXPECT_EQ(data.size(), Digest::Size);

  BinaryDecoder decoder(data);
  Digest decoded;
  decoder.read(decoded);
  EXPECT_TRUE(decoder.finish());
  EXPECT_EQ(decoded, digest);
}

}
