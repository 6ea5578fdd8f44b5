//===-- TestMain.cpp ------------------------------------------------------===//
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

#include "gtest/gtest.h"

#include <csignal>

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);

  // The sandboxer tests write to sockets whose peer may vanish.
  std::signal(SIGPIPE, SIG_IGN);

  // The suites spawn threads and subprocesses.
  testing::GTEST_FLAG(death_test_style) = "threadsafe";

  return RUN_ALL_TESTS();
}
