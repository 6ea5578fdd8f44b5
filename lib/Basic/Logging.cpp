//===-- Logging.cpp -------------------------------------------------------===//
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

#include "sandlane/Basic/Logging.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/raw_ostream.h"

using namespace sandlane;
using namespace sandlane::basic;

StringRef basic::getLogLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Error: return "error";
  case LogLevel::Warning: return "warning";
  case LogLevel::Note: return "note";
  case LogLevel::Debug: return "debug";
  }
  return "unknown";
}

Logger::~Logger() {}

NullLogger::~NullLogger() {}

StreamLogger::StreamLogger(StringRef programName, llvm::raw_ostream& os,
                           LogLevel maxLevel)
    : programName(programName), os(os), maxLevel(maxLevel) {}

StreamLogger::~StreamLogger() {}

void StreamLogger::log(LogLevel level, const Twine& message) {
  if (!isEnabled(level))
    return;

  // Format outside the lock, so that concurrent writers only serialize on the
  // actual stream write.
  SmallString<256> line;
  if (!programName.empty()) {
    line += programName;
    line += ": ";
  }
  line += getLogLevelName(level);
  line += ": ";
  message.toVector(line);
  line += '\n';

  std::lock_guard<std::mutex> guard(outputMutex);
  os << line;
  os.flush();
}
