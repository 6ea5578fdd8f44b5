//===- Logging.h ------------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_BASIC_LOGGING_H
#define SANDLANE_BASIC_LOGGING_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <mutex>
#include <string>

namespace sandlane {
namespace basic {

enum class LogLevel {
  Error = 0,
  Warning,
  Note,
  Debug
};

/// Get the lowercase name of a log level, as printed in diagnostics.
StringRef getLogLevelName(LogLevel level);

/// Abstract diagnostic sink.
///
/// Implementations must be thread-safe, messages arrive from any thread.
class Logger {
  // DO NOT COPY
  Logger(const Logger&) SANDLANE_DELETED_FUNCTION;
  void operator=(const Logger&) SANDLANE_DELETED_FUNCTION;

public:
  Logger() {}
  virtual ~Logger();

  /// Emit a message at the given level.
  virtual void log(LogLevel level, const Twine& message) = 0;

  /// Check whether messages at \p level would be emitted, so that callers can
  /// skip expensive formatting.
  virtual bool isEnabled(LogLevel level) const = 0;

  void error(const Twine& message) { log(LogLevel::Error, message); }
  void warning(const Twine& message) { log(LogLevel::Warning, message); }
  void note(const Twine& message) { log(LogLevel::Note, message); }
  void debug(const Twine& message) {
    if (isEnabled(LogLevel::Debug))
      log(LogLevel::Debug, message);
  }
};

/// A logger which writes `<program>: <level>: <message>` lines to a stream.
class StreamLogger : public Logger {
  std::string programName;
  llvm::raw_ostream& os;
  LogLevel maxLevel;
  std::mutex outputMutex;

public:
  /// \param os The stream to write to, which must outlive the logger.
  /// \param maxLevel The most verbose level which is emitted.
  StreamLogger(StringRef programName, llvm::raw_ostream& os,
               LogLevel maxLevel = LogLevel::Note);
  ~StreamLogger() override;

  void log(LogLevel level, const Twine& message) override;
  bool isEnabled(LogLevel level) const override {
    return level <= maxLevel;
  }

  void setMaxLevel(LogLevel level) { maxLevel = level; }
};

/// A logger which discards everything.
class NullLogger : public Logger {
public:
  NullLogger() {}
  ~NullLogger() override;

  void log(LogLevel, const Twine&) override {}
  bool isEnabled(LogLevel) const override { return false; }
};

}
}

#endif
