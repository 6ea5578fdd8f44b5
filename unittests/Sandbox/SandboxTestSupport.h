//===- SandboxTestSupport.h -------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_UNITTESTS_SANDBOXTESTSUPPORT_H
#define SANDLANE_UNITTESTS_SANDBOXTESTSUPPORT_H

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Sandbox/SandboxError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

#include <atomic>
#include <memory>
#include <string>

namespace sandlane {
namespace unittests {

/// Get the code of a SandboxError, consuming it.
inline sandbox::SandboxErrorCode getSandboxErrorCode(llvm::Error error) {
  auto code = sandbox::SandboxErrorCode::ProtocolError;
  bool sawSandboxError = false;
  llvm::handleAllErrors(std::move(error),
                        [&](const sandbox::SandboxError& e) {
                          code = e.getCode();
                          sawSandboxError = true;
                        });
  if (!sawSandboxError)
    return sandbox::SandboxErrorCode(0);
  return code;
}

/// A local file system which fails writes to paths containing a marker.
class FaultInjectingFileSystem : public basic::FileSystem {
  std::unique_ptr<basic::FileSystem> local = basic::createLocalFileSystem();

  bool shouldFail(llvm::StringRef path) const {
    return !failingMarker.empty() && path.contains(failingMarker);
  }

public:
  /// Writes to paths containing this string fail.
  std::string failingMarker;

  /// The number of files written (or copied) successfully.
  std::atomic<unsigned> writeCount{0};

  std::error_code createDirectory(const std::string& path) override {
    if (shouldFail(path))
      return std::make_error_code(std::errc::io_error);
    return local->createDirectory(path);
  }

  std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    return local->getFileContents(path);
  }

  std::error_code writeFileContents(const std::string& path,
                                    llvm::StringRef data,
                                    bool isExecutable) override {
    if (shouldFail(path))
      return std::make_error_code(std::errc::no_space_on_device);
    ++writeCount;
    return local->writeFileContents(path, data, isExecutable);
  }

  std::error_code copyFile(const std::string& sourcePath,
                           const std::string& path,
                           bool isExecutable) override {
    if (shouldFail(path))
      return std::make_error_code(std::errc::io_error);
    ++writeCount;
    return local->copyFile(sourcePath, path, isExecutable);
  }

  std::error_code createSymlink(const std::string& target,
                                const std::string& path) override {
    if (shouldFail(path))
      return std::make_error_code(std::errc::io_error);
    return local->createSymlink(target, path);
  }

  bool remove(const std::string& path) override {
    return local->remove(path);
  }

  basic::FileInfo getFileInfo(const std::string& path) override {
    return local->getFileInfo(path);
  }

  basic::FileInfo getLinkInfo(const std::string& path) override {
    return local->getLinkInfo(path);
  }
};

}
}

#endif
