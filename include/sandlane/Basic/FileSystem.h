//===- FileSystem.h ---------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_BASIC_FILESYSTEM_H
#define SANDLANE_BASIC_FILESYSTEM_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/FileInfo.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <system_error>

namespace llvm {

class MemoryBuffer;

}

namespace sandlane {
namespace basic {

// Abstract interface for interacting with a file system. This allows mocking of
// operations for testing (notably fault injection), and for clients to provide
// virtualized interfaces.
class FileSystem {
  // DO NOT COPY
  FileSystem(const FileSystem&) SANDLANE_DELETED_FUNCTION;
  void operator=(const FileSystem&) SANDLANE_DELETED_FUNCTION;
  FileSystem &operator=(FileSystem&& rhs) SANDLANE_DELETED_FUNCTION;

public:
  FileSystem() {}
  virtual ~FileSystem();

  /// Create the given directory if it does not exist.
  ///
  /// \returns An empty error code on success (the directory was created, or
  /// already exists).
  virtual std::error_code createDirectory(const std::string& path) = 0;

  /// Create the given directory (recursively) if it does not exist.
  virtual std::error_code createDirectories(const std::string& path);

  /// Get a memory buffer for a given file on the file system.
  ///
  /// \returns The file contents, on success, or null on error.
  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) = 0;

  /// Write \p data to the file at \p path.
  ///
  /// The contents are written to a temporary file in the same directory, which
  /// is closed and given its final permissions before being renamed into
  /// place. A reader never observes a partially written or still-open file.
  virtual std::error_code writeFileContents(const std::string& path,
                                            StringRef data,
                                            bool isExecutable) = 0;

  /// Copy the file at \p sourcePath to \p path, with the same atomicity as
  /// \see writeFileContents().
  virtual std::error_code copyFile(const std::string& sourcePath,
                                   const std::string& path,
                                   bool isExecutable) = 0;

  /// Create a symbolic link at \p path pointing to \p target.
  virtual std::error_code createSymlink(const std::string& target,
                                        const std::string& path) = 0;

  /// Remove the file or directory at the given path.
  ///
  /// Directory removal is recursive.
  ///
  /// \returns True if the item was removed, false otherwise.
  virtual bool remove(const std::string& path) = 0;

  /// Get the information to represent the state of the given path in the file
  /// system.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist (or any error was encountered).
  virtual FileInfo getFileInfo(const std::string& path) = 0;

  /// Get the information to represent the state of the given path in the file
  /// system, without looking through symbolic links.
  virtual FileInfo getLinkInfo(const std::string& path) = 0;
};

/// Create a FileSystem instance suitable for accessing the local filesystem.
std::unique_ptr<FileSystem> createLocalFileSystem();

}
}

#endif
