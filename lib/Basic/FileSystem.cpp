//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/PlatformUtility.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>

using namespace sandlane;
using namespace sandlane::basic;

namespace {
  using namespace llvm::sys::fs;

  std::error_code lastError() {
    return std::error_code(errno, std::generic_category());
  }

  std::error_code removeTree(StringRef path, uint32_t &count) {
    sys::StatStruct statbuf;
    if (sys::lstat(path.str().c_str(), &statbuf) != 0)
      return lastError();

    if (S_ISDIR(statbuf.st_mode)) {
      std::error_code ec;
      directory_iterator i(path, ec, /*follow_symlinks=*/false);
      if (ec)
        return ec;

      for (directory_iterator e; i != e; i.increment(ec)) {
        if (ec)
          return ec;
        if (std::error_code ec = removeTree(i->path(), count))
          return ec;
      }

      if (sys::rmdir(path.str().c_str()) != 0)
        return lastError();
    } else {
      if (sys::unlink(path.str().c_str()) != 0)
        return lastError();
    }

    ++count;
    return std::error_code();
  }

  unsigned filePermissions(bool isExecutable) {
    unsigned mode = perms::all_read | perms::owner_write;
    if (isExecutable)
      mode |= perms::all_exe;
    return mode;
  }

  /// Set the final permissions on a closed temporary file and move it into
  /// place, cleaning up the temporary on any failure.
  std::error_code finishTemporary(StringRef tempPath, const std::string& path,
                                  bool isExecutable) {
    if (auto ec = setPermissions(tempPath,
                                 perms(filePermissions(isExecutable)))) {
      (void)llvm::sys::fs::remove(tempPath);
      return ec;
    }
    if (auto ec = rename(tempPath, path)) {
      (void)llvm::sys::fs::remove(tempPath);
      return ec;
    }
    return std::error_code();
  }
}

FileSystem::~FileSystem() {}

std::error_code FileSystem::createDirectories(const std::string& path) {
  // Attempt to create the final directory first, to optimize for the common
  // case where we don't need to recurse.
  auto ec = createDirectory(path);
  if (!ec)
    return ec;
  if (ec != std::errc::no_such_file_or_directory)
    return ec;

  // If that failed, attempt to create the parent.
  StringRef parent = llvm::sys::path::parent_path(path);
  if (parent.empty())
    return ec;
  if (auto ec = createDirectories(parent.str()))
    return ec;
  return createDirectory(path);
}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual std::error_code
  createDirectory(const std::string& path) override {
    if (!sys::mkdir(path.c_str())) {
      if (errno != EEXIST) {
        return lastError();
      }
      // Something already exists; only a directory satisfies the request.
      if (!FileInfo::getInfoForPath(path).isDirectory())
        return std::make_error_code(std::errc::not_a_directory);
    }
    return std::error_code();
  }

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    auto result = llvm::MemoryBuffer::getFile(path);
    if (result.getError()) {
      return nullptr;
    }
    return std::unique_ptr<llvm::MemoryBuffer>(result->release());
  }

  virtual std::error_code writeFileContents(const std::string& path,
                                            StringRef data,
                                            bool isExecutable) override {
    int fd;
    SmallString<256> tempPath;
    if (auto ec = createUniqueFile(path + ".tmp-%%%%%%%%", fd, tempPath))
      return ec;

    {
      llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
      os << data;
      os.close();
      if (os.has_error()) {
        auto ec = os.error();
        os.clear_error();
        (void)llvm::sys::fs::remove(tempPath);
        return ec;
      }
    }

    return finishTemporary(tempPath, path, isExecutable);
  }

  virtual std::error_code copyFile(const std::string& sourcePath,
                                   const std::string& path,
                                   bool isExecutable) override {
    SmallString<256> tempPath;
    if (auto ec = createUniqueFile(path + ".tmp-%%%%%%%%", tempPath))
      return ec;
    if (auto ec = copy_file(sourcePath, tempPath)) {
      (void)llvm::sys::fs::remove(tempPath);
      return ec;
    }
    return finishTemporary(tempPath, path, isExecutable);
  }

  virtual std::error_code createSymlink(const std::string& target,
                                        const std::string& path) override {
    if (::symlink(target.c_str(), path.c_str()) != 0)
      return lastError();
    return std::error_code();
  }

  virtual bool remove(const std::string& path) override {
    // Assume `path` is a regular file.
    if (sys::unlink(path.c_str()) == 0) {
      return true;
    }

    // Error can't be that `path` is actually a directory (on Linux `EISDIR`
    // will be returned since 2.1.132).
    if (errno != EPERM && errno != EISDIR) {
      return false;
    }

    if (!getLinkInfo(path).isDirectory())
      return false;
    if (sys::rmdir(path.c_str()) == 0)
      return true;

    uint32_t count = 0;
    return !removeTree(path, count);
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }

  virtual FileInfo getLinkInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path, /*asLink:*/ true);
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}
