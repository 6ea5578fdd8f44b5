//===- PlatformUtility.h ----------------------------------------*- C++ -*-===//
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
//
// This file implements small platform compatibility wrapper functions for
// common functions.
//
//===----------------------------------------------------------------------===//

#ifndef SANDLANE_BASIC_PLATFORMUTILITY_H
#define SANDLANE_BASIC_PLATFORMUTILITY_H

#include <cstdint>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace sandlane {
namespace basic {
namespace sys {

typedef pid_t ProcessID;
typedef int FD;
typedef struct ::stat StatStruct;

int close(int fileHandle);
int lstat(const char *fileName, StatStruct *buf);
bool mkdir(const char *fileName);
int pipe(int ptHandles[2]);
int read(int fileHandle, void *destinationBuffer, unsigned int maxCharCount);
int rmdir(const char *path);
int stat(const char *fileName, StatStruct *buf);
int unlink(const char *fileName);
int write(int fileHandle, const void *sourceBuffer, unsigned int count);
std::string strerror(int error);

/// Get the number of CPUs available to this process, at least one.
unsigned getNumberOfCPUs();

template <typename = FD> struct FileDescriptorTraits;

template <> struct FileDescriptorTraits<int> {
  using DescriptorType = int;
  static constexpr int InvalidDescriptor = -1;
  static bool IsValid(int fd) { return fd >= 0; }
  static void Close(int fd) { sys::close(fd); }
  static int Read(int hFile, void *destinationBuffer,
                  unsigned int maxCharCount) {
    return sys::read(hFile, destinationBuffer, maxCharCount);
  }
};

}
}
}

#endif
