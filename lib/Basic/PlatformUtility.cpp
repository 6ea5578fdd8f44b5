//===-- PlatformUtility.cpp -----------------------------------------------===//
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

#include "sandlane/Basic/PlatformUtility.h"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#if defined(__linux__)
#include <sched.h>
#endif

using namespace sandlane;
using namespace sandlane::basic;

int sys::close(int fileHandle) {
  return ::close(fileHandle);
}

int sys::lstat(const char *fileName, sys::StatStruct *buf) {
  return ::lstat(fileName, buf);
}

bool sys::mkdir(const char* fileName) {
  return ::mkdir(fileName, S_IRWXU | S_IRWXG | S_IRWXO) == 0;
}

int sys::pipe(int ptHandles[2]) {
#if defined(__linux__)
  return ::pipe2(ptHandles, O_CLOEXEC);
#else
  return ::pipe(ptHandles);
#endif
}

int sys::read(int fileHandle, void *destinationBuffer,
              unsigned int maxCharCount) {
  return ::read(fileHandle, destinationBuffer, maxCharCount);
}

int sys::rmdir(const char *path) {
  return ::rmdir(path);
}

int sys::stat(const char *fileName, StatStruct *buf) {
  return ::stat(fileName, buf);
}

int sys::unlink(const char *fileName) {
  return ::unlink(fileName);
}

int sys::write(int fileHandle, const void *sourceBuffer,
               unsigned int count) {
  return ::write(fileHandle, sourceBuffer, count);
}

std::string sys::strerror(int error) {
  return ::strerror(error);
}

unsigned sys::getNumberOfCPUs() {
#if defined(__linux__)
  // Respect the affinity mask, so that a restricted container is not
  // oversubscribed.
  cpu_set_t set;
  CPU_ZERO(&set);
  if (sched_getaffinity(0, sizeof(set), &set) == 0) {
    int count = CPU_COUNT(&set);
    if (count > 0)
      return unsigned(count);
  }
#endif
  unsigned count = std::thread::hardware_concurrency();
  return count ? count : 1;
}
