//===-- SandboxerProtocol.cpp ---------------------------------------------===//
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

#include "sandlane/Sandbox/SandboxerProtocol.h"

#include "sandlane/Basic/PlatformUtility.h"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;
using namespace sandlane::sandbox::sandboxer_protocol;

bool FrameReader::next(uint32_t& kind_out, std::string& body_out) {
  const size_t headerSize = 8;
  if (failed || buffer.size() < headerSize)
    return false;

  // Decode the header.
  uint32_t size;
  {
    BinaryDecoder coder(StringRef(buffer.data(), headerSize));
    coder.read(size);
    coder.read(kind_out);
  }

  if (size > kMaximumFrameSize) {
    failed = true;
    return false;
  }

  // If we don't have the complete message, we are done.
  if (buffer.size() < headerSize + size)
    return false;

  body_out.assign(buffer.data() + headerSize, size);
  buffer.erase(buffer.begin(), buffer.begin() + headerSize + size);
  return true;
}

bool sandboxer_protocol::writeAll(int fd, StringRef data,
                                  std::string* error_out) {
  const char* pos = data.begin();
  while (pos < data.end()) {
    auto bytesRemaining = data.end() - pos;
    // Use send() so that a vanished peer is an error, not a SIGPIPE.
    auto n = ::send(fd, pos, bytesRemaining, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      *error_out = std::string("unable to write to socket: ") +
        sys::strerror(errno);
      return false;
    }
    pos += n;
  }
  return true;
}

int sandboxer_protocol::connectUnixSocket(StringRef path,
                                          std::string* error_out) {
  struct sockaddr_un addr{};
  if (path.size() >= sizeof(addr.sun_path)) {
    *error_out = "socket path '" + path.str() + "' is too long";
    return -1;
  }

  // Create the socket.
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    *error_out = std::string("unable to open socket: ") +
      sys::strerror(errno);
    return -1;
  }

  // Connect the socket.
  addr.sun_family = AF_UNIX;
  memcpy(addr.sun_path, path.data(), path.size());
  if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    *error_out = "unable to connect socket '" + path.str() + "': " +
      sys::strerror(errno);
    (void)::close(fd);
    return -1;
  }
  return fd;
}
