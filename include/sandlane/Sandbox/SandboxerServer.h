//===- SandboxerServer.h ----------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_SANDBOXERSERVER_H
#define SANDLANE_SANDBOX_SANDBOXERSERVER_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace sandlane {
namespace basic {
  class Logger;
}

namespace sandbox {

class SandboxProvider;

/// Exposes a \see SandboxProvider (normally the \see Materializer) to
/// \see SandboxerClient instances over a UNIX domain socket.
///
/// Each connection is served by its own thread, and the requests received on
/// a connection are processed concurrently; the provider serializes work per
/// sandbox.
class SandboxerServer {
  void *impl;

  // DO NOT COPY
  SandboxerServer(const SandboxerServer&) SANDLANE_DELETED_FUNCTION;
  void operator=(const SandboxerServer&) SANDLANE_DELETED_FUNCTION;

public:
  /// Create a server for the given provider, using a UNIX domain socket.
  ///
  /// \param path The path to the socket.
  /// \param root The sandbox root, announced to clients.
  SandboxerServer(SandboxProvider& provider, basic::Logger& logger,
                  StringRef path, StringRef root);
  ~SandboxerServer();

  /// Start the server and listen for connections.
  ///
  /// A stale socket file left by a previous server is replaced; a socket on
  /// which another server is still accepting is an error.
  ///
  /// \param error_out [out] On failure, a message describing the problem.
  /// \returns True on success.
  bool start(std::string* error_out);

  /// Shut down the server.
  ///
  /// Stops accepting connections, closes the existing ones, and waits for the
  /// requests in flight to finish.
  void shutdown();

  /// Get the number of requests served so far.
  uint64_t getRequestCount() const;
};

}
}

#endif
