//===- SandboxerClient.h ----------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_SANDBOX_SANDBOXERCLIENT_H
#define SANDLANE_SANDBOX_SANDBOXERCLIENT_H

#include "sandlane/Basic/LLVM.h"
#include "sandlane/Sandbox/SandboxProvider.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace sandlane {
namespace basic {
  class Logger;
}

namespace sandbox {

/// The coordinator side proxy of the sandboxer sidecar.
///
/// One connection is shared by every caller; concurrent requests are
/// multiplexed over it by request id. If the connection is lost, the requests
/// in flight and all later ones fail with
/// \see SandboxErrorCode::SidecarUnavailable; the client never falls back to
/// materializing in-process.
class SandboxerClient : public SandboxProvider {
  void *impl;

public:
  /// Create a client for the sandboxer listening at \p path.
  ///
  /// \param clientName A name identifying the client in the sandboxer's logs.
  SandboxerClient(StringRef path, StringRef clientName, basic::Logger& logger);
  ~SandboxerClient() override;

  /// Connect to the sandboxer and exchange announcements.
  ///
  /// \returns A SandboxError: SidecarUnavailable if the sandboxer can not be
  /// reached, ProtocolError if it speaks another protocol version.
  Error connect();

  /// Drop the connection.
  void disconnect();

  bool isConnected() const;

  /// Get the sandbox root announced by the sandboxer.
  const std::string& getServerRoot() const;

  /// @name SandboxProvider API
  /// @{

  Expected<SandboxHandle> materialize(StringRef id,
                                      const FileSet& files) override;
  Error beginExecution(StringRef id) override;
  Expected<SandboxState> completeExecution(StringRef id,
                                           bool succeeded) override;
  Error discard(StringRef id) override;
  Expected<unsigned> expireRetained(uint64_t now) override;

  /// @}
};

}
}

#endif
