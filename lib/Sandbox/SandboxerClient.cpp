//===-- SandboxerClient.cpp -----------------------------------------------===//
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

#include "sandlane/Sandbox/SandboxerClient.h"

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Basic/PlatformUtility.h"
#include "sandlane/Sandbox/SandboxError.h"
#include "sandlane/Sandbox/SandboxerProtocol.h"

#include "llvm/ADT/Twine.h"

#include <atomic>
#include <cerrno>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;
using namespace sandlane::sandbox::sandboxer_protocol;

namespace {

/// How long to wait for the sandboxer to answer the announcement.
const int kAnnounceTimeoutMs = 10000;

class SandboxerClientImpl {
  /// The path to the UNIX domain socket to connect on.
  std::string path;

  std::string clientName;

  Logger& logger;

  /// The sandbox root announced by the server.
  std::string serverRoot;

  /// The socket file descriptor. Writers read it under the write mutex, and
  /// it is only closed while holding that mutex.
  int socketFD = -1;

  /// Serializes frames written to the socket.
  std::mutex writeMutex;

  /// Serializes connecting and disconnecting.
  std::mutex connectionMutex;

  /// The thread reading replies.
  std::unique_ptr<std::thread> readerThread;

  /// The mutex protecting the connection state and the pending requests.
  mutable std::mutex stateMutex;

  /// Whether the connection is usable.
  bool connected = false;

  /// Why the connection was lost, if it was.
  std::string lostReason;

  /// The requests awaiting a reply, by request id.
  std::unordered_map<uint64_t, std::promise<Reply>> pending;

  uint64_t nextRequestID = 1;

  Error makeUnavailableError(const Twine& reason) {
    return makeSandboxError(SandboxErrorCode::SidecarUnavailable,
                            "sandboxer at '" + path + "' is unavailable: " +
                            reason);
  }

  /// Fail every pending request; the state mutex must be held.
  void failPending(const std::string& reason) {
    for (auto& entry: pending) {
      Reply reply{ entry.first,
                   uint32_t(SandboxErrorCode::SidecarUnavailable),
                   reason, "" };
      entry.second.set_value(reply);
    }
    pending.clear();
  }

  /// Read and dispatch replies until the connection drops.
  void readReplies(std::unique_ptr<FrameReader> reader) {
    std::string reason = "connection closed by sandboxer";
    while (true) {
      uint32_t kind;
      std::string body;
      bool protocolError = false;
      while (reader->next(kind, body)) {
        Reply reply;
        if (MessageKind(kind) != MessageKind::Reply ||
            !decodeMessage(body, reply)) {
          protocolError = true;
          break;
        }
        dispatchReply(std::move(reply));
      }
      if (protocolError || reader->hadError()) {
        reason = "malformed message from sandboxer";
        break;
      }

      char buf[4096];
      auto n = ::read(socketFD, buf, sizeof(buf));
      if (n < 0 && errno == EINTR)
        continue;
      if (n < 0) {
        reason = std::string("unable to read from sandboxer: ") +
          sys::strerror(errno);
        break;
      }
      if (n == 0)
        break;
      reader->append(StringRef(buf, n));
    }

    std::lock_guard<std::mutex> guard(stateMutex);
    if (connected)
      logger.error("lost connection to sandboxer: " + reason);
    connected = false;
    lostReason = reason;
    failPending(reason);
  }

  void dispatchReply(Reply reply) {
    std::lock_guard<std::mutex> guard(stateMutex);
    auto it = pending.find(reply.requestID);
    if (it == pending.end()) {
      logger.warning("ignoring reply to unknown request " +
                     Twine(reply.requestID));
      return;
    }
    it->second.set_value(std::move(reply));
    pending.erase(it);
  }

  bool writeFrame(const std::vector<uint8_t>& frame, std::string* error_out) {
    std::lock_guard<std::mutex> guard(writeMutex);
    if (socketFD < 0) {
      if (error_out)
        *error_out = "not connected";
      return false;
    }
    return writeAll(socketFD, StringRef(reinterpret_cast<const char*>(
                                            frame.data()), frame.size()),
                    error_out);
  }

  /// Send a request and wait for its reply.
  template<typename T>
  Expected<std::string> request(T msg) {
    std::future<Reply> future;
    {
      std::lock_guard<std::mutex> guard(stateMutex);
      if (!connected) {
        return makeUnavailableError(lostReason.empty() ? "not connected" :
                                    lostReason);
      }
      msg.requestID = nextRequestID++;
      future = pending[msg.requestID].get_future();
    }

    std::string error;
    if (!writeFrame(encodeFrame(msg), &error)) {
      std::lock_guard<std::mutex> guard(stateMutex);
      // The reader may have failed the request already.
      pending.erase(msg.requestID);
      return makeUnavailableError(error);
    }

    Reply reply = future.get();
    if (reply.errorCode != 0) {
      auto code = SandboxErrorCode(reply.errorCode);
      if (reply.errorCode > uint32_t(SandboxErrorCode::ProtocolError))
        code = SandboxErrorCode::ProtocolError;
      if (code == SandboxErrorCode::SidecarUnavailable)
        return makeUnavailableError(reply.errorMessage);
      return makeSandboxError(code, reply.errorMessage);
    }
    return std::move(reply.payload);
  }

  static Error makeMalformedReplyError() {
    return makeSandboxError(SandboxErrorCode::ProtocolError,
                            "malformed reply from sandboxer");
  }

public:
  SandboxerClientImpl(StringRef path, StringRef clientName, Logger& logger)
      : path(path), clientName(clientName), logger(logger) {}

  ~SandboxerClientImpl() {
    disconnect();
  }

  Error connect() {
    std::lock_guard<std::mutex> connectionGuard(connectionMutex);
    {
      std::lock_guard<std::mutex> guard(stateMutex);
      if (connected)
        return Error::success();
    }
    closeConnection();

    std::string error;
    int fd = connectUnixSocket(path, &error);
    if (fd < 0)
      return makeUnavailableError(error);
    {
      std::lock_guard<std::mutex> guard(writeMutex);
      socketFD = fd;
    }

    // Send the introductory message.
    if (!writeFrame(encodeFrame(AnnounceClient{ kSandboxerProtocolVersion,
                                                clientName }), &error)) {
      closeConnection();
      return makeUnavailableError(error);
    }

    // Wait for the server's announcement.
    auto reader = std::make_unique<FrameReader>();
    uint32_t kind;
    std::string body;
    while (!reader->next(kind, body)) {
      if (reader->hadError()) {
        closeConnection();
        return makeSandboxError(SandboxErrorCode::ProtocolError,
                                "malformed announcement from sandboxer");
      }

      pollfd readfd = { socketFD, POLLIN, 0 };
      int result = ::poll(&readfd, 1, kAnnounceTimeoutMs);
      if (result < 0 && errno == EINTR)
        continue;
      if (result <= 0) {
        closeConnection();
        return makeUnavailableError(result == 0 ?
                                    std::string("no announcement received") :
                                    sys::strerror(errno));
      }

      char buf[4096];
      auto n = ::read(socketFD, buf, sizeof(buf));
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0) {
        closeConnection();
        return makeUnavailableError("connection closed during announcement");
      }
      reader->append(StringRef(buf, n));
    }

    AnnounceServer announcement;
    if (MessageKind(kind) != MessageKind::AnnounceServer ||
        !decodeMessage(body, announcement)) {
      closeConnection();
      return makeSandboxError(SandboxErrorCode::ProtocolError,
                              "expected an announcement from sandboxer");
    }
    if (announcement.protocolVersion != kSandboxerProtocolVersion) {
      closeConnection();
      return makeSandboxError(SandboxErrorCode::ProtocolError,
                              "sandboxer speaks protocol version " +
                              Twine(announcement.protocolVersion) +
                              ", expected " +
                              Twine(kSandboxerProtocolVersion));
    }
    serverRoot = announcement.root;

    {
      std::lock_guard<std::mutex> guard(stateMutex);
      connected = true;
      lostReason.clear();
    }
    readerThread = std::make_unique<std::thread>(
        &SandboxerClientImpl::readReplies, this, std::move(reader));
    logger.debug("connected to sandboxer at '" + path + "'");
    return Error::success();
  }

  /// Close the socket and fail outstanding requests; the connection mutex
  /// must be held.
  void closeConnection() {
    {
      std::lock_guard<std::mutex> guard(stateMutex);
      connected = false;
      if (lostReason.empty())
        lostReason = "disconnected";
    }
    // Unblocks the reader and any writer stuck on a full socket.
    if (socketFD >= 0)
      (void)::shutdown(socketFD, SHUT_RDWR);
    if (readerThread) {
      readerThread->join();
      readerThread.reset();
    }
    {
      std::lock_guard<std::mutex> guard(writeMutex);
      if (socketFD >= 0) {
        (void)sys::close(socketFD);
        socketFD = -1;
      }
    }

    std::lock_guard<std::mutex> guard(stateMutex);
    failPending(lostReason);
  }

  void disconnect() {
    std::lock_guard<std::mutex> guard(connectionMutex);
    closeConnection();
  }

  bool isConnected() const {
    std::lock_guard<std::mutex> guard(stateMutex);
    return connected;
  }

  const std::string& getServerRoot() const { return serverRoot; }

  Expected<SandboxHandle> materialize(StringRef id, const FileSet& files) {
    auto payload = request(Materialize{ 0, id.str(), files });
    if (!payload)
      return payload.takeError();
    SandboxHandle handle;
    if (!decodeMessage(*payload, handle))
      return makeMalformedReplyError();
    return handle;
  }

  Error beginExecution(StringRef id) {
    auto payload = request(BeginExecution{ 0, id.str() });
    if (!payload)
      return payload.takeError();
    return Error::success();
  }

  Expected<SandboxState> completeExecution(StringRef id, bool succeeded) {
    auto payload = request(CompleteExecution{ 0, id.str(), succeeded });
    if (!payload)
      return payload.takeError();
    uint8_t state;
    if (!decodeMessage(*payload, state) ||
        state > uint8_t(SandboxState::Discarded))
      return makeMalformedReplyError();
    return SandboxState(state);
  }

  Error discard(StringRef id) {
    auto payload = request(Discard{ 0, id.str() });
    if (!payload)
      return payload.takeError();
    return Error::success();
  }

  Expected<unsigned> expireRetained(uint64_t now) {
    auto payload = request(ExpireRetained{ 0, now });
    if (!payload)
      return payload.takeError();
    uint32_t count;
    if (!decodeMessage(*payload, count))
      return makeMalformedReplyError();
    return unsigned(count);
  }
};

}

SandboxerClient::SandboxerClient(StringRef path, StringRef clientName,
                                 Logger& logger)
    : impl(new SandboxerClientImpl(path, clientName, logger))
{
}

SandboxerClient::~SandboxerClient() {
  delete static_cast<SandboxerClientImpl*>(impl);
}

Error SandboxerClient::connect() {
  return static_cast<SandboxerClientImpl*>(impl)->connect();
}

void SandboxerClient::disconnect() {
  static_cast<SandboxerClientImpl*>(impl)->disconnect();
}

bool SandboxerClient::isConnected() const {
  return static_cast<SandboxerClientImpl*>(impl)->isConnected();
}

const std::string& SandboxerClient::getServerRoot() const {
  return static_cast<SandboxerClientImpl*>(impl)->getServerRoot();
}

Expected<SandboxHandle> SandboxerClient::materialize(StringRef id,
                                                     const FileSet& files) {
  return static_cast<SandboxerClientImpl*>(impl)->materialize(id, files);
}

Error SandboxerClient::beginExecution(StringRef id) {
  return static_cast<SandboxerClientImpl*>(impl)->beginExecution(id);
}

Expected<SandboxState> SandboxerClient::completeExecution(StringRef id,
                                                          bool succeeded) {
  return static_cast<SandboxerClientImpl*>(impl)->completeExecution(id,
                                                                    succeeded);
}

Error SandboxerClient::discard(StringRef id) {
  return static_cast<SandboxerClientImpl*>(impl)->discard(id);
}

Expected<unsigned> SandboxerClient::expireRetained(uint64_t now) {
  return static_cast<SandboxerClientImpl*>(impl)->expireRetained(now);
}
