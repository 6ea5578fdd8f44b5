//===-- SandboxerServer.cpp -----------------------------------------------===//
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

#include "sandlane/Sandbox/SandboxerServer.h"

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Basic/PlatformUtility.h"
#include "sandlane/Sandbox/SandboxError.h"
#include "sandlane/Sandbox/SandboxProvider.h"
#include "sandlane/Sandbox/SandboxerProtocol.h"

#include "llvm/ADT/Twine.h"

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;
using namespace sandlane::sandbox::sandboxer_protocol;

namespace {

/// The state of one client connection.
struct Connection {
  int fd;

  /// Serializes frames written to the socket.
  std::mutex writeMutex;

  /// The thread reading from the connection.
  std::thread thread;

  /// Whether the reading thread has finished.
  std::atomic<bool> finished{ false };

  explicit Connection(int fd) : fd(fd) {}
};

/// Record a failed provider call in a reply.
void fillError(Reply& reply, Error err) {
  reply.errorCode = uint32_t(SandboxErrorCode::ProtocolError);
  llvm::handleAllErrors(
      std::move(err),
      [&](const SandboxError& e) {
        reply.errorCode = uint32_t(e.getCode());
        reply.errorMessage = e.getMessage();
      },
      [&](const llvm::ErrorInfoBase& e) {
        reply.errorMessage = e.message();
      });
}

class SandboxerServerImpl {
  /// The provider the server is for.
  SandboxProvider& provider;

  Logger& logger;

  /// The path to the UNIX domain socket to listen on.
  std::string path;

  /// The sandbox root announced to clients.
  std::string root;

  /// Whether the server is listening.
  bool isConnected = false;

  /// The socket file descriptor.
  int socketFD = -1;

  /// The pipe used to wake the accept loop on shutdown.
  int wakeupPipe[2] = { -1, -1 };

  /// The thread responsible for accepting client connections.
  std::unique_ptr<std::thread> serverThread;

  /// The live connections.
  std::mutex connectionsMutex;
  std::list<std::unique_ptr<Connection>> connections;

  std::atomic<uint64_t> requestCount{ 0 };

  /// Join the threads of connections which have gone away.
  ///
  /// The connections mutex must be held.
  void pruneConnections() {
    for (auto it = connections.begin(); it != connections.end();) {
      if ((*it)->finished) {
        (*it)->thread.join();
        it = connections.erase(it);
      } else {
        ++it;
      }
    }
  }

  /// Serve connections until shutdown.
  void serve() {
    pollfd fds[] = {
      { socketFD, POLLIN, 0 },
      { wakeupPipe[0], POLLIN, 0 },
    };
    while (true) {
      if (::poll(fds, 2, -1) < 0) {
        if (errno == EINTR || errno == EAGAIN)
          continue;
        logger.error(Twine("unable to poll for connections: ") +
                     sys::strerror(errno));
        break;
      }

      // Any activity on the wakeup pipe means we are shutting down.
      if (fds[1].revents)
        break;
      if (!(fds[0].revents & POLLIN))
        continue;

      int fd = ::accept4(socketFD, nullptr, nullptr, SOCK_CLOEXEC);
      if (fd < 0) {
        if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN)
          continue;
        logger.error(Twine("unable to accept connection: ") +
                     sys::strerror(errno));
        break;
      }

      // Spawn a thread to handle this connection.
      std::lock_guard<std::mutex> guard(connectionsMutex);
      pruneConnections();
      auto connection = std::make_unique<Connection>(fd);
      Connection* conn = connection.get();
      connections.push_back(std::move(connection));
      conn->thread = std::thread(&SandboxerServerImpl::serveClient, this, conn);
    }
  }

  /// Service an individual client connection.
  void serveClient(Connection* conn) {
    FrameReader reader;
    bool announced = false;
    std::vector<std::future<void>> inflight;

    while (true) {
      char buf[4096];
      auto n = ::read(conn->fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR)
        continue;
      // If we experience errors on this connection, there is nothing we can
      // do but drop it.
      if (n <= 0)
        break;

      reader.append(StringRef(buf, n));

      uint32_t kind;
      std::string body;
      bool ok = true;
      while (ok && reader.next(kind, body)) {
        if (!announced) {
          ok = announced = processAnnouncement(conn, kind, body);
          continue;
        }

        // Requests are processed concurrently; the reply order is free.
        inflight.push_back(std::async(
            std::launch::async,
            [this, conn, kind](std::string body) {
              processRequest(conn, MessageKind(kind), body);
            }, std::move(body)));
        body.clear();

        // Forget finished requests.
        for (auto it = inflight.begin(); it != inflight.end();) {
          if (it->wait_for(std::chrono::seconds(0)) ==
              std::future_status::ready) {
            it->get();
            it = inflight.erase(it);
          } else {
            ++it;
          }
        }
      }
      if (!ok)
        break;
      if (reader.hadError()) {
        logger.error("dropping client: oversized frame");
        break;
      }
    }

    // Let the requests in flight finish before the socket goes away.
    for (auto& request: inflight)
      request.get();

    {
      std::lock_guard<std::mutex> guard(conn->writeMutex);
      (void)::close(conn->fd);
      conn->fd = -1;
    }
    logger.debug("client disconnected");
    conn->finished = true;
  }

  bool processAnnouncement(Connection* conn, uint32_t kind,
                           const std::string& body) {
    AnnounceClient msg;
    if (MessageKind(kind) != MessageKind::AnnounceClient ||
        !decodeMessage(body, msg)) {
      logger.error("dropping client: expected an announcement");
      return false;
    }
    if (msg.protocolVersion != kSandboxerProtocolVersion) {
      logger.error("dropping client '" + msg.clientName +
                   "': unsupported protocol version " +
                   Twine(msg.protocolVersion));
      return false;
    }

    logger.note("client '" + msg.clientName + "' connected");
    return send(conn, AnnounceServer{ kSandboxerProtocolVersion, root });
  }

  template<typename T>
  bool send(Connection* conn, const T& msg) {
    auto frame = encodeFrame(msg);
    std::string error;
    std::lock_guard<std::mutex> guard(conn->writeMutex);
    if (conn->fd < 0)
      return false;
    if (!writeAll(conn->fd, StringRef(reinterpret_cast<const char*>(
                                          frame.data()), frame.size()),
                  &error)) {
      logger.warning("unable to reply to client: " + error);
      return false;
    }
    return true;
  }

  /// Decode a request, reporting a malformed one in the reply.
  template<typename T>
  bool decodeRequest(const std::string& body, T& msg, Reply& reply) {
    if (decodeMessage(body, msg))
      return true;
    // Salvage the request id, when there is one, so the client can match the
    // failure to its request.
    BinaryDecoder coder(body);
    coder.read(reply.requestID);
    if (coder.hadError())
      reply.requestID = 0;
    reply.errorCode = uint32_t(SandboxErrorCode::ProtocolError);
    reply.errorMessage = "malformed request";
    return false;
  }

  void processRequest(Connection* conn, MessageKind kind,
                      const std::string& body) {
    ++requestCount;
    Reply reply{ 0, 0, "", "" };

    switch (kind) {
    case MessageKind::Materialize: {
      Materialize msg;
      if (!decodeRequest(body, msg, reply))
        break;
      reply.requestID = msg.requestID;
      auto handle = provider.materialize(msg.sandboxID, msg.files);
      if (!handle) {
        fillError(reply, handle.takeError());
        break;
      }
      logger.debug("materialized '" + msg.sandboxID + "'" +
                   (handle->reused ? " (reused)" : ""));
      reply.payload = encodePayload(*handle);
      break;
    }

    case MessageKind::BeginExecution: {
      BeginExecution msg;
      if (!decodeRequest(body, msg, reply))
        break;
      reply.requestID = msg.requestID;
      if (auto err = provider.beginExecution(msg.sandboxID))
        fillError(reply, std::move(err));
      break;
    }

    case MessageKind::CompleteExecution: {
      CompleteExecution msg;
      if (!decodeRequest(body, msg, reply))
        break;
      reply.requestID = msg.requestID;
      auto state = provider.completeExecution(msg.sandboxID, msg.succeeded);
      if (!state) {
        fillError(reply, state.takeError());
        break;
      }
      reply.payload = encodePayload(uint8_t(*state));
      break;
    }

    case MessageKind::Discard: {
      Discard msg;
      if (!decodeRequest(body, msg, reply))
        break;
      reply.requestID = msg.requestID;
      if (auto err = provider.discard(msg.sandboxID))
        fillError(reply, std::move(err));
      break;
    }

    case MessageKind::ExpireRetained: {
      ExpireRetained msg;
      if (!decodeRequest(body, msg, reply))
        break;
      reply.requestID = msg.requestID;
      auto count = provider.expireRetained(msg.now);
      if (!count) {
        fillError(reply, count.takeError());
        break;
      }
      reply.payload = encodePayload(uint32_t(*count));
      break;
    }

    default: {
      // Unknown requests still get an answer, when they carry an id.
      BinaryDecoder coder(body);
      coder.read(reply.requestID);
      if (coder.hadError())
        reply.requestID = 0;
      reply.errorCode = uint32_t(SandboxErrorCode::ProtocolError);
      reply.errorMessage = "unexpected message kind " +
        std::to_string(uint32_t(kind));
      break;
    }
    }

    if (reply.errorCode != 0)
      logger.warning("request failed: " + reply.errorMessage);
    send(conn, reply);
  }

  /// Check whether a server is accepting on the socket path.
  bool isSocketLive() {
    std::string error;
    int fd = connectUnixSocket(path, &error);
    if (fd < 0)
      return false;
    (void)::close(fd);
    return true;
  }

public:
  SandboxerServerImpl(SandboxProvider& provider, Logger& logger,
                      StringRef path, StringRef root)
      : provider(provider), logger(logger), path(path), root(root) {}

  ~SandboxerServerImpl() {
    // If the server is connected, shut it down now.
    if (isConnected) {
      shutdown();
    }
  }

  bool start(std::string* error_out) {
    assert(!isConnected && "server is already started");

    struct sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
      *error_out = "socket path '" + path + "' is too long";
      return false;
    }

    // Replace a stale socket, but never steal one from a live server.
    sys::StatStruct statbuf;
    if (sys::lstat(path.c_str(), &statbuf) == 0) {
      if (isSocketLive()) {
        *error_out = "socket '" + path + "' is in use by another server";
        return false;
      }
      if (sys::unlink(path.c_str()) != 0) {
        *error_out = "unable to remove stale socket '" + path + "': " +
          sys::strerror(errno);
        return false;
      }
    }

    // Create the socket.
    socketFD = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socketFD < 0) {
      *error_out = std::string("unable to open socket: ") +
        sys::strerror(errno);
      return false;
    }

    // Bind the socket.
    addr.sun_family = AF_UNIX;
    memcpy(addr.sun_path, path.data(), path.size());
    if (::bind(socketFD, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
      *error_out = std::string("unable to bind socket: ") +
        sys::strerror(errno);
      shutdown(/*force=*/true);
      return false;
    }

    // Begin listening for connections.
    if (::listen(socketFD, 64) < 0) {
      *error_out = std::string("unable to listen on socket: ") +
        sys::strerror(errno);
      shutdown(/*force=*/true);
      return false;
    }

    if (sys::pipe(wakeupPipe) < 0) {
      *error_out = std::string("unable to open wakeup pipe: ") +
        sys::strerror(errno);
      shutdown(/*force=*/true);
      return false;
    }

    // If we reached this far, we are connected.
    //
    // Spawn off a thread to manage the connection.
    serverThread = std::make_unique<std::thread>(
        &SandboxerServerImpl::serve, this);

    isConnected = true;
    logger.note("listening on '" + path + "'");
    return true;
  }

  void shutdown(bool force = false) {
    assert((force || isConnected) && "server is not started");

    // Wake the accept loop, and wait for it to terminate.
    if (wakeupPipe[1] >= 0) {
      char byte = 0;
      while (::write(wakeupPipe[1], &byte, 1) < 0 && errno == EINTR) {}
    }
    if (serverThread) {
      serverThread->join();
      serverThread.reset();
    }

    // Close every connection; the readers notice and wind down.
    {
      std::lock_guard<std::mutex> guard(connectionsMutex);
      for (auto& conn: connections) {
        std::lock_guard<std::mutex> writeGuard(conn->writeMutex);
        if (conn->fd >= 0)
          (void)::shutdown(conn->fd, SHUT_RDWR);
      }
      for (auto& conn: connections)
        conn->thread.join();
      connections.clear();
    }

    for (int& fd: wakeupPipe) {
      if (fd >= 0) {
        (void)sys::close(fd);
        fd = -1;
      }
    }
    if (socketFD >= 0) {
      (void)sys::close(socketFD);
      (void)sys::unlink(path.c_str());
      socketFD = -1;
    }

    isConnected = false;
  }

  uint64_t getRequestCount() const { return requestCount; }
};

}

SandboxerServer::SandboxerServer(SandboxProvider& provider, Logger& logger,
                                 StringRef path, StringRef root)
    : impl(new SandboxerServerImpl(provider, logger, path, root))
{
}

SandboxerServer::~SandboxerServer() {
  delete static_cast<SandboxerServerImpl*>(impl);
}

bool SandboxerServer::start(std::string* error_out) {
  return static_cast<SandboxerServerImpl*>(impl)->start(error_out);
}

void SandboxerServer::shutdown() {
  static_cast<SandboxerServerImpl*>(impl)->shutdown();
}

uint64_t SandboxerServer::getRequestCount() const {
  return static_cast<SandboxerServerImpl*>(impl)->getRequestCount();
}
