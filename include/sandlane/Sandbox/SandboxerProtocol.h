//===- SandboxerProtocol.h --------------------------------------*- C++ -*-===//
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
// This file defines the codable structures which represent the binary protocol
// used by the \see SandboxerServer and \see SandboxerClient.
//
//===----------------------------------------------------------------------===//

#ifndef SANDLANE_SANDBOX_SANDBOXERPROTOCOL_H
#define SANDLANE_SANDBOX_SANDBOXERPROTOCOL_H

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/LLVM.h"
#include "sandlane/Sandbox/FileSet.h"
#include "sandlane/Sandbox/SandboxHandle.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sandlane {
namespace sandbox {
namespace sandboxer_protocol {

/// A constant defining the current protocol version.
///
/// This should be changed any time the protocol is extended.
///
/// Version History:
///
/// 1: Initial revision.
const uint32_t kSandboxerProtocolVersion = 1;

/// The largest frame body either side accepts.
const uint32_t kMaximumFrameSize = 256 * 1024 * 1024;

// MARK: Message Types

// The basic protocol consists of objects encoded using the BinaryCoding
// interface (values are little-endian, for example).
//
// The protocol is a sequence of frames:
//
//   frame := size :: kind :: message
//   size := <uint32_t>, the size of the message
//   kind := <uint32_t>
//
// The client opens with AnnounceClient and the server answers with
// AnnounceServer. After that every request carries a client chosen request
// id, which is echoed by the single Reply answering it. Replies may arrive in
// any order, requests are processed concurrently.

enum class MessageKind : uint32_t {
  /// Announce a client, this should always be the first message from a client.
  AnnounceClient = 0,

  /// The server's answer to AnnounceClient.
  AnnounceServer,

  Materialize,
  BeginExecution,
  CompleteExecution,
  Discard,
  ExpireRetained,

  /// The answer to any request.
  Reply,
};

struct AnnounceClient {
  static constexpr MessageKind messageKind = MessageKind::AnnounceClient;

  /// The protocol version in use by the client, \see
  /// kSandboxerProtocolVersion.
  uint32_t protocolVersion;

  /// A name identifying the client, for diagnostics.
  std::string clientName;
};

struct AnnounceServer {
  static constexpr MessageKind messageKind = MessageKind::AnnounceServer;

  uint32_t protocolVersion;

  /// The sandbox root the server materializes into.
  std::string root;
};

struct Materialize {
  static constexpr MessageKind messageKind = MessageKind::Materialize;

  uint64_t requestID;
  std::string sandboxID;
  FileSet files;
};

struct BeginExecution {
  static constexpr MessageKind messageKind = MessageKind::BeginExecution;

  uint64_t requestID;
  std::string sandboxID;
};

struct CompleteExecution {
  static constexpr MessageKind messageKind = MessageKind::CompleteExecution;

  uint64_t requestID;
  std::string sandboxID;
  bool succeeded;
};

struct Discard {
  static constexpr MessageKind messageKind = MessageKind::Discard;

  uint64_t requestID;
  std::string sandboxID;
};

struct ExpireRetained {
  static constexpr MessageKind messageKind = MessageKind::ExpireRetained;

  uint64_t requestID;

  /// The reference time, in seconds since the epoch.
  uint64_t now;
};

struct Reply {
  static constexpr MessageKind messageKind = MessageKind::Reply;

  uint64_t requestID;

  /// Zero on success, otherwise the \see SandboxErrorCode of the failure.
  uint32_t errorCode;

  std::string errorMessage;

  /// The encoded result of a successful request: a SandboxHandle for
  /// Materialize, a SandboxState (as uint8_t) for CompleteExecution, a count
  /// (as uint32_t) for ExpireRetained, and nothing otherwise.
  std::string payload;
};

// MARK: Message IO

/// Encode a complete frame for \p msg.
template<typename T>
std::vector<uint8_t> encodeFrame(const T& msg) {
  // Encode the message with reserved space for the size (backpatched below).
  basic::BinaryEncoder coder{};
  coder.write(uint32_t(0));
  coder.write(uint32_t(T::messageKind));
  coder.write(msg);
  auto contents = coder.contents();

  // Backpatch the size.
  uint32_t size = uint32_t(contents.size() - 8);
  contents[0] = uint8_t(size >> 0);
  contents[1] = uint8_t(size >> 8);
  contents[2] = uint8_t(size >> 16);
  contents[3] = uint8_t(size >> 24);
  return contents;
}

/// Encode a value into a reply payload.
template<typename T>
std::string encodePayload(const T& value) {
  basic::BinaryEncoder coder{};
  coder.write(value);
  auto contents = coder.contents();
  return std::string(contents.begin(), contents.end());
}

/// Decode a complete message body.
///
/// \returns False if the body is truncated or has trailing bytes.
template<typename T>
bool decodeMessage(StringRef data, T& value) {
  basic::BinaryDecoder coder(data);
  coder.read(value);
  return coder.finish();
}

/// Accumulates bytes read from a socket and splits them into frames.
class FrameReader {
  llvm::SmallVector<char, 4096> buffer;
  bool failed = false;

public:
  /// Append received bytes.
  void append(StringRef data) { buffer.append(data.begin(), data.end()); }

  /// Extract the next complete frame, if any.
  ///
  /// \param kind_out [out] The kind of the frame.
  /// \param body_out [out] The message body.
  /// \returns True if a frame was extracted.
  bool next(uint32_t& kind_out, std::string& body_out);

  /// Check whether a frame header announced an oversized frame; the stream
  /// can not be resynchronized after that.
  bool hadError() const { return failed; }
};

/// Write all of \p data to the socket \p fd.
///
/// \returns True on success, otherwise false with \p error_out set.
bool writeAll(int fd, StringRef data, std::string* error_out);

/// Connect a stream socket to the UNIX domain socket at \p path.
///
/// \returns The connected descriptor, or -1 with \p error_out set.
int connectUnixSocket(StringRef path, std::string* error_out);

}
}

namespace basic {

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::AnnounceClient> {
  typedef sandbox::sandboxer_protocol::AnnounceClient T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.protocolVersion);
    coder.write(value.clientName);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.protocolVersion);
    coder.read(value.clientName);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::AnnounceServer> {
  typedef sandbox::sandboxer_protocol::AnnounceServer T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.protocolVersion);
    coder.write(value.root);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.protocolVersion);
    coder.read(value.root);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::Materialize> {
  typedef sandbox::sandboxer_protocol::Materialize T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.requestID);
    coder.write(value.sandboxID);
    coder.write(value.files);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.requestID);
    coder.read(value.sandboxID);
    coder.read(value.files);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::BeginExecution> {
  typedef sandbox::sandboxer_protocol::BeginExecution T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.requestID);
    coder.write(value.sandboxID);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.requestID);
    coder.read(value.sandboxID);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::CompleteExecution> {
  typedef sandbox::sandboxer_protocol::CompleteExecution T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.requestID);
    coder.write(value.sandboxID);
    coder.write(value.succeeded);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.requestID);
    coder.read(value.sandboxID);
    coder.read(value.succeeded);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::Discard> {
  typedef sandbox::sandboxer_protocol::Discard T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.requestID);
    coder.write(value.sandboxID);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.requestID);
    coder.read(value.sandboxID);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::ExpireRetained> {
  typedef sandbox::sandboxer_protocol::ExpireRetained T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.requestID);
    coder.write(value.now);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.requestID);
    coder.read(value.now);
  }
};

template<>
struct BinaryCodingTraits<sandbox::sandboxer_protocol::Reply> {
  typedef sandbox::sandboxer_protocol::Reply T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(value.requestID);
    coder.write(value.errorCode);
    coder.write(value.errorMessage);
    coder.write(value.payload);
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    coder.read(value.requestID);
    coder.read(value.errorCode);
    coder.read(value.errorMessage);
    coder.read(value.payload);
  }
};

}
}

#endif
