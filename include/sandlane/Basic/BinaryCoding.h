//===- BinaryCoding.h -------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_BASIC_BINARYCODING_H
#define SANDLANE_BASIC_BINARYCODING_H

#include "sandlane/Basic/Compiler.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cassert>
#include <string>
#include <vector>

namespace sandlane {
namespace basic {

template<typename T>
struct BinaryCodingTraits {
  // static inline void encode(const T&, BinaryEncoder&);
  // static inline void decode(T&, BinaryDecoder&);
};

/// A basic binary encoding utility.
///
/// This encoder is designed for small, relatively efficient coding of objects
/// exchanged between the coordinator and the sandboxer. It is endian-neutral
/// (values are written little-endian), and should be paired with \see
/// BinaryDecoder for decoding.
///
/// The utility supports coding of user-defined types via specialization of the
/// BinaryCodingTraits type.
class BinaryEncoder {
private:
  // Copying is disabled.
  BinaryEncoder(const BinaryEncoder&) SANDLANE_DELETED_FUNCTION;
  void operator=(const BinaryEncoder&) SANDLANE_DELETED_FUNCTION;

  /// The encoded data.
  llvm::SmallVector<uint8_t, 256> data;

public:
  /// Construct a new binary encoder.
  BinaryEncoder() {}

  /// Encode a value to the stream.
  void write(bool value) {
    write(uint8_t(value ? 1 : 0));
  }

  /// Encode a value to the stream.
  void write(uint8_t value) {
    data.push_back(value);
  }

  /// Encode a value to the stream.
  void write(uint16_t value) {
    write(uint8_t(value >> 0));
    write(uint8_t(value >> 8));
  }

  /// Encode a value to the stream.
  void write(uint32_t value) {
    write(uint16_t(value >> 0));
    write(uint16_t(value >> 16));
  }

  /// Encode a value to the stream.
  void write(uint64_t value) {
    write(uint32_t(value >> 0));
    write(uint32_t(value >> 32));
  }

  /// Encode a sequence of bytes to the stream.
  void writeBytes(StringRef bytes) {
    data.insert(data.end(), bytes.begin(), bytes.end());
  }

  /// Encode a value to the stream.
  template<typename T>
  void write(const T& value) {
    BinaryCodingTraits<T>::encode(value, *this);
  }

  /// Get the encoded binary data.
  std::vector<uint8_t> contents() {
    return std::vector<uint8_t>(data.begin(), data.end());
  }
};

/// A basic binary decoding utility.
///
/// Unlike the encoder, the decoder is fed data received from another process,
/// so it never reads past the end of its input: a short read marks the
/// decoder as having failed and yields zero values. Clients must check \see
/// hadError() (or the result of \see finish()) before trusting the decoded
/// values.
///
/// \see BinaryEncoder.
class BinaryDecoder {
private:
  // Copying is disabled.
  BinaryDecoder(const BinaryDecoder&) SANDLANE_DELETED_FUNCTION;
  void operator=(const BinaryDecoder&) SANDLANE_DELETED_FUNCTION;

  /// The data being decoded.
  StringRef data;

  /// The current position in the stream.
  uint64_t pos = 0;

  /// Whether a read ran past the end of the data.
  bool failed = false;

  uint8_t read8() {
    if (pos >= data.size()) {
      failed = true;
      return 0;
    }
    return data[pos++];
  }
  uint16_t read16() {
    uint16_t result = read8();
    result |= uint16_t(read8()) << 8;
    return result;
  }
  uint32_t read32() {
    uint32_t result = read16();
    result |= uint32_t(read16()) << 16;
    return result;
  }
  uint64_t read64() {
    uint64_t result = read32();
    result |= uint64_t(read32()) << 32;
    return result;
  }

public:
  /// Construct a binary decoder.
  BinaryDecoder(StringRef data) : data(data) {}

  /// Construct a binary decoder.
  ///
  /// NOTE: The input data is supplied by reference, and its lifetime must
  /// exceed that of the decoder.
  BinaryDecoder(const std::vector<uint8_t>& data) : BinaryDecoder(
      StringRef(reinterpret_cast<const char*>(data.data()), data.size())) {}

  /// Check if the decoder is at the end of the stream.
  bool isEmpty() const {
    return pos == data.size();
  }

  /// Check if any read ran past the end of the stream.
  bool hadError() const { return failed; }

  /// Decode a value from the stream.
  void read(bool& value) { value = read8() != 0; }

  /// Decode a value from the stream.
  void read(uint8_t& value) { value = read8(); }

  /// Decode a value from the stream.
  void read(uint16_t& value) { value = read16(); }

  /// Decode a value from the stream.
  void read(uint32_t& value) { value = read32(); }

  /// Decode a value from the stream.
  void read(uint64_t& value) { value = read64(); }

  /// Decode a byte string from the stream.
  ///
  /// NOTE: The return value points into the decode stream, and must be copied
  /// by clients if it is to last longer than the lifetime of the decoder.
  void readBytes(size_t count, StringRef& value) {
    if (failed || count > data.size() - pos) {
      failed = true;
      value = StringRef();
      return;
    }
    value = StringRef(data.begin() + pos, count);
    pos += count;
  }

  /// Decode a value from the stream.
  template<typename T>
  void read(T& value) {
    BinaryCodingTraits<T>::decode(value, *this);
  }

  /// Finish decoding.
  ///
  /// \returns True if the entire stream was consumed without error.
  bool finish() {
    return !failed && isEmpty();
  }
};

template<>
struct BinaryCodingTraits<std::string> {
  static inline void encode(const std::string& value, BinaryEncoder& coder) {
    coder.write(uint32_t(value.size()));
    coder.writeBytes(value);
  }
  static inline void decode(std::string& value, BinaryDecoder& coder) {
    uint32_t size;
    coder.read(size);
    StringRef bytes;
    coder.readBytes(size, bytes);
    value = bytes.str();
  }
};

template<typename T>
struct BinaryCodingTraits<std::vector<T>> {
  static inline void encode(const std::vector<T>& value,
                            BinaryEncoder& coder) {
    coder.write(uint32_t(value.size()));
    for (const auto& element: value)
      coder.write(element);
  }
  static inline void decode(std::vector<T>& value, BinaryDecoder& coder) {
    uint32_t size;
    coder.read(size);
    value.clear();
    for (uint32_t i = 0; i != size && !coder.hadError(); ++i) {
      T element{};
      coder.read(element);
      value.push_back(std::move(element));
    }
  }
};

}
}

#endif
