//===- Hashing.h ------------------------------------------------*- C++ -*-===//
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

#ifndef SANDLANE_BASIC_HASHING_H
#define SANDLANE_BASIC_HASHING_H

#include "sandlane/Basic/BinaryCoding.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/ErrorOr.h"
#include "llvm/Support/SHA256.h"

#include <array>
#include <cstdint>
#include <string>

namespace sandlane {
namespace basic {

/// A SHA-256 content digest.
struct Digest {
  static constexpr size_t Size = 32;

  std::array<uint8_t, Size> bytes{};

  bool isNull() const {
    for (auto b: bytes)
      if (b != 0) return false;
    return true;
  }

  bool operator==(const Digest& rhs) const { return bytes == rhs.bytes; }
  bool operator!=(const Digest& rhs) const { return bytes != rhs.bytes; }
  bool operator<(const Digest& rhs) const { return bytes < rhs.bytes; }

  /// Get the lowercase hexadecimal form of the digest.
  std::string str() const;

  /// Parse a digest from its hexadecimal form.
  static Optional<Digest> fromString(StringRef hex);

  /// Compute the digest of the given bytes.
  static Digest ofData(StringRef data);

  /// Compute the digest of the contents of the file at \p path.
  static llvm::ErrorOr<Digest> ofFile(const std::string& path);
};

/// Incrementally combines values into a single digest.
///
/// Each value is framed with its length, so that adjacent strings can not be
/// confused with each other (("ab", "c") and ("a", "bc") differ).
class DigestBuilder {
  llvm::SHA256 hasher;

public:
  DigestBuilder() = default;

  DigestBuilder& combine(StringRef string);

  DigestBuilder& combine(const std::string& string) {
    return combine(StringRef(string));
  }

  DigestBuilder& combine(const char* string) {
    return combine(StringRef(string));
  }

  DigestBuilder& combine(uint64_t value);

  DigestBuilder& combine(bool b) {
    return combine(uint64_t(b ? 1 : 0));
  }

  DigestBuilder& combine(const Digest& digest) {
    hasher.update(llvm::ArrayRef<uint8_t>(digest.bytes.data(),
                                          digest.bytes.size()));
    return *this;
  }

  /// Produce the digest; the builder must not be used afterwards.
  Digest finish();
};

template<>
struct BinaryCodingTraits<Digest> {
  static inline void encode(const Digest& value, BinaryEncoder& coder) {
    for (auto b: value.bytes)
      coder.write(b);
  }
  static inline void decode(Digest& value, BinaryDecoder& coder) {
    for (auto& b: value.bytes)
      coder.read(b);
  }
};

}
}

#endif
