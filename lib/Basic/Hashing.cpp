//===-- Hashing.cpp -------------------------------------------------------===//
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

#include "sandlane/Basic/Hashing.h"

#include "llvm/ADT/StringExtras.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>

using namespace sandlane;
using namespace sandlane::basic;

namespace {

template<typename T>
static Digest makeDigest(const T& raw) {
  Digest result;
  assert(raw.size() == Digest::Size && "unexpected SHA-256 result size");
  std::copy(raw.begin(), raw.end(), result.bytes.begin());
  return result;
}

}

std::string Digest::str() const {
  return llvm::toHex(llvm::ArrayRef<uint8_t>(bytes.data(), bytes.size()),
                     /*LowerCase=*/true);
}

Optional<Digest> Digest::fromString(StringRef hex) {
  if (hex.size() != Size * 2)
    return None;

  Digest result;
  for (size_t i = 0; i != Size; ++i) {
    unsigned value;
    if (hex.substr(i * 2, 2).getAsInteger(16, value))
      return None;
    result.bytes[i] = uint8_t(value);
  }
  return result;
}

Digest Digest::ofData(StringRef data) {
  llvm::SHA256 hasher;
  hasher.update(data);
  return makeDigest(hasher.final());
}

llvm::ErrorOr<Digest> Digest::ofFile(const std::string& path) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file)
    return std::error_code(errno, std::generic_category());

  llvm::SHA256 hasher;
  uint8_t buffer[4*4096];
  size_t bytesRead = 0;
  while ((bytesRead = fread(buffer, 1, sizeof(buffer), file)) > 0) {
    hasher.update(llvm::ArrayRef<uint8_t>(buffer, bytesRead));
  }
  bool hadError = ferror(file) != 0;
  std::fclose(file);
  if (hadError)
    return std::make_error_code(std::errc::io_error);

  return makeDigest(hasher.final());
}

DigestBuilder& DigestBuilder::combine(StringRef string) {
  combine(uint64_t(string.size()));
  hasher.update(string);
  return *this;
}

DigestBuilder& DigestBuilder::combine(uint64_t value) {
  uint8_t encoded[8];
  for (unsigned i = 0; i != 8; ++i)
    encoded[i] = uint8_t(value >> (i * 8));
  hasher.update(llvm::ArrayRef<uint8_t>(encoded, 8));
  return *this;
}

Digest DigestBuilder::finish() {
  return makeDigest(hasher.final());
}
