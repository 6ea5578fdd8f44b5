//===- FileSet.h ------------------------------------------------*- C++ -*-===//
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
// This file defines the set of input entries materialized into a sandbox.
//
//===----------------------------------------------------------------------===//

#ifndef SANDLANE_SANDBOX_FILESET_H
#define SANDLANE_SANDBOX_FILESET_H

#include "sandlane/Basic/Hashing.h"
#include "sandlane/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sandlane {
namespace sandbox {

/// One entry of a sandbox's input file set.
class InputEntry {
public:
  enum class Kind : uint8_t {
    /// A file written from inline bytes.
    Content = 0,

    /// A file copied from a host path.
    Copy,

    /// A symbolic link.
    Symlink,

    /// An empty directory.
    Directory,
  };

private:
  Kind kind;

  /// The path of the entry, relative to the sandbox root.
  std::string path;

  /// The kind specific payload: the contents, the source path or the link
  /// target.
  std::string data;

  bool executable;

  InputEntry(Kind kind, StringRef path, StringRef data, bool executable)
      : kind(kind), path(path), data(data), executable(executable) {}

public:
  InputEntry() : InputEntry(Kind::Directory, "", "", false) {}

  /// Create an entry from its kind and kind specific payload.
  static InputEntry make(Kind kind, StringRef path, StringRef data,
                         bool isExecutable) {
    return InputEntry(kind, path, data, isExecutable);
  }

  static InputEntry makeContent(StringRef path, StringRef contents,
                                bool isExecutable = false) {
    return InputEntry(Kind::Content, path, contents, isExecutable);
  }
  static InputEntry makeCopy(StringRef path, StringRef sourcePath,
                             bool isExecutable = false) {
    return InputEntry(Kind::Copy, path, sourcePath, isExecutable);
  }
  static InputEntry makeSymlink(StringRef path, StringRef target) {
    return InputEntry(Kind::Symlink, path, target, false);
  }
  static InputEntry makeDirectory(StringRef path) {
    return InputEntry(Kind::Directory, path, "", false);
  }

  Kind getKind() const { return kind; }
  const std::string& getPath() const { return path; }
  bool isExecutable() const { return executable; }

  /// Get the bytes of a `Content` entry.
  const std::string& getContents() const { return data; }

  /// Get the host path of a `Copy` entry.
  const std::string& getSourcePath() const { return data; }

  /// Get the target of a `Symlink` entry.
  const std::string& getTarget() const { return data; }

  void setPath(StringRef value) { path = value.str(); }

  bool operator==(const InputEntry& rhs) const {
    return kind == rhs.kind && path == rhs.path && data == rhs.data &&
      executable == rhs.executable;
  }
  bool operator!=(const InputEntry& rhs) const { return !(*this == rhs); }
};

StringRef getInputEntryKindName(InputEntry::Kind kind);

/// Normalize a sandbox relative entry path.
///
/// Empty and `.` components are dropped. Absolute paths, empty paths and paths
/// with a `..` component are rejected, they could name something outside the
/// sandbox.
///
/// \returns The normalized path, or None if the path is not acceptable.
Optional<std::string> normalizeEntryPath(StringRef path);

/// Check whether \p id may name a sandbox directory: a single path component
/// of letters, digits, `-`, `_` and `.`, other than `.` and `..`.
bool isValidSandboxID(StringRef id);

/// The declared inputs of one process execution.
class FileSet {
  std::vector<InputEntry> entries;

public:
  FileSet() {}
  FileSet(std::vector<InputEntry> entries) : entries(std::move(entries)) {}

  void add(InputEntry entry) { entries.push_back(std::move(entry)); }

  void addContent(StringRef path, StringRef contents,
                  bool isExecutable = false) {
    add(InputEntry::makeContent(path, contents, isExecutable));
  }
  void addCopy(StringRef path, StringRef sourcePath,
               bool isExecutable = false) {
    add(InputEntry::makeCopy(path, sourcePath, isExecutable));
  }
  void addSymlink(StringRef path, StringRef target) {
    add(InputEntry::makeSymlink(path, target));
  }
  void addDirectory(StringRef path) {
    add(InputEntry::makeDirectory(path));
  }

  const std::vector<InputEntry>& getEntries() const { return entries; }
  bool empty() const { return entries.empty(); }
  size_t size() const { return entries.size(); }

  /// Normalize every entry path and sort the entries by path.
  ///
  /// \returns A SandboxError (InvalidPath) if a path escapes the sandbox, two
  /// entries share a path, or an entry is nested below a file or symbolic
  /// link entry.
  Error normalize();

  /// Compute the fingerprint of the file set.
  ///
  /// The fingerprint covers each entry's path, kind, executable bit and
  /// content; copies contribute the digest of their source file, not its
  /// path. It is only meaningful on a normalized set.
  ///
  /// \returns The fingerprint, or a SandboxError (IOFailure) if a copy source
  /// can not be read.
  Expected<basic::Digest> computeFingerprint() const;
};

}

namespace basic {

template<>
struct BinaryCodingTraits<sandbox::InputEntry> {
  typedef sandbox::InputEntry T;

  static inline void encode(const T& value, BinaryEncoder& coder) {
    coder.write(uint8_t(value.getKind()));
    coder.write(value.getPath());
    // The payload is shared by every kind.
    coder.write(value.getContents());
    coder.write(value.isExecutable());
  }
  static inline void decode(T& value, BinaryDecoder& coder) {
    uint8_t kind;
    std::string path, data;
    bool executable;
    coder.read(kind);
    coder.read(path);
    coder.read(data);
    coder.read(executable);
    value = T::make(T::Kind(kind), path, data, executable);
  }
};

template<>
struct BinaryCodingTraits<sandbox::FileSet> {
  static inline void encode(const sandbox::FileSet& value,
                            BinaryEncoder& coder) {
    coder.write(value.getEntries());
  }
  static inline void decode(sandbox::FileSet& value, BinaryDecoder& coder) {
    std::vector<sandbox::InputEntry> entries;
    coder.read(entries);
    value = sandbox::FileSet(std::move(entries));
  }
};

}
}

#endif
