//===-- FileSet.cpp -------------------------------------------------------===//
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

#include "sandlane/Sandbox/FileSet.h"

#include "sandlane/Sandbox/SandboxError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Path.h"

#include <algorithm>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::sandbox;

StringRef sandbox::getInputEntryKindName(InputEntry::Kind kind) {
  switch (kind) {
  case InputEntry::Kind::Content: return "content";
  case InputEntry::Kind::Copy: return "copy";
  case InputEntry::Kind::Symlink: return "symlink";
  case InputEntry::Kind::Directory: return "directory";
  }
  return "unknown";
}

Optional<std::string> sandbox::normalizeEntryPath(StringRef path) {
  if (path.empty() || path.startswith("/"))
    return None;

  SmallString<256> result;
  SmallVector<StringRef, 8> components;
  path.split(components, '/', /*MaxSplit=*/-1, /*KeepEmpty=*/false);
  for (auto component: components) {
    if (component == ".")
      continue;
    if (component == "..")
      return None;
    if (!result.empty())
      result += '/';
    result += component;
  }

  if (result.empty())
    return None;
  return result.str().str();
}

bool sandbox::isValidSandboxID(StringRef id) {
  if (id.empty() || id.size() > 255 || id == "." || id == "..")
    return false;
  for (char c: id) {
    if (!llvm::isAlnum(c) && c != '-' && c != '_' && c != '.')
      return false;
  }
  return true;
}

Error FileSet::normalize() {
  for (auto& entry: entries) {
    if (entry.getKind() > InputEntry::Kind::Directory) {
      return makeSandboxError(SandboxErrorCode::ProtocolError,
                              "unknown kind for entry '" + entry.getPath() +
                              "'");
    }
    auto path = normalizeEntryPath(entry.getPath());
    if (!path.hasValue()) {
      return makeSandboxError(SandboxErrorCode::InvalidPath,
                              "entry path '" + entry.getPath() +
                              "' is not a relative path inside the sandbox");
    }
    entry.setPath(path.getValue());

    // Relative sources would resolve against whichever process copies them.
    if (entry.getKind() == InputEntry::Kind::Copy &&
        !llvm::sys::path::is_absolute(entry.getSourcePath(),
                                      llvm::sys::path::Style::posix)) {
      return makeSandboxError(SandboxErrorCode::InvalidPath,
                              "copy source '" + entry.getSourcePath() +
                              "' for entry '" + entry.getPath() +
                              "' is not an absolute path");
    }
  }

  std::stable_sort(entries.begin(), entries.end(),
                   [](const InputEntry& a, const InputEntry& b) {
                     return a.getPath() < b.getPath();
                   });

  // Nothing may be placed below a file or a symbolic link; writing through a
  // link could land outside the sandbox.
  llvm::StringSet<> leaves;
  for (size_t i = 0; i != entries.size(); ++i) {
    const auto& entry = entries[i];
    if (i != 0 && entries[i - 1].getPath() == entry.getPath()) {
      return makeSandboxError(SandboxErrorCode::InvalidPath,
                              "duplicate entry path '" + entry.getPath() +
                              "'");
    }

    StringRef parent = llvm::sys::path::parent_path(entry.getPath(),
                                                    llvm::sys::path::Style::posix);
    while (!parent.empty()) {
      if (leaves.count(parent)) {
        return makeSandboxError(SandboxErrorCode::InvalidPath,
                                "entry path '" + entry.getPath() +
                                "' is nested below non-directory entry '" +
                                parent + "'");
      }
      parent = llvm::sys::path::parent_path(parent,
                                            llvm::sys::path::Style::posix);
    }

    if (entry.getKind() != InputEntry::Kind::Directory)
      leaves.insert(entry.getPath());
  }

  return Error::success();
}

Expected<Digest> FileSet::computeFingerprint() const {
  DigestBuilder builder;
  builder.combine(uint64_t(entries.size()));
  for (const auto& entry: entries) {
    builder.combine(uint64_t(entry.getKind()));
    builder.combine(entry.getPath());
    switch (entry.getKind()) {
    case InputEntry::Kind::Content:
      builder.combine(Digest::ofData(entry.getContents()));
      builder.combine(entry.isExecutable());
      break;
    case InputEntry::Kind::Copy: {
      auto digest = Digest::ofFile(entry.getSourcePath());
      if (!digest) {
        return makeSandboxError(SandboxErrorCode::IOFailure,
                                "unable to read '" + entry.getSourcePath() +
                                "' for entry '" + entry.getPath() + "': " +
                                digest.getError().message());
      }
      builder.combine(*digest);
      builder.combine(entry.isExecutable());
      break;
    }
    case InputEntry::Kind::Symlink:
      builder.combine(entry.getTarget());
      break;
    case InputEntry::Kind::Directory:
      break;
    }
  }
  return builder.finish();
}
