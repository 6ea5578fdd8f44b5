//===-- OutputCapture.cpp -------------------------------------------------===//
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

#include "sandlane/Execution/OutputCapture.h"

#include "sandlane/Basic/FileInfo.h"
#include "sandlane/Basic/FileSystem.h"
#include "sandlane/Basic/Logging.h"
#include "sandlane/Sandbox/FileSet.h"
#include "sandlane/Sandbox/SandboxError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <algorithm>

using namespace sandlane;
using namespace sandlane::basic;
using namespace sandlane::execution;
using namespace sandlane::sandbox;

StringRef execution::getOutputsMatchModeName(OutputsMatchMode mode) {
  switch (mode) {
  case OutputsMatchMode::All: return "all";
  case OutputsMatchMode::AllWarn: return "all_warn";
  case OutputsMatchMode::AtLeastOne: return "at_least_one";
  case OutputsMatchMode::AtLeastOneWarn: return "at_least_one_warn";
  case OutputsMatchMode::AllowEmpty: return "allow_empty";
  }
  return "unknown";
}

Optional<OutputsMatchMode> execution::parseOutputsMatchMode(StringRef name) {
  for (auto mode: { OutputsMatchMode::All, OutputsMatchMode::AllWarn,
                    OutputsMatchMode::AtLeastOne,
                    OutputsMatchMode::AtLeastOneWarn,
                    OutputsMatchMode::AllowEmpty }) {
    if (name == getOutputsMatchModeName(mode))
      return mode;
  }
  return None;
}

static Error normalizeOutputPaths(std::vector<std::string>& paths,
                                  StringRef what) {
  for (auto& path: paths) {
    auto normalized = normalizeEntryPath(path);
    if (!normalized.hasValue()) {
      return makeSandboxError(SandboxErrorCode::InvalidPath,
                              what + " '" + path +
                              "' is not inside the working directory");
    }
    path = normalized.getValue();
  }
  return Error::success();
}

Error OutputDeclaration::normalize() {
  if (auto err = normalizeOutputPaths(files, "output file"))
    return err;
  return normalizeOutputPaths(directories, "output directory");
}

namespace {

class OutputCollector {
  FileSystem& fs;
  StringRef workingDirectory;
  const OutputDeclaration& declaration;

public:
  OutputCaptureResult result;

  OutputCollector(FileSystem& fs, StringRef workingDirectory,
                  const OutputDeclaration& declaration)
      : fs(fs), workingDirectory(workingDirectory), declaration(declaration) {}

  std::string getFullPath(StringRef path) const {
    SmallString<256> fullPath(workingDirectory);
    llvm::sys::path::append(fullPath, path);
    return fullPath.str().str();
  }

  /// Capture one regular file.
  Error capture(StringRef path, const FileInfo& info) {
    std::string source = getFullPath(path);
    auto digest = Digest::ofFile(source);
    if (!digest) {
      return makeSandboxError(SandboxErrorCode::IOFailure,
                              "unable to read output '" + path + "': " +
                              digest.getError().message());
    }

    CapturedOutput output;
    output.path = path.str();
    output.digest = *digest;
    output.size = info.size;
    output.isExecutable = info.isExecutable();

    if (!declaration.destination.empty()) {
      SmallString<256> target(declaration.destination);
      llvm::sys::path::append(target, path);
      std::error_code ec = fs.createDirectories(
          llvm::sys::path::parent_path(target).str());
      if (!ec)
        ec = fs.copyFile(source, target.str().str(), output.isExecutable);
      if (ec) {
        return makeSandboxError(SandboxErrorCode::IOFailure,
                                "unable to copy output '" + path + "' to '" +
                                target.str() + "': " + ec.message());
      }
    }

    result.files.push_back(std::move(output));
    return Error::success();
  }

  /// Capture a declared file.
  ///
  /// \returns Whether it exists, or an error.
  Expected<bool> captureFile(StringRef path) {
    auto info = fs.getLinkInfo(getFullPath(path));
    if (!info.isRegular())
      return false;
    if (auto err = capture(path, info))
      return std::move(err);
    return true;
  }

  /// Capture every regular file below a declared directory.
  ///
  /// \returns Whether it exists, or an error.
  Expected<bool> captureDirectory(StringRef path) {
    std::string root = getFullPath(path);
    if (!fs.getLinkInfo(root).isDirectory())
      return false;

    std::error_code ec;
    for (llvm::sys::fs::recursive_directory_iterator
           it(root, ec, /*follow_symlinks=*/false), end;
         it != end && !ec; it.increment(ec)) {
      if (it->type() != llvm::sys::fs::file_type::regular_file)
        continue;
      StringRef relative = StringRef(it->path()).drop_front(
          workingDirectory.size() + 1);
      auto info = fs.getLinkInfo(it->path());
      if (auto err = capture(relative, info))
        return std::move(err);
    }
    if (ec) {
      return makeSandboxError(SandboxErrorCode::IOFailure,
                              "unable to list output directory '" + path +
                              "': " + ec.message());
    }
    return true;
  }
};

}

Expected<OutputCaptureResult>
execution::captureOutputs(FileSystem& fs, Logger& logger,
                          StringRef workingDirectory,
                          const OutputDeclaration& declaration) {
  OutputCollector collector(fs, workingDirectory, declaration);
  auto& result = collector.result;

  for (const auto& path: declaration.files) {
    auto exists = collector.captureFile(path);
    if (!exists)
      return exists.takeError();
    if (!*exists)
      result.missing.push_back(path + " (from output files)");
  }
  for (const auto& path: declaration.directories) {
    auto exists = collector.captureDirectory(path);
    if (!exists)
      return exists.takeError();
    if (!*exists)
      result.missing.push_back(path + " (from output directories)");
  }

  // A file may be declared directly and below a declared directory.
  std::sort(result.files.begin(), result.files.end(),
            [](const CapturedOutput& a, const CapturedOutput& b) {
              return a.path < b.path;
            });
  result.files.erase(std::unique(result.files.begin(), result.files.end()),
                     result.files.end());

  size_t declared = declaration.files.size() + declaration.directories.size();
  bool mismatched = false;
  std::string requirement;
  switch (declaration.mode) {
  case OutputsMatchMode::All:
  case OutputsMatchMode::AllWarn:
    mismatched = !result.missing.empty();
    requirement = "every declared output to exist";
    break;
  case OutputsMatchMode::AtLeastOne:
  case OutputsMatchMode::AtLeastOneWarn:
    mismatched = declared != 0 && result.missing.size() == declared;
    requirement = "at least one declared output to exist";
    break;
  case OutputsMatchMode::AllowEmpty:
    break;
  }
  if (!mismatched)
    return std::move(result);

  std::string missing;
  for (const auto& entry: result.missing) {
    if (!missing.empty())
      missing += ", ";
    missing += entry;
  }
  result.message = ("outputs match mode '" +
                    getOutputsMatchModeName(declaration.mode) + "' requires " +
                    requirement + "; missing: " + missing).str();
  if (declaration.mode == OutputsMatchMode::All ||
      declaration.mode == OutputsMatchMode::AtLeastOne) {
    result.satisfied = false;
  } else {
    logger.warning(result.message);
  }
  return std::move(result);
}
