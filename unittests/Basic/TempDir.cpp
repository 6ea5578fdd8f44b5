//===- unittests/Basic/TempDir.cpp ----------------------------------------===//
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

#include "TempDir.h"

#include "sandlane/Basic/FileSystem.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <cassert>

sandlane::TmpDir::TmpDir(llvm::StringRef namePrefix) {
    llvm::SmallString<256> tempDirPrefix;
    llvm::sys::path::system_temp_directory(true, tempDirPrefix);
    llvm::sys::path::append(tempDirPrefix, namePrefix);

    std::error_code ec = llvm::sys::fs::createUniqueDirectory(
        tempDirPrefix.str(), tempDir);
    assert(!ec);
    (void)ec;
}

sandlane::TmpDir::~TmpDir() {
    auto fs = basic::createLocalFileSystem();
    bool result = fs->remove(tempDir.c_str());
    assert(result);
    (void)result;
}

const char *sandlane::TmpDir::c_str() { return tempDir.c_str(); }
std::string sandlane::TmpDir::str() const { return tempDir.str().str(); }

std::string sandlane::TmpDir::path(llvm::StringRef name) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, name);
    return result.str().str();
}
