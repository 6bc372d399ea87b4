//===- TempDir.cpp --------------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "TempDir.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>

jvmdeps::TmpDir::TmpDir(llvm::StringRef namePrefix) {
    llvm::SmallString<256> tempDirPrefix;
    llvm::sys::path::system_temp_directory(true, tempDirPrefix);
    llvm::sys::path::append(tempDirPrefix, namePrefix);

    std::error_code ec = llvm::sys::fs::createUniqueDirectory(
        tempDirPrefix.str(), tempDir);
    assert(!ec);
    (void)ec;
}

jvmdeps::TmpDir::~TmpDir() {
    std::error_code ec = llvm::sys::fs::remove_directories(tempDir.str());
    assert(!ec);
    (void)ec;
}

const char *jvmdeps::TmpDir::c_str() { return tempDir.c_str(); }
std::string jvmdeps::TmpDir::str() const { return tempDir.str().str(); }

std::string jvmdeps::TmpDir::path(llvm::StringRef relativePath) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, relativePath);
    return result.str().str();
}

bool jvmdeps::writeFile(llvm::StringRef path, llvm::StringRef contents) {
    auto parent = llvm::sys::path::parent_path(path);
    if (!parent.empty() && llvm::sys::fs::create_directories(parent))
        return false;

    std::error_code ec;
    llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
    if (ec)
        return false;
    os << contents;
    os.close();
    return !os.has_error();
}
