//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "jvmdeps/Basic/FileSystem.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

using namespace jvmdeps;
using namespace jvmdeps::basic;

FileSystem::~FileSystem() {}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    // Archives are read as binary data and are never null terminated.
    auto result = llvm::MemoryBuffer::getFile(
        path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (result.getError()) {
      return nullptr;
    }
    return std::unique_ptr<llvm::MemoryBuffer>(result->release());
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }

  virtual std::string getRealPath(const std::string& path) override {
    SmallString<256> result;
    if (llvm::sys::fs::real_path(path, result)) {
      return path;
    }
    return result.str().str();
  }

  virtual bool
  getDirectoryContents(const std::string& path,
                       SmallVectorImpl<std::string>& result) override {
    std::error_code ec;
    llvm::sys::fs::directory_iterator it(path, ec), end;
    if (ec)
      return false;

    for (; it != end; it.increment(ec)) {
      if (ec)
        return false;
      result.push_back(llvm::sys::path::filename(it->path()).str());
    }
    return true;
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}
