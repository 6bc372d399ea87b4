//===- FileSystem.h ---------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_BASIC_FILESYSTEM_H
#define JVMDEPS_BASIC_FILESYSTEM_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/FileInfo.h"
#include "jvmdeps/Basic/LLVM.h"

#include <memory>
#include <string>

namespace llvm {

class MemoryBuffer;

}

namespace jvmdeps {
namespace basic {

// Abstract interface for read-only access to a file system. This allows mocking
// of operations for testing, and for clients to provide virtualized interfaces.
class FileSystem  {
  // DO NOT COPY
  FileSystem(const FileSystem&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const FileSystem&) JVMDEPS_DELETED_FUNCTION;
  FileSystem &operator=(FileSystem&& rhs) JVMDEPS_DELETED_FUNCTION;

public:
  FileSystem() {}
  virtual ~FileSystem();

  /// Get a memory buffer for a given file on the file system.
  ///
  /// \returns The file contents, on success, or null on error.
  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) = 0;

  /// Get the information to represent the state of the given path in the file
  /// system.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist (or any error was encountered).
  virtual FileInfo getFileInfo(const std::string& path) = 0;

  /// Get the canonical path of \arg path, with all symbolic links resolved.
  ///
  /// \returns The real path, or \arg path unchanged if it could not be
  /// resolved (for example, because it does not exist).
  virtual std::string getRealPath(const std::string& path) = 0;

  /// Get the names of the entries of the directory at \arg path.
  ///
  /// The names are relative to the directory and are appended to \arg result
  /// in the order the file system reports them.
  ///
  /// \returns True on success, false if the directory could not be read.
  virtual bool getDirectoryContents(const std::string& path,
                                    SmallVectorImpl<std::string>& result) = 0;
};

/// Create a FileSystem instance suitable for accessing the local filesystem.
std::unique_ptr<FileSystem> createLocalFileSystem();

}
}

#endif
