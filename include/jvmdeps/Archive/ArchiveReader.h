//===- ArchiveReader.h ------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ARCHIVE_ARCHIVEREADER_H
#define JVMDEPS_ARCHIVE_ARCHIVEREADER_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace jvmdeps {
namespace basic {

class FileSystem;

}

namespace archive {

/// Abstract interface for listing the entries of an archive.
class ArchiveReader {
  // DO NOT COPY
  ArchiveReader(const ArchiveReader&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const ArchiveReader&) JVMDEPS_DELETED_FUNCTION;

public:
  ArchiveReader() {}
  virtual ~ArchiveReader();

  /// List the names of all entries in the archive at \arg path, in the order
  /// they are recorded in the archive.
  ///
  /// \returns The entry names, or an \see AttributionError naming \arg path if
  /// the archive could not be opened or is malformed.
  virtual llvm::Expected<std::vector<std::string>>
  listEntries(const std::string& path) = 0;
};

/// Create an ArchiveReader for zip (and thus jar) archives, which reads the
/// archive's central directory through \arg fs.
///
/// Entries are never decompressed; only the central directory is decoded.
std::unique_ptr<ArchiveReader> createZipArchiveReader(basic::FileSystem& fs);

}
}

#endif
