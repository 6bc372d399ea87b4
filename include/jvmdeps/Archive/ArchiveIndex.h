//===- ArchiveIndex.h -------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ARCHIVE_ARCHIVEINDEX_H
#define JVMDEPS_ARCHIVE_ARCHIVEINDEX_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace jvmdeps {
namespace archive {

class ArchiveReader;

/// Lazily lists and caches the compiled-artifact entries of archives.
///
/// Each archive is read at most once for the lifetime of the index; later
/// requests for the same path are answered from the cached listing.
///
/// NOTE: This class is *NOT* thread safe.
class ArchiveIndex {
  // DO NOT COPY
  ArchiveIndex(const ArchiveIndex&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const ArchiveIndex&) JVMDEPS_DELETED_FUNCTION;

  ArchiveReader& reader;

  /// The suffix identifying compiled-artifact entries.
  std::string entrySuffix;

  /// The filtered entries of every archive read so far.
  llvm::StringMap<std::vector<std::string>> entriesByArchive;

public:
  explicit ArchiveIndex(ArchiveReader& reader,
                        StringRef entrySuffix = ".class");

  StringRef getEntrySuffix() const { return entrySuffix; }

  /// Get the compiled-artifact entries of the archive at \arg archivePath.
  ///
  /// The returned view refers to the cached listing and remains valid for the
  /// lifetime of the index.
  ///
  /// \returns The entries, or the \see AttributionError raised while reading
  /// the archive. Failures are not cached.
  llvm::Expected<ArrayRef<std::string>> entries(StringRef archivePath);

  /// Check whether the archive at \arg archivePath has already been read.
  bool isCached(StringRef archivePath) const {
    return entriesByArchive.count(archivePath) != 0;
  }

  /// Get the number of archives which have been read.
  unsigned getNumCachedArchives() const { return entriesByArchive.size(); }
};

}
}

#endif
