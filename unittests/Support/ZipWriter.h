//===- ZipWriter.h ----------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_TESTS_ZIPWRITER
#define JVMDEPS_TESTS_ZIPWRITER

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace jvmdeps {

struct ZipOptions {
  /// Whether to record the central directory through the Zip64 end records.
  bool zip64 = false;

  /// The archive comment.
  std::string comment;
};

/// Create a zip archive of stored (uncompressed) entries, each containing its
/// own name.
std::vector<uint8_t> createZipArchive(llvm::ArrayRef<std::string> entries,
                                      const ZipOptions& options = {});

/// Write a zip archive to \arg path, creating any missing parent directories.
///
/// \returns True on success.
bool writeZipArchive(llvm::StringRef path,
                     llvm::ArrayRef<std::string> entries,
                     const ZipOptions& options = {});

}

#endif /* JVMDEPS_TESTS_ZIPWRITER */
