//===- MockArchiveReader.h --------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_TESTS_MOCKARCHIVEREADER
#define JVMDEPS_TESTS_MOCKARCHIVEREADER

#include "jvmdeps/Archive/ArchiveReader.h"
#include "jvmdeps/Archive/AttributionError.h"

#include "llvm/ADT/StringMap.h"

#include <string>
#include <vector>

namespace jvmdeps {
namespace unittests {

/// An archive reader which lists fixed entries and records its reads.
class MockArchiveReader : public archive::ArchiveReader {
public:
  llvm::StringMap<std::vector<std::string>> archives;

  /// The paths read, in order.
  std::vector<std::string> reads;

  void addArchive(llvm::StringRef path, std::vector<std::string> entries) {
    archives[path] = std::move(entries);
  }

  virtual llvm::Expected<std::vector<std::string>>
  listEntries(const std::string& path) override {
    reads.push_back(path);
    auto it = archives.find(path);
    if (it == archives.end())
      return llvm::make_error<archive::AttributionError>(path,
                                                         "no such archive");
    return it->second;
  }
};

}
}

#endif /* JVMDEPS_TESTS_MOCKARCHIVEREADER */
