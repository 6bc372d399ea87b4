//===-- ArchiveIndex.cpp --------------------------------------------------===//
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

#include "jvmdeps/Archive/ArchiveIndex.h"
#include "jvmdeps/Archive/ArchiveReader.h"

using namespace jvmdeps;
using namespace jvmdeps::archive;

ArchiveReader::~ArchiveReader() {}

ArchiveIndex::ArchiveIndex(ArchiveReader& reader, StringRef entrySuffix)
    : reader(reader), entrySuffix(entrySuffix) {}

llvm::Expected<ArrayRef<std::string>>
ArchiveIndex::entries(StringRef archivePath) {
  auto it = entriesByArchive.find(archivePath);
  if (it != entriesByArchive.end())
    return ArrayRef<std::string>(it->second);

  auto names = reader.listEntries(archivePath.str());
  if (!names)
    return names.takeError();

  std::vector<std::string> filtered;
  for (auto& name: *names) {
    if (StringRef(name).endswith(entrySuffix))
      filtered.push_back(std::move(name));
  }

  auto& cached = entriesByArchive[archivePath];
  cached = std::move(filtered);
  return ArrayRef<std::string>(cached);
}
