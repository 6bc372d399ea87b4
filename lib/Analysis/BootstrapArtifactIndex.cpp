//===-- BootstrapArtifactIndex.cpp ----------------------------------------===//
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

#include "jvmdeps/Analysis/BootstrapArtifactIndex.h"

#include "jvmdeps/Analysis/DistributionLocator.h"
#include "jvmdeps/Archive/ArchiveIndex.h"
#include "jvmdeps/Archive/AttributionError.h"
#include "jvmdeps/Basic/FileSystem.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"

#include <algorithm>

using namespace jvmdeps;
using namespace jvmdeps::analysis;

/// Get the components of a path-list valued system property.
static std::vector<std::string>
getPathProperty(const DistributionLocator& distribution, StringRef key) {
  std::vector<std::string> result;
  auto value = distribution.getSystemProperty(key);
  if (!value)
    return result;

  SmallVector<StringRef, 8> components;
  StringRef(*value).split(components, llvm::sys::EnvPathSeparator,
                          /*MaxSplit=*/-1, /*KeepEmpty=*/false);
  for (auto component: components) {
    result.push_back(component.str());
  }
  return result;
}

/// Append the archives found in each of \arg dirs to \arg result.
///
/// Override and extension classes are only loaded from jars, loose classes in
/// those directories are ignored.
static llvm::Error findJarsInDirs(const std::vector<std::string>& dirs,
                                  basic::FileSystem& fs,
                                  StringRef archiveSuffix,
                                  std::vector<std::string>& result) {
  for (const auto& dir: dirs) {
    if (!fs.getFileInfo(dir).isDirectory())
      continue;

    SmallVector<std::string, 16> names;
    if (!fs.getDirectoryContents(dir, names)) {
      return llvm::make_error<archive::AttributionError>(
          dir, "unable to list platform directory");
    }
    std::sort(names.begin(), names.end());

    for (const auto& name: names) {
      if (!StringRef(name).endswith(archiveSuffix))
        continue;
      SmallString<256> path(dir);
      llvm::sys::path::append(path, name);
      result.push_back(path.str().str());
    }
  }
  return llvm::Error::success();
}

llvm::Expected<std::vector<std::string>>
BootstrapArtifactIndex::findBootstrapJars(
    const DistributionLocator& distribution, basic::FileSystem& fs,
    StringRef archiveSuffix) {
  // The order reflects the classloading order.
  std::vector<std::string> candidates;
  if (auto err = findJarsInDirs(
          getPathProperty(distribution, EndorsedDirsProperty), fs,
          archiveSuffix, candidates))
    return std::move(err);
  for (auto& entry: getPathProperty(distribution, BootClassPathProperty)) {
    candidates.push_back(std::move(entry));
  }
  if (auto err = findJarsInDirs(
          getPathProperty(distribution, ExtensionDirsProperty), fs,
          archiveSuffix, candidates))
    return std::move(err);

  std::vector<std::string> result;
  for (auto& candidate: candidates) {
    if (fs.getFileInfo(candidate).isRegularFile())
      result.push_back(std::move(candidate));
  }
  return std::move(result);
}

llvm::Expected<BootstrapArtifactIndex>
BootstrapArtifactIndex::build(const DistributionLocator& distribution,
                              basic::FileSystem& fs,
                              archive::ArchiveIndex& archives,
                              StringRef archiveSuffix) {
  auto jars = findBootstrapJars(distribution, fs, archiveSuffix);
  if (!jars)
    return jars.takeError();

  BootstrapArtifactIndex index;
  for (const auto& jar: *jars) {
    auto entries = archives.entries(jar);
    if (!entries)
      return entries.takeError();
    for (const auto& classfile: *entries) {
      index.classfiles.insert(classfile);
    }
  }
  index.jars = std::move(*jars);
  return std::move(index);
}

std::vector<StringRef> BootstrapArtifactIndex::getSortedClassfiles() const {
  std::vector<StringRef> result;
  result.reserve(classfiles.size());
  for (const auto& entry: classfiles) {
    result.push_back(entry.getKey());
  }
  std::sort(result.begin(), result.end());
  return result;
}
