//===-- FileOwnershipIndex.cpp --------------------------------------------===//
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

#include "jvmdeps/Analysis/FileOwnershipIndex.h"

#include "jvmdeps/Analysis/AnalysisContext.h"
#include "jvmdeps/Analysis/AnalysisDelegate.h"
#include "jvmdeps/Analysis/CompiledOutputManifest.h"
#include "jvmdeps/Archive/ArchiveIndex.h"
#include "jvmdeps/Basic/FileSystem.h"
#include "jvmdeps/Graph/Target.h"
#include "jvmdeps/Graph/TargetGraph.h"
#include "jvmdeps/Resolve/ResolutionReport.h"
#include "jvmdeps/Resolve/ResolvedCoordinateMap.h"
#include "jvmdeps/Resolve/SymlinkMap.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <map>

using namespace jvmdeps;
using namespace jvmdeps::analysis;
using namespace jvmdeps::graph;

static std::string joinPath(StringRef base, StringRef path) {
  if (base.empty() || llvm::sys::path::is_absolute(path))
    return path.str();

  SmallString<256> result(base);
  llvm::sys::path::append(result, path);
  return result.str().str();
}

namespace {

/// Performs the single registration pass which populates an index.
class OwnershipBuilder {
  const AnalysisContext& context;
  archive::ArchiveIndex& archives;
  FileOwnershipIndex& index;

  /// The library aggregates declaring each library, in declaration order.
  std::map<LibraryReference, TargetSet> librariesByKey;

  void note(const Twine& message) {
    if (context.options.verbose)
      context.delegate.note(message);
  }

  void addSources(const Target& owner, const Target& declarer) {
    for (const auto& source: declarer.getSources()) {
      index.addOwner(joinPath(context.options.buildRoot, source), owner);
    }
  }

  void mapTargets() {
    note("mapping sources...");
    for (const auto& target: context.graph.getTargets()) {
      switch (target->getKind()) {
      case TargetKind::Source:
        addSources(*target, *target);
        break;

      case TargetKind::Library:
        for (const auto& library: target->getLibraries()) {
          librariesByKey[library].insert(target.get());
        }
        break;

      case TargetKind::Wrapper:
        addSources(*target, *target);
        // Generated sources of nested targets belong to the wrapper which
        // compiles them.
        for (const auto* nested: target->getNestedTargets()) {
          addSources(*target, *nested);
        }
        break;
      }
    }
  }

  void mapOutputs() {
    note("mapping classes...");
    for (const auto& entry: context.outputs.getAllOutputs()) {
      const Target& target = *entry.first;
      for (const auto& output: entry.second) {
        index.addOwner(output.relativePath, target);
        index.addOwner(joinPath(output.directory, output.relativePath), target);
      }
    }
  }

  llvm::Error mapArchives(const resolve::ResolutionReport& report,
                          const resolve::SymlinkSnapshot& symlinks) {
    resolve::ResolvedCoordinateMap coordinates(report);
    for (const auto& module: report.getModules()) {
      auto it = librariesByKey.find(module.ref.getLibrary());
      if (it == librariesByKey.end())
        continue;

      // Every declaring aggregate provides every archive the module
      // transitively resolves to.
      const TargetSet& declarers = it->second;
      for (const auto& archivePath: coordinates.transitiveArchives(module.ref)) {
        auto symlink = symlinks.find(
            context.fileSystem.getRealPath(archivePath));
        if (symlink == symlinks.end())
          continue;

        auto entries = archives.entries(symlink->second);
        if (!entries)
          return entries.takeError();
        for (const auto& classfile: *entries) {
          for (const auto* declarer: declarers) {
            index.addOwner(classfile, *declarer);
          }
        }
      }
    }
    return llvm::Error::success();
  }

public:
  OwnershipBuilder(const AnalysisContext& context,
                   archive::ArchiveIndex& archives,
                   FileOwnershipIndex& index)
      : context(context), archives(archives), index(index) {}

  llvm::Error build() {
    mapTargets();
    mapOutputs();

    note("mapping jars...");
    if (context.reports.empty() || librariesByKey.empty())
      return llvm::Error::success();

    // The live map may be extended by concurrent resolves, work from a copy.
    resolve::SymlinkSnapshot symlinks;
    if (context.symlinks)
      symlinks = context.symlinks->snapshot();

    for (const auto* report: context.reports) {
      if (!report)
        continue;
      if (auto err = mapArchives(*report, symlinks))
        return err;
    }
    return llvm::Error::success();
  }
};

}

llvm::Expected<FileOwnershipIndex>
FileOwnershipIndex::build(const AnalysisContext& context,
                          archive::ArchiveIndex& archives) {
  FileOwnershipIndex index;
  OwnershipBuilder builder(context, archives, index);
  if (auto err = builder.build())
    return std::move(err);
  return std::move(index);
}

ArrayRef<const Target*> FileOwnershipIndex::getOwners(StringRef file) const {
  auto it = ownersByFile.find(file);
  if (it == ownersByFile.end())
    return {};
  return it->second.getArrayRef();
}

const Target* FileOwnershipIndex::getCanonicalOwner(StringRef file) const {
  auto owners = getOwners(file);
  if (owners.empty())
    return nullptr;
  return owners.front();
}

std::vector<StringRef> FileOwnershipIndex::getSortedFiles() const {
  std::vector<StringRef> result;
  result.reserve(ownersByFile.size());
  for (const auto& entry: ownersByFile) {
    result.push_back(entry.getKey());
  }
  std::sort(result.begin(), result.end());
  return result;
}
