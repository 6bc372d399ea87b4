//===-- ResolvedCoordinateMap.cpp -----------------------------------------===//
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

#include "jvmdeps/Resolve/ResolvedCoordinateMap.h"

#include <algorithm>
#include <limits>

using namespace jvmdeps;
using namespace jvmdeps::resolve;

namespace {

/// The depth reported when no module still being traversed was reached.
const unsigned NoActiveDepth = std::numeric_limits<unsigned>::max();

}

const ArchiveSet& ResolvedCoordinateMap::transitiveArchives(
    const ModuleRef& ref) {
  auto it = archivesByModule.find(ref);
  if (it != archivesByModule.end())
    return it->second;

  ArchiveSet archives;
  addArchives(ref, archives);

  // A traversal started here always completes, so any module which was
  // recorded in the report is now memoized.
  it = archivesByModule.find(ref);
  if (it == archivesByModule.end())
    return emptySet;
  return it->second;
}

unsigned ResolvedCoordinateMap::addArchives(const ModuleRef& ref,
                                            ArchiveSet& archives) {
  auto it = archivesByModule.find(ref);
  if (it != archivesByModule.end()) {
    archives.insert(it->second.begin(), it->second.end());
    return NoActiveDepth;
  }

  // Break cycles in the resolution graph.
  auto active = inProgress.find(ref);
  if (active != inProgress.end())
    return active->second;

  const ResolvedModule* module = report.lookup(ref);
  if (!module)
    return NoActiveDepth;

  unsigned depth = inProgress.size();
  inProgress.emplace(ref, depth);
  ++numTraversals;

  ArchiveSet result;
  result.insert(module->artifacts.begin(), module->artifacts.end());
  unsigned reached = NoActiveDepth;
  for (const auto& dependency: module->dependencies) {
    reached = std::min(reached, addArchives(dependency, result));
  }
  inProgress.erase(ref);

  archives.insert(result.begin(), result.end());

  // The result is missing the archives of a module further up the current
  // traversal, so it is only valid as part of that module's result.
  if (reached < depth)
    return reached;

  archivesByModule.emplace(ref, std::move(result));
  return NoActiveDepth;
}
