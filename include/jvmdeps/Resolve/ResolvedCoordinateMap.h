//===- ResolvedCoordinateMap.h ----------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_RESOLVE_RESOLVEDCOORDINATEMAP_H
#define JVMDEPS_RESOLVE_RESOLVEDCOORDINATEMAP_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"
#include "jvmdeps/Resolve/ResolutionReport.h"

#include "llvm/ADT/SetVector.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace jvmdeps {
namespace resolve {

/// An insertion-ordered set of archive paths.
typedef llvm::SetVector<std::string, std::vector<std::string>,
                        std::set<std::string>> ArchiveSet;

/// Maps module coordinates to the archives they transitively resolve to.
///
/// NOTE: This class is *NOT* thread safe.
class ResolvedCoordinateMap {
  // DO NOT COPY
  ResolvedCoordinateMap(const ResolvedCoordinateMap&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const ResolvedCoordinateMap&) JVMDEPS_DELETED_FUNCTION;

  const ResolutionReport& report;

  /// The memoized result for every module visited so far.
  std::map<ModuleRef, ArchiveSet> archivesByModule;

  /// The modules currently being traversed, with their depth in the
  /// traversal.
  std::map<ModuleRef, unsigned> inProgress;

  /// Shared empty result for modules which contribute nothing.
  ArchiveSet emptySet;

  unsigned numTraversals = 0;

  /// Add the archives of \arg ref to \arg archives.
  ///
  /// \returns The smallest depth of a module still being traversed which was
  /// reached from \arg ref, or the maximum unsigned value if there was none.
  unsigned addArchives(const ModuleRef& ref, ArchiveSet& archives);

public:
  explicit ResolvedCoordinateMap(const ResolutionReport& report)
      : report(report) {}

  const ResolutionReport& getReport() const { return report; }

  /// Get the archives of \arg ref and of every module it transitively depends
  /// on in the report.
  ///
  /// Archives reachable along several paths appear once. Modules which are not
  /// recorded in the report contribute nothing. Cycles in the report's graph
  /// are broken, and every module on a cycle gets the archives of the whole
  /// cycle, regardless of which module was queried first.
  ///
  /// The result is memoized, and the returned reference remains valid for the
  /// lifetime of the map. A memoized result is always complete.
  const ArchiveSet& transitiveArchives(const ModuleRef& ref);

  /// Get the number of modules whose archives were computed (rather than
  /// answered from the memo).
  unsigned getNumTraversals() const { return numTraversals; }
};

}
}

#endif
