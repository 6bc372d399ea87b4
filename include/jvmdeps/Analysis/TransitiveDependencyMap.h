//===- TransitiveDependencyMap.h --------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_TRANSITIVEDEPENDENCYMAP_H
#define JVMDEPS_ANALYSIS_TRANSITIVEDEPENDENCYMAP_H

#include "jvmdeps/Analysis/FileOwnershipIndex.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"

#include <vector>

namespace jvmdeps {
namespace graph {

class Target;
class TargetGraph;

}

namespace analysis {

class AnalysisDelegate;

/// Maps every target of a graph to all the targets it depends on, transitively.
///
/// The map is computed by a single depth-first traversal which finishes every
/// target after its dependencies, so that the closure of a target is the union
/// of the closures of its direct dependencies and the dependencies themselves.
///
/// Dependency cycles do not prevent the computation from completing. A
/// dependency which is reached again while it is still being traversed
/// contributes only itself, so the closures of targets on a cycle may be
/// incomplete. Each such cycle is reported to the delegate.
///
/// Nested derived targets are the expected source of cycles, since they may
/// depend back on the wrapper which consumes them. The direct dependencies of a
/// nested target are always recorded in the nested target's own closure, and
/// never in the closure of its wrapper.
class TransitiveDependencyMap {
  /// The closure of each target, indexed by \see graph::Target::getIndex().
  std::vector<TargetSet> dependenciesByTarget;

  /// The number of cycles found during the computation.
  unsigned numCycles = 0;

public:
  TransitiveDependencyMap() {}

  /// Compute the map for all the targets of \arg graph.
  ///
  /// \param delegate If given, the delegate to report cycles to.
  static TransitiveDependencyMap compute(const graph::TargetGraph& graph,
                                         AnalysisDelegate* delegate = nullptr);

  /// Get the transitive dependencies of \arg target, in the order they were
  /// found.
  ArrayRef<const graph::Target*>
  getDependencies(const graph::Target& target) const;

  /// Check whether \arg target transitively depends on \arg dependency.
  bool dependsOn(const graph::Target& target,
                 const graph::Target& dependency) const;

  /// Get the number of targets in the map.
  unsigned size() const { return dependenciesByTarget.size(); }

  /// Get the number of cycles found while computing the map.
  unsigned getNumCycles() const { return numCycles; }

  bool operator==(const TransitiveDependencyMap& rhs) const {
    return dependenciesByTarget == rhs.dependenciesByTarget;
  }
  bool operator!=(const TransitiveDependencyMap& rhs) const {
    return !(*this == rhs);
  }
};

}
}

#endif
