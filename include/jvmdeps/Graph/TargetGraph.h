//===- TargetGraph.h --------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_GRAPH_TARGETGRAPH_H
#define JVMDEPS_GRAPH_TARGETGRAPH_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"
#include "jvmdeps/Graph/Target.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <memory>
#include <vector>

namespace jvmdeps {
namespace graph {

/// The targets of a single build invocation.
///
/// The graph is the canonical owner of its targets, which are kept in the order
/// they were added. It is populated once, when the invocation's build graph is
/// loaded, and is treated as immutable afterwards.
class TargetGraph {
  // DO NOT COPY
  TargetGraph(const TargetGraph&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const TargetGraph&) JVMDEPS_DELETED_FUNCTION;

public:
  typedef std::vector<std::unique_ptr<Target>> target_list;

private:
  /// The owned targets, indexed by \see Target::getIndex().
  target_list targets;

  /// Maps target names to targets. This map doesn't own the targets.
  llvm::StringMap<Target*> targetsByName;

public:
  TargetGraph() {}

  /// @name Accessors
  /// @{

  const target_list& getTargets() const { return targets; }

  unsigned size() const { return targets.size(); }

  bool empty() const { return targets.empty(); }

  const Target& getTarget(unsigned index) const { return *targets[index]; }

  /// Look up a target by name.
  ///
  /// \returns The target, or null if there is no target with that name.
  Target* findTarget(StringRef name);
  const Target* findTarget(StringRef name) const;

  /// @}
  /// @name Construction Helpers.
  /// @{

  /// Add a new target to the graph.
  ///
  /// \returns The new target, or null if a target with the same name already
  /// exists.
  Target* addTarget(StringRef name, TargetKind kind);

  /// @}
};

}
}

#endif
