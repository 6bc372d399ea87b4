//===-- TransitiveDependencyMap.cpp ---------------------------------------===//
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

#include "jvmdeps/Analysis/TransitiveDependencyMap.h"

#include "jvmdeps/Analysis/AnalysisDelegate.h"
#include "jvmdeps/Graph/Target.h"
#include "jvmdeps/Graph/TargetGraph.h"

#include <algorithm>
#include <cstdint>

using namespace jvmdeps;
using namespace jvmdeps::analysis;
using namespace jvmdeps::graph;

namespace {

enum class VisitState : uint8_t {
  Unvisited,
  InProgress,
  Done
};

/// A target whose dependencies are being visited.
struct VisitFrame {
  const Target* target;

  /// The index of the next dependency to visit.
  unsigned nextDependency;
};

class ClosureBuilder {
  AnalysisDelegate* delegate;

  std::vector<TargetSet>& closures;

  std::vector<VisitState> states;

  std::vector<VisitFrame> stack;

  unsigned numCycles = 0;

  void reportCycle(const Target& target) {
    ++numCycles;
    if (!delegate)
      return;

    auto it = std::find_if(stack.begin(), stack.end(),
                           [&](const VisitFrame& frame) {
                             return frame.target == &target;
                           });
    std::vector<const Target*> items;
    for (; it != stack.end(); ++it) {
      items.push_back(it->target);
    }
    items.push_back(&target);
    delegate->cycleDetected(items);
  }

  void finish(const Target& target) {
    TargetSet& closure = closures[target.getIndex()];
    for (const auto* dependency: target.getDependencies()) {
      // A dependency still in progress is on a cycle, and its closure is not
      // known yet.
      if (states[dependency->getIndex()] == VisitState::Done) {
        const TargetSet& transitive = closures[dependency->getIndex()];
        closure.insert(transitive.begin(), transitive.end());
      }
      closure.insert(dependency);
    }

    switch (target.getKind()) {
    case TargetKind::Source:
    case TargetKind::Library:
      break;

    case TargetKind::Wrapper:
      // Nested targets may depend back on their wrapper, so their dependencies
      // are recorded against them directly rather than merged into the
      // wrapper's closure.
      for (const auto* nested: target.getNestedTargets()) {
        TargetSet& nestedClosure = closures[nested->getIndex()];
        for (const auto* dependency: nested->getDependencies()) {
          nestedClosure.insert(dependency);
        }
      }
      break;
    }

    states[target.getIndex()] = VisitState::Done;
  }

  void visit(const Target& root) {
    states[root.getIndex()] = VisitState::InProgress;
    stack.push_back({ &root, 0 });

    while (!stack.empty()) {
      VisitFrame& frame = stack.back();
      auto dependencies = frame.target->getDependencies();

      if (frame.nextDependency == dependencies.size()) {
        const Target* target = frame.target;
        stack.pop_back();
        finish(*target);
        continue;
      }

      const Target* dependency = dependencies[frame.nextDependency++];
      switch (states[dependency->getIndex()]) {
      case VisitState::Unvisited:
        states[dependency->getIndex()] = VisitState::InProgress;
        stack.push_back({ dependency, 0 });
        break;

      case VisitState::InProgress:
        reportCycle(*dependency);
        break;

      case VisitState::Done:
        break;
      }
    }
  }

public:
  ClosureBuilder(unsigned numTargets, AnalysisDelegate* delegate,
                 std::vector<TargetSet>& closures)
      : delegate(delegate), closures(closures),
        states(numTargets, VisitState::Unvisited) {
    closures.resize(numTargets);
  }

  unsigned build(const TargetGraph& graph) {
    for (const auto& target: graph.getTargets()) {
      if (states[target->getIndex()] == VisitState::Unvisited)
        visit(*target);
    }
    return numCycles;
  }
};

}

TransitiveDependencyMap
TransitiveDependencyMap::compute(const TargetGraph& graph,
                                 AnalysisDelegate* delegate) {
  TransitiveDependencyMap result;
  ClosureBuilder builder(graph.size(), delegate, result.dependenciesByTarget);
  result.numCycles = builder.build(graph);
  return result;
}

ArrayRef<const Target*>
TransitiveDependencyMap::getDependencies(const Target& target) const {
  if (target.getIndex() >= dependenciesByTarget.size())
    return {};
  return dependenciesByTarget[target.getIndex()].getArrayRef();
}

bool TransitiveDependencyMap::dependsOn(const Target& target,
                                        const Target& dependency) const {
  if (target.getIndex() >= dependenciesByTarget.size())
    return false;
  return dependenciesByTarget[target.getIndex()].count(&dependency) != 0;
}
