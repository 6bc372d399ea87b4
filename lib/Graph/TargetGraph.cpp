//===-- TargetGraph.cpp ---------------------------------------------------===//
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

#include "jvmdeps/Graph/TargetGraph.h"
#include "jvmdeps/Graph/Target.h"

#include "llvm/Support/ErrorHandling.h"

using namespace jvmdeps;
using namespace jvmdeps::graph;

StringRef graph::getTargetKindName(TargetKind kind) {
  switch (kind) {
  case TargetKind::Source: return "source";
  case TargetKind::Library: return "library";
  case TargetKind::Wrapper: return "wrapper";
  }
  llvm_unreachable("invalid target kind");
}

llvm::Optional<TargetKind> graph::parseTargetKind(StringRef name) {
  if (name == "source")
    return TargetKind::Source;
  if (name == "library")
    return TargetKind::Library;
  if (name == "wrapper")
    return TargetKind::Wrapper;
  return llvm::None;
}

llvm::Optional<LibraryReference> LibraryReference::parse(StringRef spec) {
  StringRef org, name;
  std::tie(org, name) = spec.split(':');
  org = org.trim();
  name = name.trim();
  if (org.empty() || name.empty() || name.contains(':'))
    return llvm::None;
  return LibraryReference(org, name);
}

#pragma mark - TargetGraph

Target* TargetGraph::findTarget(StringRef name) {
  auto it = targetsByName.find(name);
  if (it == targetsByName.end())
    return nullptr;
  return it->second;
}

const Target* TargetGraph::findTarget(StringRef name) const {
  return const_cast<TargetGraph*>(this)->findTarget(name);
}

Target* TargetGraph::addTarget(StringRef name, TargetKind kind) {
  auto it = targetsByName.try_emplace(name, nullptr);
  if (!it.second)
    return nullptr;

  targets.push_back(std::make_unique<Target>(name, kind, targets.size()));
  it.first->second = targets.back().get();
  return targets.back().get();
}
