//===-- ResolutionReport.cpp ----------------------------------------------===//
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

#include "jvmdeps/Resolve/ResolutionReport.h"

#include "llvm/ADT/SmallVector.h"

using namespace jvmdeps;
using namespace jvmdeps::resolve;

llvm::Optional<ModuleRef> ModuleRef::parse(StringRef spec) {
  SmallVector<StringRef, 3> components;
  spec.split(components, ':');
  if (components.size() < 2 || components.size() > 3)
    return llvm::None;

  for (auto& component: components) {
    component = component.trim();
    if (component.empty())
      return llvm::None;
  }

  return ModuleRef(components[0], components[1],
                   components.size() == 3 ? components[2] : StringRef());
}

bool ResolutionReport::addModule(ResolvedModule module) {
  auto it = moduleIndex.insert(std::make_pair(module.ref, modules.size()));
  if (!it.second)
    return false;
  modules.push_back(std::move(module));
  return true;
}

const ResolvedModule* ResolutionReport::lookup(const ModuleRef& ref) const {
  auto it = moduleIndex.find(ref);
  if (it == moduleIndex.end())
    return nullptr;
  return &modules[it->second];
}
