//===-- DistributionLocator.cpp -------------------------------------------===//
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

#include "jvmdeps/Analysis/DistributionLocator.h"

using namespace jvmdeps;
using namespace jvmdeps::analysis;

const char* const analysis::BootClassPathProperty = "sun.boot.class.path";
const char* const analysis::EndorsedDirsProperty = "java.endorsed.dirs";
const char* const analysis::ExtensionDirsProperty = "java.ext.dirs";

DistributionLocator::~DistributionLocator() {}

llvm::Optional<std::string>
StaticDistributionLocator::getSystemProperty(StringRef key) const {
  auto it = properties.find(key);
  if (it == properties.end())
    return llvm::None;
  return it->second;
}
