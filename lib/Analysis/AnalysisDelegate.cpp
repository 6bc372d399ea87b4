//===-- AnalysisDelegate.cpp ----------------------------------------------===//
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

#include "jvmdeps/Analysis/AnalysisDelegate.h"

#include "jvmdeps/Graph/Target.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/raw_ostream.h"

using namespace jvmdeps;
using namespace jvmdeps::analysis;

AnalysisDelegate::~AnalysisDelegate() {}

std::string analysis::formatDetectedCycle(
    ArrayRef<const graph::Target*> items) {
  SmallString<256> message;
  llvm::raw_svector_ostream os(message);
  os << "cycle detected among targets: ";
  bool first = true;
  for (const auto* target: items) {
    if (!first)
      os << " -> ";
    os << "'" << target->getName() << "'";
    first = false;
  }
  return os.str().str();
}
