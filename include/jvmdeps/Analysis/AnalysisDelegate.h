//===- AnalysisDelegate.h ---------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_ANALYSISDELEGATE_H
#define JVMDEPS_ANALYSIS_ANALYSISDELEGATE_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Twine.h"

#include <string>

namespace jvmdeps {
namespace graph {

class Target;

}

namespace analysis {

/// Delegate interface for diagnostics produced by the analysis.
///
/// The analysis never writes output itself; clients decide how (and whether)
/// diagnostics are shown.
class AnalysisDelegate {
public:
  virtual ~AnalysisDelegate();

  /// Called to report an error which prevents an analysis product from being
  /// built.
  virtual void error(const Twine& message) = 0;

  /// Called to report analysis progress, when verbose output is enabled.
  virtual void note(const Twine& message) = 0;

  /// Called when a dependency cycle is found while computing transitive
  /// dependencies. The computation continues with a partial result.
  ///
  /// \param items The ordered list of targets comprising the cycle, starting
  /// and ending with the target which closes the cycle (i.e., that target
  /// appears twice).
  virtual void cycleDetected(ArrayRef<const graph::Target*> items) = 0;
};

/// Describe a cycle reported by \see AnalysisDelegate::cycleDetected().
std::string formatDetectedCycle(ArrayRef<const graph::Target*> items);

}
}

#endif
