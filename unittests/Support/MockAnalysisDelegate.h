//===- MockAnalysisDelegate.h -----------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_TESTS_MOCKANALYSISDELEGATE
#define JVMDEPS_TESTS_MOCKANALYSISDELEGATE

#include "jvmdeps/Analysis/AnalysisDelegate.h"
#include "jvmdeps/Graph/Target.h"

#include <string>
#include <vector>

namespace jvmdeps {
namespace unittests {

/// An analysis delegate which records the messages it receives.
class MockAnalysisDelegate : public analysis::AnalysisDelegate {
public:
  std::vector<std::string> errors;
  std::vector<std::string> notes;

  /// The names of the targets of each reported cycle.
  std::vector<std::vector<std::string>> cycles;

  virtual void error(const llvm::Twine& message) override {
    errors.push_back(message.str());
  }

  virtual void note(const llvm::Twine& message) override {
    notes.push_back(message.str());
  }

  virtual void
  cycleDetected(llvm::ArrayRef<const graph::Target*> items) override {
    std::vector<std::string> names;
    for (const auto* target: items) {
      names.push_back(target->getName().str());
    }
    cycles.push_back(std::move(names));
  }
};

}
}

#endif /* JVMDEPS_TESTS_MOCKANALYSISDELEGATE */
