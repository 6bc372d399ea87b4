//===- CompiledOutputManifest.h ---------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_COMPILEDOUTPUTMANIFEST_H
#define JVMDEPS_ANALYSIS_COMPILEDOUTPUTMANIFEST_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace jvmdeps {
namespace graph {

class Target;

}

namespace analysis {

/// A file produced by compiling a target.
struct CompiledOutput {
  /// The output directory the file was written to.
  std::string directory;

  /// The path of the file, relative to \see directory.
  std::string relativePath;
};

/// The compiled outputs of each target of an invocation.
class CompiledOutputManifest {
public:
  typedef llvm::MapVector<const graph::Target*, std::vector<CompiledOutput>>
    output_map;

private:
  output_map outputs;

public:
  CompiledOutputManifest() {}

  /// Record that \arg target produced \arg relativePath in \arg directory.
  void addOutput(const graph::Target& target, StringRef directory,
                 StringRef relativePath) {
    outputs[&target].push_back({ directory.str(), relativePath.str() });
  }

  /// Get the outputs of \arg target, in the order they were recorded.
  ArrayRef<CompiledOutput> getOutputs(const graph::Target& target) const {
    auto it = outputs.find(&target);
    if (it == outputs.end())
      return {};
    return it->second;
  }

  /// Get the outputs of all targets, in the order the targets were first
  /// recorded.
  const output_map& getAllOutputs() const { return outputs; }

  bool empty() const { return outputs.empty(); }
};

}
}

#endif
