//===- AnalysisContext.h ----------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_ANALYSISCONTEXT_H
#define JVMDEPS_ANALYSIS_ANALYSISCONTEXT_H

#include "jvmdeps/Basic/LLVM.h"

#include <string>
#include <vector>

namespace jvmdeps {
namespace basic {

class FileSystem;

}

namespace graph {

class TargetGraph;

}

namespace resolve {

class ResolutionReport;
class SymlinkMap;

}

namespace analysis {

class AnalysisDelegate;
class CompiledOutputManifest;
class DistributionLocator;

/// The options which control an analysis.
struct AnalysisOptions {
  /// The root which relative target sources are resolved against.
  std::string buildRoot;

  /// The suffix identifying compiled classfiles, both on disk and in archives.
  std::string classfileSuffix = ".class";

  /// The suffix identifying archives in platform directories.
  std::string archiveSuffix = ".jar";

  /// Whether the analysis is disabled. A skipped analysis produces empty
  /// results without accessing the file system.
  bool skip = false;

  /// Whether progress notes are sent to the delegate.
  bool verbose = false;
};

/// The collaborators consumed by the analysis of a single build invocation.
///
/// The context does not own any of its collaborators, which must outlive every
/// analysis using it.
struct AnalysisContext {
  /// The targets of the invocation.
  const graph::TargetGraph& graph;

  /// The compiled outputs of the targets.
  const CompiledOutputManifest& outputs;

  /// The resolution reports of the invocation. Empty if no resolution was
  /// performed.
  std::vector<const resolve::ResolutionReport*> reports;

  /// The resolve-area symlinks, if any.
  const resolve::SymlinkMap* symlinks = nullptr;

  /// The platform distribution, if known.
  const DistributionLocator* distribution = nullptr;

  /// The file system used to read archives and platform directories.
  basic::FileSystem& fileSystem;

  /// The diagnostics delegate.
  AnalysisDelegate& delegate;

  AnalysisOptions options;

  AnalysisContext(const graph::TargetGraph& graph,
                  const CompiledOutputManifest& outputs,
                  basic::FileSystem& fileSystem,
                  AnalysisDelegate& delegate)
      : graph(graph), outputs(outputs), fileSystem(fileSystem),
        delegate(delegate) {}
};

}
}

#endif
