//===- AnalysisFile.h -------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSISFILE_ANALYSISFILE_H
#define JVMDEPS_ANALYSISFILE_ANALYSISFILE_H

#include "jvmdeps/Analysis/AnalysisContext.h"
#include "jvmdeps/Analysis/CompiledOutputManifest.h"
#include "jvmdeps/Analysis/DistributionLocator.h"
#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"
#include "jvmdeps/Graph/TargetGraph.h"
#include "jvmdeps/Resolve/ResolutionReport.h"
#include "jvmdeps/Resolve/SymlinkMap.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace jvmdeps {
namespace basic {

class FileSystem;

}

namespace analysisfile {

/// Minimal token object representing the range where a diagnostic occurred.
struct AnalysisFileToken {
  const char* start;
  unsigned length;
};

class AnalysisFileDelegate {
public:
  virtual ~AnalysisFileDelegate();

  /// Get the file system to use for access.
  virtual basic::FileSystem& getFileSystem() = 0;

  /// Called by the loader to register the current file contents.
  virtual void setFileContentsBeingParsed(StringRef buffer) = 0;

  /// Called by the loader to report an error.
  ///
  /// \param filename The file the error occurred in.
  ///
  /// \param at The token at which the error occurred. The token will be null if
  /// no location is associated.
  ///
  /// \param message The diagnostic message.
  virtual void error(StringRef filename,
                     const AnalysisFileToken& at,
                     const Twine& message) = 0;
};

/// The inputs of an analysis, as loaded from an analysis description file.
class AnalysisDescription {
  // DO NOT COPY
  AnalysisDescription(const AnalysisDescription&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const AnalysisDescription&) JVMDEPS_DELETED_FUNCTION;

  graph::TargetGraph graph;

  analysis::CompiledOutputManifest outputs;

  std::vector<std::unique_ptr<resolve::ResolutionReport>> reports;

  resolve::SymlinkMap symlinks;

  /// The platform distribution, or null if none was described.
  std::unique_ptr<analysis::StaticDistributionLocator> distribution;

  analysis::AnalysisOptions options;

public:
  AnalysisDescription() {}

  graph::TargetGraph& getGraph() { return graph; }
  const graph::TargetGraph& getGraph() const { return graph; }

  analysis::CompiledOutputManifest& getOutputs() { return outputs; }
  const analysis::CompiledOutputManifest& getOutputs() const {
    return outputs;
  }

  std::vector<std::unique_ptr<resolve::ResolutionReport>>& getReports() {
    return reports;
  }
  const std::vector<std::unique_ptr<resolve::ResolutionReport>>&
  getReports() const {
    return reports;
  }

  resolve::SymlinkMap& getSymlinks() { return symlinks; }
  const resolve::SymlinkMap& getSymlinks() const { return symlinks; }

  std::unique_ptr<analysis::StaticDistributionLocator>& getDistribution() {
    return distribution;
  }
  const analysis::StaticDistributionLocator* getDistribution() const {
    return distribution.get();
  }

  analysis::AnalysisOptions& getOptions() { return options; }
  const analysis::AnalysisOptions& getOptions() const { return options; }

  /// Create the context for analyzing this description.
  ///
  /// The description must outlive the context.
  analysis::AnalysisContext
  createContext(basic::FileSystem& fileSystem,
                analysis::AnalysisDelegate& delegate) const;
};

/// The AnalysisFile class loads analysis description files.
///
/// An analysis description file is a YAML document with the optional
/// top-level sections 'options', 'targets', 'outputs', 'resolution',
/// 'symlinks' and 'distribution', in any order.
class AnalysisFile {
private:
  void *impl;

public:
  /// Create an analysis file with the given delegate.
  ///
  /// \arg mainFilename The path of the analysis description file.
  explicit AnalysisFile(StringRef mainFilename,
                        AnalysisFileDelegate& delegate);
  ~AnalysisFile();

  /// Return the delegate the file was configured with.
  AnalysisFileDelegate* getDelegate();

  /// Load the analysis description from the provided filename.
  ///
  /// \returns A non-null description on success.
  std::unique_ptr<AnalysisDescription> load();
};

}
}

#endif
