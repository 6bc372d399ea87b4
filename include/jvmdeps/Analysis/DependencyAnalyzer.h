//===- DependencyAnalyzer.h -------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_DEPENDENCYANALYZER_H
#define JVMDEPS_ANALYSIS_DEPENDENCYANALYZER_H

#include "jvmdeps/Analysis/AnalysisContext.h"
#include "jvmdeps/Analysis/BootstrapArtifactIndex.h"
#include "jvmdeps/Analysis/FileOwnershipIndex.h"
#include "jvmdeps/Analysis/TransitiveDependencyMap.h"
#include "jvmdeps/Archive/ArchiveIndex.h"
#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/Support/Error.h"

#include <memory>
#include <mutex>

namespace jvmdeps {
namespace archive {

class ArchiveReader;

}

namespace analysis {

/// The per-invocation entry point to the dependency analysis.
///
/// Each analysis product is built on first request and cached for the
/// lifetime of the analyzer. A product which failed to build is not cached,
/// and the next request will attempt to build it again. All products share one
/// \see archive::ArchiveIndex, so each archive is read at most once.
///
/// The accessors may be called concurrently.
class DependencyAnalyzer {
  // DO NOT COPY
  DependencyAnalyzer(const DependencyAnalyzer&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const DependencyAnalyzer&) JVMDEPS_DELETED_FUNCTION;

  AnalysisContext context;

  /// The default archive reader, if one was not supplied.
  std::unique_ptr<archive::ArchiveReader> ownedReader;

  archive::ArchiveIndex archives;

  /// Mutex protecting the cached products and the archive index.
  std::mutex analyzerMutex;

  std::unique_ptr<FileOwnershipIndex> targetsByFile;
  std::unique_ptr<BootstrapArtifactIndex> bootstrapClassfiles;
  std::unique_ptr<TransitiveDependencyMap> transitiveDependencies;

public:
  /// Create an analyzer which reads archives as zip files through the context
  /// file system.
  explicit DependencyAnalyzer(const AnalysisContext& context);

  /// Create an analyzer which lists archives using \arg reader.
  ///
  /// The reader must outlive the analyzer.
  DependencyAnalyzer(const AnalysisContext& context,
                     archive::ArchiveReader& reader);
  ~DependencyAnalyzer();

  const AnalysisContext& getContext() const { return context; }

  /// Get the owners of every known file.
  ///
  /// \returns The index, or the error which prevented it from being built.
  llvm::Expected<const FileOwnershipIndex*> getTargetsByFile();

  /// Get the classfiles provided by the platform distribution.
  ///
  /// If the context has no distribution, the index is empty.
  llvm::Expected<const BootstrapArtifactIndex*> getBootstrapClassfiles();

  /// Get the transitive dependencies of every target.
  const TransitiveDependencyMap& getTransitiveDependencies();

  /// Get the number of archives listed so far.
  unsigned getNumArchivesRead();
};

}
}

#endif
