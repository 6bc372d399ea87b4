//===-- DependencyAnalyzer.cpp --------------------------------------------===//
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

#include "jvmdeps/Analysis/DependencyAnalyzer.h"

#include "jvmdeps/Analysis/AnalysisDelegate.h"
#include "jvmdeps/Archive/ArchiveReader.h"
#include "jvmdeps/Basic/FileSystem.h"
#include "jvmdeps/Graph/TargetGraph.h"

using namespace jvmdeps;
using namespace jvmdeps::analysis;

DependencyAnalyzer::DependencyAnalyzer(const AnalysisContext& context)
    : context(context),
      ownedReader(archive::createZipArchiveReader(context.fileSystem)),
      archives(*ownedReader, context.options.classfileSuffix) {}

DependencyAnalyzer::DependencyAnalyzer(const AnalysisContext& context,
                                       archive::ArchiveReader& reader)
    : context(context), archives(reader, context.options.classfileSuffix) {}

DependencyAnalyzer::~DependencyAnalyzer() {}

llvm::Expected<const FileOwnershipIndex*>
DependencyAnalyzer::getTargetsByFile() {
  std::lock_guard<std::mutex> guard(analyzerMutex);

  if (targetsByFile)
    return targetsByFile.get();

  if (context.options.skip) {
    targetsByFile = std::make_unique<FileOwnershipIndex>();
    return targetsByFile.get();
  }

  auto result = FileOwnershipIndex::build(context, archives);
  if (!result)
    return result.takeError();
  targetsByFile = std::make_unique<FileOwnershipIndex>(std::move(*result));
  return targetsByFile.get();
}

llvm::Expected<const BootstrapArtifactIndex*>
DependencyAnalyzer::getBootstrapClassfiles() {
  std::lock_guard<std::mutex> guard(analyzerMutex);

  if (bootstrapClassfiles)
    return bootstrapClassfiles.get();

  if (context.options.skip || !context.distribution) {
    bootstrapClassfiles = std::make_unique<BootstrapArtifactIndex>();
    return bootstrapClassfiles.get();
  }

  if (context.options.verbose)
    context.delegate.note("mapping bootstrap classes...");

  auto result = BootstrapArtifactIndex::build(
      *context.distribution, context.fileSystem, archives,
      context.options.archiveSuffix);
  if (!result)
    return result.takeError();
  bootstrapClassfiles =
    std::make_unique<BootstrapArtifactIndex>(std::move(*result));
  return bootstrapClassfiles.get();
}

const TransitiveDependencyMap&
DependencyAnalyzer::getTransitiveDependencies() {
  std::lock_guard<std::mutex> guard(analyzerMutex);

  if (!transitiveDependencies) {
    if (context.options.skip) {
      transitiveDependencies = std::make_unique<TransitiveDependencyMap>();
    } else {
      transitiveDependencies = std::make_unique<TransitiveDependencyMap>(
          TransitiveDependencyMap::compute(context.graph, &context.delegate));
    }
  }
  return *transitiveDependencies;
}

unsigned DependencyAnalyzer::getNumArchivesRead() {
  std::lock_guard<std::mutex> guard(analyzerMutex);
  return archives.getNumCachedArchives();
}
