//===- BootstrapArtifactIndex.h ---------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_BOOTSTRAPARTIFACTINDEX_H
#define JVMDEPS_ANALYSIS_BOOTSTRAPARTIFACTINDEX_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace jvmdeps {
namespace archive {

class ArchiveIndex;

}

namespace basic {

class FileSystem;

}

namespace analysis {

class DistributionLocator;

/// The set of classfiles provided by the platform runtime itself.
///
/// Classfiles in this set do not belong to any target, and are excluded from
/// attribution by downstream consumers.
class BootstrapArtifactIndex {
  /// The bootstrap jars, in classloading order.
  std::vector<std::string> jars;

  llvm::StringSet<> classfiles;

public:
  BootstrapArtifactIndex() {}
  BootstrapArtifactIndex(BootstrapArtifactIndex&&) = default;
  BootstrapArtifactIndex& operator=(BootstrapArtifactIndex&&) = default;

  /// Find the bootstrap jars of a distribution, in classloading order: the
  /// jars in the endorsed (override) directories, then the boot classpath
  /// entries, then the jars in the extension directories.
  ///
  /// Only entries which are regular files are returned; directories on the
  /// boot classpath hold loose classes, which are not indexed.
  ///
  /// \returns The jars, or an \see archive::AttributionError if an existing
  /// platform directory could not be listed.
  static llvm::Expected<std::vector<std::string>>
  findBootstrapJars(const DistributionLocator& distribution,
                    basic::FileSystem& fs, StringRef archiveSuffix = ".jar");

  /// Build the index of the classfiles in the bootstrap jars of
  /// \arg distribution.
  static llvm::Expected<BootstrapArtifactIndex>
  build(const DistributionLocator& distribution, basic::FileSystem& fs,
        archive::ArchiveIndex& archives, StringRef archiveSuffix = ".jar");

  /// Check whether \arg classfile is provided by the platform.
  bool contains(StringRef classfile) const {
    return classfiles.count(classfile) != 0;
  }

  /// Get the jars the index was built from.
  ArrayRef<std::string> getJars() const { return jars; }

  unsigned size() const { return classfiles.size(); }

  bool empty() const { return classfiles.empty(); }

  /// Get all classfiles in lexicographic order.
  std::vector<StringRef> getSortedClassfiles() const;
};

}
}

#endif
