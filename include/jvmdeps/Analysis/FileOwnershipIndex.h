//===- FileOwnershipIndex.h -------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_FILEOWNERSHIPINDEX_H
#define JVMDEPS_ANALYSIS_FILEOWNERSHIPINDEX_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SetVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <vector>

namespace jvmdeps {
namespace archive {

class ArchiveIndex;

}

namespace graph {

class Target;

}

namespace analysis {

struct AnalysisContext;

/// An insertion-ordered set of targets.
typedef llvm::SetVector<const graph::Target*> TargetSet;

/// Maps every known file to the targets which own or provide it.
///
/// Files are identified by strings, which are one of:
///   o The absolute path of a declared source.
///   o The path of a compiled classfile relative to its output directory, and
///     the same path joined with the output directory.
///   o The name of a classfile entry inside a resolved archive.
///
/// The owners of a file are ordered by registration. The index is built so
/// that direct ownership (declared sources and compiled outputs) is always
/// registered before ownership derived from resolved archives, which makes the
/// first owner of a file its canonical owner: a target that produces a file
/// directly precedes any library aggregate that also provides it.
class FileOwnershipIndex {
public:
  typedef llvm::StringMap<TargetSet> owner_map;

private:
  owner_map ownersByFile;

public:
  FileOwnershipIndex() {}
  FileOwnershipIndex(FileOwnershipIndex&&) = default;
  FileOwnershipIndex& operator=(FileOwnershipIndex&&) = default;

  /// Build the index for the invocation described by \arg context.
  ///
  /// \param archives The index used to list resolved archives.
  ///
  /// \returns The index, or the \see archive::AttributionError raised by the
  /// first resolved archive which could not be read.
  static llvm::Expected<FileOwnershipIndex>
  build(const AnalysisContext& context, archive::ArchiveIndex& archives);

  /// Register \arg target as an owner of \arg file.
  ///
  /// Registering an existing owner again has no effect; in particular it does
  /// not change the owner's precedence.
  void addOwner(StringRef file, const graph::Target& target) {
    ownersByFile[file].insert(&target);
  }

  /// Get the owners of \arg file, in order of precedence.
  ///
  /// \returns The owners, or an empty list if the file is unknown.
  ArrayRef<const graph::Target*> getOwners(StringRef file) const;

  /// Get the canonical (first) owner of \arg file.
  ///
  /// \returns The owner, or null if the file is unknown.
  const graph::Target* getCanonicalOwner(StringRef file) const;

  bool contains(StringRef file) const { return ownersByFile.count(file) != 0; }

  unsigned size() const { return ownersByFile.size(); }

  bool empty() const { return ownersByFile.empty(); }

  const owner_map& getOwnerMap() const { return ownersByFile; }

  /// Get all known files in lexicographic order.
  std::vector<StringRef> getSortedFiles() const;
};

}
}

#endif
