//===- Target.h -------------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_GRAPH_TARGET_H
#define JVMDEPS_GRAPH_TARGET_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <tuple>
#include <vector>

namespace jvmdeps {
namespace graph {

/// The closed set of target variants the analysis distinguishes.
enum class TargetKind {
  /// A target which produces JVM code from its declared sources.
  Source,

  /// An aggregate of externally resolved libraries.
  Library,

  /// A source-producing target which additionally consumes the sources of
  /// nested derived targets (generated sources of another language which are
  /// compiled as part of the outer target).
  Wrapper
};

/// Get the name of a target kind, as used in analysis description files.
StringRef getTargetKindName(TargetKind kind);

/// Parse a target kind name.
llvm::Optional<TargetKind> parseTargetKind(StringRef name);

/// An (organization, name) pair identifying an externally resolvable library.
struct LibraryReference {
  std::string org;
  std::string name;

  LibraryReference() {}
  LibraryReference(StringRef org, StringRef name) : org(org), name(name) {}

  /// Parse an "org:name" specifier.
  static llvm::Optional<LibraryReference> parse(StringRef spec);

  std::string str() const { return org + ":" + name; }

  bool operator==(const LibraryReference& rhs) const {
    return org == rhs.org && name == rhs.name;
  }
  bool operator!=(const LibraryReference& rhs) const {
    return !(*this == rhs);
  }
  bool operator<(const LibraryReference& rhs) const {
    return std::tie(org, name) < std::tie(rhs.org, rhs.name);
  }
};

/// A node in the build graph.
///
/// Targets are owned by their \see TargetGraph, and are only mutated while the
/// graph is being loaded. The analysis always refers to targets by const
/// pointer, and target identity is pointer identity.
class Target {
  // DO NOT COPY
  Target(const Target&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const Target&) JVMDEPS_DELETED_FUNCTION;
  Target &operator=(Target&& rhs) JVMDEPS_DELETED_FUNCTION;

  /// The unique name of the target.
  std::string name;

  /// The kind of the target.
  TargetKind kind;

  /// The position of the target in its graph.
  unsigned index;

  /// The declared sources, relative to the build root (or absolute).
  std::vector<std::string> sources;

  /// The declared dependencies.
  std::vector<const Target*> dependencies;

  /// The libraries declared by a library aggregate.
  std::vector<LibraryReference> libraries;

  /// The nested derived targets of a wrapper.
  std::vector<const Target*> nestedTargets;

public:
  Target(StringRef name, TargetKind kind, unsigned index)
      : name(name), kind(kind), index(index) {}

  StringRef getName() const { return name; }

  TargetKind getKind() const { return kind; }

  /// Get the position of the target in its graph, which is suitable for use as
  /// an index into per-target tables.
  unsigned getIndex() const { return index; }

  ArrayRef<std::string> getSources() const { return sources; }

  ArrayRef<const Target*> getDependencies() const { return dependencies; }

  ArrayRef<LibraryReference> getLibraries() const { return libraries; }

  ArrayRef<const Target*> getNestedTargets() const { return nestedTargets; }

  /// @name Construction Helpers.
  /// @{

  void addSource(StringRef source) { sources.push_back(source.str()); }

  void addDependency(const Target& dependency) {
    dependencies.push_back(&dependency);
  }

  void addLibrary(LibraryReference library) {
    libraries.push_back(std::move(library));
  }

  void addNestedTarget(const Target& nested) {
    nestedTargets.push_back(&nested);
  }

  /// @}
};

}
}

#endif
