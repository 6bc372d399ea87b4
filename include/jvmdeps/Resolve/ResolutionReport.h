//===- ResolutionReport.h ---------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_RESOLVE_RESOLUTIONREPORT_H
#define JVMDEPS_RESOLVE_RESOLUTIONREPORT_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"
#include "jvmdeps/Graph/Target.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace jvmdeps {
namespace resolve {

/// The coordinate of a resolved module.
struct ModuleRef {
  std::string org;
  std::string name;
  std::string rev;

  ModuleRef() {}
  ModuleRef(StringRef org, StringRef name, StringRef rev = "")
      : org(org), name(name), rev(rev) {}

  /// Parse an "org:name[:rev]" specifier.
  static llvm::Optional<ModuleRef> parse(StringRef spec);

  /// Get the library this module is an instance of.
  graph::LibraryReference getLibrary() const {
    return graph::LibraryReference(org, name);
  }

  std::string str() const {
    return rev.empty() ? org + ":" + name : org + ":" + name + ":" + rev;
  }

  bool operator==(const ModuleRef& rhs) const {
    return org == rhs.org && name == rhs.name && rev == rhs.rev;
  }
  bool operator<(const ModuleRef& rhs) const {
    return std::tie(org, name, rev) < std::tie(rhs.org, rhs.name, rhs.rev);
  }
};

/// A module recorded by a resolution.
struct ResolvedModule {
  ModuleRef ref;

  /// The archives the module itself resolved to.
  std::vector<std::string> artifacts;

  /// The modules this module directly depends on.
  std::vector<ModuleRef> dependencies;
};

/// The result of resolving a set of external libraries.
///
/// A report records every module the resolution visited, together with its
/// resolved archives and its direct edges in the resolution graph. Reports are
/// produced by the host build system's resolver and are immutable for the
/// duration of an invocation.
class ResolutionReport {
  std::vector<ResolvedModule> modules;

  /// Maps module coordinates to indices into \see modules.
  std::map<ModuleRef, unsigned> moduleIndex;

public:
  ResolutionReport() {}

  /// Add a module to the report.
  ///
  /// \returns False if the module was already recorded; the report is left
  /// unchanged in that case.
  JVMDEPS_UNUSED_RESULT bool addModule(ResolvedModule module);

  /// Get all recorded modules, in the order they were added.
  ArrayRef<ResolvedModule> getModules() const { return modules; }

  /// Look up a module.
  ///
  /// \returns The module, or null if the report does not record it.
  const ResolvedModule* lookup(const ModuleRef& ref) const;

  bool empty() const { return modules.empty(); }
};

}
}

#endif
