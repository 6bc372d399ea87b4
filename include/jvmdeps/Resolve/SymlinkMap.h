//===- SymlinkMap.h ---------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_RESOLVE_SYMLINKMAP_H
#define JVMDEPS_RESOLVE_SYMLINKMAP_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <mutex>
#include <string>

namespace jvmdeps {
namespace resolve {

/// An immutable copy of a \see SymlinkMap.
typedef llvm::StringMap<std::string> SymlinkSnapshot;

/// Maps the canonical path of each resolved archive to the symlink through
/// which the resolve area exposes it.
///
/// The map is shared with concurrently running build phases, which may add
/// entries at any time. Readers never iterate the live map; they take a
/// \see snapshot() and work from the copy.
class SymlinkMap {
  // DO NOT COPY
  SymlinkMap(const SymlinkMap&) JVMDEPS_DELETED_FUNCTION;
  void operator=(const SymlinkMap&) JVMDEPS_DELETED_FUNCTION;

  mutable std::mutex mapMutex;

  /// The live map. Only accessed with \see mapMutex held.
  llvm::StringMap<std::string> symlinks;

public:
  SymlinkMap() {}

  /// Record that the archive at \arg realPath is exposed as \arg symlink,
  /// replacing any earlier entry for \arg realPath.
  void set(StringRef realPath, StringRef symlink);

  /// Copy the current contents of the map.
  ///
  /// The lock is only held for the duration of the copy.
  SymlinkSnapshot snapshot() const;

  unsigned size() const;
};

}
}

#endif
