//===-- SymlinkMap.cpp ----------------------------------------------------===//
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

#include "jvmdeps/Resolve/SymlinkMap.h"

using namespace jvmdeps;
using namespace jvmdeps::resolve;

void SymlinkMap::set(StringRef realPath, StringRef symlink) {
  std::lock_guard<std::mutex> guard(mapMutex);
  symlinks[realPath] = symlink.str();
}

SymlinkSnapshot SymlinkMap::snapshot() const {
  std::lock_guard<std::mutex> guard(mapMutex);
  return symlinks;
}

unsigned SymlinkMap::size() const {
  std::lock_guard<std::mutex> guard(mapMutex);
  return symlinks.size();
}
