//===- Version.h ------------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_BASIC_VERSION_H
#define JVMDEPS_BASIC_VERSION_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace jvmdeps {

/// Get the full version string of the tool, including any vendor and build
/// information configured at compile time.
std::string getJVMDepsFullVersion(StringRef productName = "jvmdeps");

}

#endif
