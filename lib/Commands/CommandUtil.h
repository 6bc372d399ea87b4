//===- CommandUtil.h --------------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_COMMANDS_COMMANDUTIL_H
#define JVMDEPS_COMMANDS_COMMANDUTIL_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace jvmdeps {
namespace commands {
namespace util {

std::string escapedString(StringRef str);

/// Report an error at a position within \arg buffer, followed by the source
/// line and a caret or squiggly marking the range.
void emitError(StringRef filename, StringRef message,
               const char* position, unsigned length,
               StringRef buffer);

}
}
}

#endif
