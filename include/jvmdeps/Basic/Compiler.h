//===- Compiler.h -----------------------------------------------*- C++ -*-===//
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
//
// Compiler support and compatibility macros. Liberally taken from LLVM.
//
//===----------------------------------------------------------------------===//

#ifndef JVMDEPS_BASIC_COMPILER_H
#define JVMDEPS_BASIC_COMPILER_H

#if !defined(__has_feature)
#define __has_feature(x) 0
#endif

/// JVMDEPS_DELETED_FUNCTION - Expands to = delete if the compiler supports it.
/// Use to mark functions as uncallable. Member functions with this should be
/// declared private.
///
/// class DontCopy {
/// private:
///   DontCopy(const DontCopy&) JVMDEPS_DELETED_FUNCTION;
///   DontCopy &operator =(const DontCopy&) JVMDEPS_DELETED_FUNCTION;
/// public:
///   ...
/// };
#define JVMDEPS_DELETED_FUNCTION = delete

/// JVMDEPS_UNUSED_RESULT - Marks a function whose result must be checked.
#if __has_feature(cxx_attributes) || defined(__GNUC__)
#define JVMDEPS_UNUSED_RESULT __attribute__((warn_unused_result))
#else
#define JVMDEPS_UNUSED_RESULT
#endif

#endif
