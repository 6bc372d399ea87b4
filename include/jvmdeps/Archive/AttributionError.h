//===- AttributionError.h ---------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ARCHIVE_ATTRIBUTIONERROR_H
#define JVMDEPS_ARCHIVE_ATTRIBUTIONERROR_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <string>

namespace jvmdeps {
namespace archive {

/// A fatal failure to attribute the contents of a file.
///
/// Attribution errors are raised when an archive that must be indexed cannot
/// be read, and always identify the offending file. They are distinct from the
/// failures of the build itself, and are never retried: a corrupt archive will
/// not become readable on a second attempt.
class AttributionError : public llvm::ErrorInfo<AttributionError> {
  std::string path;
  std::string message;

public:
  static char ID;

  AttributionError(StringRef path, const Twine& message)
      : path(path), message(message.str()) {}

  /// Get the path of the file which could not be attributed.
  StringRef getPath() const { return path; }

  /// Get the reason for the failure.
  StringRef getMessage() const { return message; }

  virtual void log(raw_ostream& os) const override;

  virtual std::error_code convertToErrorCode() const override;
};

}
}

#endif
