//===-- AttributionError.cpp ----------------------------------------------===//
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

#include "jvmdeps/Archive/AttributionError.h"

#include "llvm/Support/raw_ostream.h"

using namespace jvmdeps;
using namespace jvmdeps::archive;

char AttributionError::ID = 0;

void AttributionError::log(raw_ostream& os) const {
  os << "unable to attribute '" << path << "': " << message;
}

std::error_code AttributionError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}
