//===- DistributionLocator.h ------------------------------------*- C++ -*-===//
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

#ifndef JVMDEPS_ANALYSIS_DISTRIBUTIONLOCATOR_H
#define JVMDEPS_ANALYSIS_DISTRIBUTIONLOCATOR_H

#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace jvmdeps {
namespace analysis {

/// The system property listing the boot classpath entries.
extern const char* const BootClassPathProperty;

/// The system property listing the endorsed (override) directories.
extern const char* const EndorsedDirsProperty;

/// The system property listing the extension directories.
extern const char* const ExtensionDirsProperty;

/// Provides access to the platform runtime distribution used by the build.
class DistributionLocator {
public:
  virtual ~DistributionLocator();

  /// Get the value of a system property of the distribution.
  ///
  /// \returns The value, or None if the distribution does not define it.
  virtual llvm::Optional<std::string>
  getSystemProperty(StringRef key) const = 0;
};

/// A DistributionLocator whose system properties were recorded ahead of time.
class StaticDistributionLocator : public DistributionLocator {
  llvm::StringMap<std::string> properties;

public:
  StaticDistributionLocator() {}

  void setSystemProperty(StringRef key, StringRef value) {
    properties[key] = value.str();
  }

  virtual llvm::Optional<std::string>
  getSystemProperty(StringRef key) const override;
};

}
}

#endif
