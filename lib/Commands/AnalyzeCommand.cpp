//===-- AnalyzeCommand.cpp ------------------------------------------------===//
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

#include "jvmdeps/Commands/Commands.h"

#include "jvmdeps/Analysis/AnalysisDelegate.h"
#include "jvmdeps/Analysis/DependencyAnalyzer.h"
#include "jvmdeps/AnalysisFile/AnalysisFile.h"
#include "jvmdeps/Basic/FileSystem.h"
#include "jvmdeps/Graph/TargetGraph.h"

#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include "CommandUtil.h"

#include <cstdio>
#include <cstdlib>

using namespace jvmdeps;
using namespace jvmdeps::analysis;
using namespace jvmdeps::analysisfile;
using namespace jvmdeps::commands;

namespace {

class LoadAnalysisFileDelegate : public AnalysisFileDelegate {
  StringRef bufferBeingParsed;
  std::unique_ptr<basic::FileSystem> fileSystem;

public:
  LoadAnalysisFileDelegate()
      : fileSystem(basic::createLocalFileSystem()) {}
  ~LoadAnalysisFileDelegate() {}

  virtual basic::FileSystem& getFileSystem() override { return *fileSystem; }

  virtual void setFileContentsBeingParsed(StringRef buffer) override {
    bufferBeingParsed = buffer;
  }

  virtual void error(StringRef filename,
                     const AnalysisFileToken& at,
                     const Twine& message) override {
    if (at.start) {
      util::emitError(filename, message.str(), at.start, at.length,
                      bufferBeingParsed);
    } else {
      fprintf(stderr, "%s: error: %s\n", filename.str().c_str(),
              message.str().c_str());
    }
  }
};

class CommandAnalysisDelegate : public AnalysisDelegate {
  llvm::SourceMgr sourceMgr;

public:
  unsigned numErrors = 0;

  virtual void error(const Twine& message) override {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
    ++numErrors;
  }

  virtual void note(const Twine& message) override {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Note, message);
  }

  virtual void cycleDetected(ArrayRef<const graph::Target*> items) override {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Warning,
                           formatDetectedCycle(items));
  }
};

enum class AnalysisKind {
  Ownership,
  Closure,
  Bootstrap,
  Owner
};

}

static void analyzeUsage(int exitCode) {
  int optionWidth = 20;
  fprintf(stderr, "Usage: %s analyze [--help] <command> [options] <path> "
          "[<args>]\n", getProgramName());
  fprintf(stderr, "\nAvailable commands:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "ownership",
          "print the owners of every known file");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "closure",
          "print the transitive dependencies of every target");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "bootstrap",
          "print the classfiles provided by the platform");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "owner <file>",
          "print the canonical owner of one file");
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--verbose",
          "show analysis progress");
  ::exit(exitCode);
}

static void printTargetList(StringRef key,
                            ArrayRef<const graph::Target*> targets) {
  llvm::outs() << key << ":";
  bool first = true;
  for (const auto* target: targets) {
    llvm::outs() << (first ? " " : ", ") << target->getName();
    first = false;
  }
  llvm::outs() << "\n";
}

static int printOwnership(DependencyAnalyzer& analyzer,
                          CommandAnalysisDelegate& delegate) {
  auto index = analyzer.getTargetsByFile();
  if (!index) {
    delegate.error(llvm::toString(index.takeError()));
    return 1;
  }

  for (auto file: (*index)->getSortedFiles()) {
    printTargetList(file, (*index)->getOwners(file));
  }
  return 0;
}

static int printClosure(DependencyAnalyzer& analyzer) {
  const auto& closure = analyzer.getTransitiveDependencies();
  for (const auto& target: analyzer.getContext().graph.getTargets()) {
    printTargetList(target->getName(), closure.getDependencies(*target));
  }
  return 0;
}

static int printBootstrap(DependencyAnalyzer& analyzer,
                          CommandAnalysisDelegate& delegate) {
  auto index = analyzer.getBootstrapClassfiles();
  if (!index) {
    delegate.error(llvm::toString(index.takeError()));
    return 1;
  }

  for (auto classfile: (*index)->getSortedClassfiles()) {
    llvm::outs() << classfile << "\n";
  }
  return 0;
}

static int printOwner(DependencyAnalyzer& analyzer,
                      CommandAnalysisDelegate& delegate, StringRef file) {
  auto index = analyzer.getTargetsByFile();
  if (!index) {
    delegate.error(llvm::toString(index.takeError()));
    return 1;
  }

  const graph::Target* owner = (*index)->getCanonicalOwner(file);
  if (!owner) {
    fprintf(stderr, "%s: no owner for \"%s\"\n", getProgramName(),
            util::escapedString(file).c_str());
    return 1;
  }
  llvm::outs() << owner->getName() << "\n";
  return 0;
}

int commands::executeAnalyzeCommand(const std::vector<std::string> &argsIn) {
  std::vector<std::string> args(argsIn);

  if (args.empty() || args[0] == "--help")
    analyzeUsage(0);

  const std::string command = args[0];
  args.erase(args.begin());

  AnalysisKind kind;
  unsigned numArguments = 1;
  if (command == "ownership") {
    kind = AnalysisKind::Ownership;
  } else if (command == "closure") {
    kind = AnalysisKind::Closure;
  } else if (command == "bootstrap") {
    kind = AnalysisKind::Bootstrap;
  } else if (command == "owner") {
    kind = AnalysisKind::Owner;
    numArguments = 2;
  } else {
    fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
            command.c_str());
    analyzeUsage(1);
    return 1;
  }

  bool verbose = false;
  while (!args.empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      analyzeUsage(0);
    } else if (option == "--verbose") {
      verbose = true;
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      analyzeUsage(1);
    }
  }

  if (args.size() != numArguments) {
    fprintf(stderr, "error: %s: invalid number of arguments\n",
            getProgramName());
    analyzeUsage(1);
  }

  std::string filename = args[0];

  // Load the analysis description.
  LoadAnalysisFileDelegate fileDelegate;
  AnalysisFile file(filename, fileDelegate);
  auto description = file.load();
  if (!description)
    return 1;

  CommandAnalysisDelegate delegate;
  auto context = description->createContext(fileDelegate.getFileSystem(),
                                            delegate);
  if (verbose)
    context.options.verbose = true;
  DependencyAnalyzer analyzer(context);

  int result = 0;
  switch (kind) {
  case AnalysisKind::Ownership:
    result = printOwnership(analyzer, delegate);
    break;
  case AnalysisKind::Closure:
    result = printClosure(analyzer);
    break;
  case AnalysisKind::Bootstrap:
    result = printBootstrap(analyzer, delegate);
    break;
  case AnalysisKind::Owner:
    result = printOwner(analyzer, delegate, args[1]);
    break;
  }

  llvm::outs().flush();
  if (delegate.numErrors != 0)
    return 1;
  return result;
}
