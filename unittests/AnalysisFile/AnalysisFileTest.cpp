//===- unittests/AnalysisFile/AnalysisFileTest.cpp ------------------------===//
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

#include "../Support/MockAnalysisDelegate.h"
#include "../Support/MockArchiveReader.h"
#include "../Support/TempDir.h"

#include "jvmdeps/Analysis/DependencyAnalyzer.h"
#include "jvmdeps/AnalysisFile/AnalysisFile.h"
#include "jvmdeps/Basic/FileSystem.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"

#include "gtest/gtest.h"

using namespace jvmdeps;
using namespace jvmdeps::analysisfile;
using namespace jvmdeps::graph;
using namespace jvmdeps::unittests;

namespace {

class TestAnalysisFileDelegate : public AnalysisFileDelegate {
  std::unique_ptr<basic::FileSystem> fileSystem =
    basic::createLocalFileSystem();

public:
  std::vector<std::string> errors;

  /// Whether each error was attached to a location in the file.
  std::vector<bool> errorsHaveLocation;

  virtual basic::FileSystem& getFileSystem() override { return *fileSystem; }

  virtual void setFileContentsBeingParsed(StringRef buffer) override {}

  virtual void error(StringRef filename, const AnalysisFileToken& at,
                     const Twine& message) override {
    errors.push_back(message.str());
    errorsHaveLocation.push_back(at.start != nullptr);
  }
};

/// Load the description with the given contents.
std::unique_ptr<AnalysisDescription>
loadDescription(StringRef contents, TestAnalysisFileDelegate& delegate) {
  TmpDir tempDir("AnalysisFileTest");
  std::string path = tempDir.path("analysis.yaml");
  if (!writeFile(path, contents))
    return nullptr;

  AnalysisFile file(path, delegate);
  return file.load();
}

std::vector<std::string> names(ArrayRef<const Target*> targets) {
  std::vector<std::string> result;
  for (const auto* target: targets) {
    result.push_back(target->getName().str());
  }
  return result;
}

const char* const fullDescription = R"(
options:
  build-root: /src
  classfile-suffix: .class
  verbose: true
targets:
  app:
    kind: library
    dependencies: [lib-core]
    libraries: ["acme:widgets"]
  lib-core:
    sources: [A.src, util/B.java]
  scala-lib:
    kind: wrapper
    sources: [B.scala]
    nested: [java-part]
  java-part:
    dependencies: [scala-lib]
outputs:
  lib-core:
    /out/classes: [A.class, "A$1.class"]
resolution:
  - modules:
      "acme:widgets:1.0":
        artifacts: [/cache/widgets.jar]
        dependencies: ["acme:gears:2.0"]
      "acme:gears:2.0":
        artifacts: [/cache/gears.jar]
symlinks:
  /cache/widgets.jar: /resolve/widgets.jar
  /cache/gears.jar: /resolve/gears.jar
distribution:
  sun.boot.class.path: /jre/lib/rt.jar
)";

TEST(AnalysisFileTest, basic) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription(fullDescription, delegate);
  ASSERT_TRUE(description != nullptr);
  EXPECT_TRUE(delegate.errors.empty());

  const auto& graph = description->getGraph();
  ASSERT_EQ(4U, graph.size());
  std::vector<std::string> order;
  for (const auto& target: graph.getTargets()) {
    order.push_back(target->getName().str());
  }
  std::vector<std::string> expectedOrder{ "app", "lib-core", "scala-lib",
                                          "java-part" };
  EXPECT_EQ(expectedOrder, order);

  const Target* app = graph.findTarget("app");
  ASSERT_TRUE(app != nullptr);
  EXPECT_EQ(TargetKind::Library, app->getKind());
  EXPECT_EQ(std::vector<std::string>{ "lib-core" },
            names(app->getDependencies()));
  ASSERT_EQ(1U, app->getLibraries().size());
  EXPECT_EQ(LibraryReference("acme", "widgets"), app->getLibraries()[0]);

  const Target* core = graph.findTarget("lib-core");
  ASSERT_TRUE(core != nullptr);
  EXPECT_EQ(TargetKind::Source, core->getKind());
  std::vector<std::string> sources{ "A.src", "util/B.java" };
  EXPECT_EQ(sources, core->getSources().vec());

  const Target* wrapper = graph.findTarget("scala-lib");
  ASSERT_TRUE(wrapper != nullptr);
  EXPECT_EQ(TargetKind::Wrapper, wrapper->getKind());
  EXPECT_EQ(std::vector<std::string>{ "java-part" },
            names(wrapper->getNestedTargets()));
  EXPECT_EQ(std::vector<std::string>{ "scala-lib" },
            names(graph.findTarget("java-part")->getDependencies()));

  auto outputs = description->getOutputs().getOutputs(*core);
  ASSERT_EQ(2U, outputs.size());
  EXPECT_EQ("/out/classes", outputs[0].directory);
  EXPECT_EQ("A.class", outputs[0].relativePath);
  EXPECT_EQ("A$1.class", outputs[1].relativePath);

  ASSERT_EQ(1U, description->getReports().size());
  const auto& report = *description->getReports()[0];
  ASSERT_EQ(2U, report.getModules().size());
  const auto* widgets =
    report.lookup(resolve::ModuleRef("acme", "widgets", "1.0"));
  ASSERT_TRUE(widgets != nullptr);
  EXPECT_EQ(std::vector<std::string>{ "/cache/widgets.jar" },
            widgets->artifacts);
  ASSERT_EQ(1U, widgets->dependencies.size());
  EXPECT_EQ(resolve::ModuleRef("acme", "gears", "2.0"),
            widgets->dependencies[0]);

  auto symlinks = description->getSymlinks().snapshot();
  EXPECT_EQ(2U, symlinks.size());
  EXPECT_EQ("/resolve/widgets.jar", symlinks.lookup("/cache/widgets.jar"));

  const analysis::StaticDistributionLocator* distribution =
    static_cast<const AnalysisDescription&>(*description).getDistribution();
  ASSERT_TRUE(distribution != nullptr);
  auto bootClassPath =
    distribution->getSystemProperty(analysis::BootClassPathProperty);
  ASSERT_TRUE(bootClassPath.hasValue());
  EXPECT_EQ("/jre/lib/rt.jar", bootClassPath.getValue());

  const auto& options = description->getOptions();
  EXPECT_EQ("/src", options.buildRoot);
  EXPECT_EQ(".class", options.classfileSuffix);
  EXPECT_TRUE(options.verbose);
  EXPECT_FALSE(options.skip);
}

TEST(AnalysisFileTest, createContext) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription(fullDescription, delegate);
  ASSERT_TRUE(description != nullptr);

  auto fs = basic::createLocalFileSystem();
  MockAnalysisDelegate analysisDelegate;
  auto context = description->createContext(*fs, analysisDelegate);
  EXPECT_EQ(&description->getGraph(), &context.graph);
  EXPECT_EQ(&description->getOutputs(), &context.outputs);
  ASSERT_EQ(1U, context.reports.size());
  EXPECT_EQ(description->getReports()[0].get(), context.reports[0]);
  EXPECT_EQ(&description->getSymlinks(), context.symlinks);
  EXPECT_EQ(description->getDistribution().get(), context.distribution);
  EXPECT_EQ("/src", context.options.buildRoot);
  EXPECT_TRUE(context.options.verbose);
}

TEST(AnalysisFileTest, analyzeDescription) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription(fullDescription, delegate);
  ASSERT_TRUE(description != nullptr);

  auto fs = basic::createLocalFileSystem();
  MockAnalysisDelegate analysisDelegate;
  auto context = description->createContext(*fs, analysisDelegate);
  context.options.verbose = false;
  MockArchiveReader reader;
  reader.addArchive("/resolve/widgets.jar", { "acme/Widget.class" });
  reader.addArchive("/resolve/gears.jar", { "acme/Gear.class" });
  analysis::DependencyAnalyzer analyzer(context, reader);

  auto owners = analyzer.getTargetsByFile();
  ASSERT_TRUE(bool(owners)) << llvm::toString(owners.takeError());
  const auto& graph = description->getGraph();
  EXPECT_EQ(graph.findTarget("app"),
            (*owners)->getCanonicalOwner("acme/Gear.class"));
  EXPECT_EQ(graph.findTarget("lib-core"),
            (*owners)->getCanonicalOwner("/src/util/B.java"));
  EXPECT_EQ(graph.findTarget("lib-core"),
            (*owners)->getCanonicalOwner("/out/classes/A$1.class"));

  // The java part is generated into the wrapper.
  std::vector<std::string> expected{ "scala-lib" };
  EXPECT_EQ(expected, names((*owners)->getOwners("/src/B.scala")));

  const auto& closure = analyzer.getTransitiveDependencies();
  EXPECT_TRUE(closure.dependsOn(*graph.findTarget("app"),
                                *graph.findTarget("lib-core")));
  EXPECT_EQ(0U, closure.getNumCycles());
}

TEST(AnalysisFileTest, sectionsInAnyOrder) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription(R"(
outputs:
  late:
    /out: [Late.class]
targets:
  early:
    dependencies: [late]
  late:
    sources: []
)", delegate);
  ASSERT_TRUE(description != nullptr);
  EXPECT_TRUE(delegate.errors.empty());

  const auto& graph = description->getGraph();
  const Target* late = graph.findTarget("late");
  ASSERT_TRUE(late != nullptr);
  EXPECT_EQ(late, graph.findTarget("early")->getDependencies()[0]);
  ASSERT_EQ(1U, description->getOutputs().getOutputs(*late).size());
  EXPECT_TRUE(late->getSources().empty());
}

TEST(AnalysisFileTest, defaults) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription("targets:\n  lib-core:\n", delegate);
  ASSERT_TRUE(description != nullptr);
  EXPECT_TRUE(delegate.errors.empty());

  // Targets without attributes are source targets, and the build root is the
  // working directory.
  const Target* core = description->getGraph().findTarget("lib-core");
  ASSERT_TRUE(core != nullptr);
  EXPECT_EQ(TargetKind::Source, core->getKind());

  llvm::SmallString<256> currentPath;
  ASSERT_FALSE(bool(llvm::sys::fs::current_path(currentPath)));
  EXPECT_EQ(currentPath.str().str(), description->getOptions().buildRoot);
  EXPECT_TRUE(description->getReports().empty());
  EXPECT_TRUE(description->getDistribution() == nullptr);
}

TEST(AnalysisFileTest, missingFile) {
  TestAnalysisFileDelegate delegate;
  AnalysisFile file("/this/path/does/not/exist.yaml", delegate);
  EXPECT_EQ(&delegate, file.getDelegate());
  EXPECT_TRUE(file.load() == nullptr);
  ASSERT_EQ(1U, delegate.errors.size());
  EXPECT_EQ("unable to open '/this/path/does/not/exist.yaml'",
            delegate.errors[0]);
  EXPECT_FALSE(delegate.errorsHaveLocation[0]);
}

/// Check that loading \arg contents fails with exactly \arg message, reported
/// at a location in the file.
void checkLoadError(StringRef contents, StringRef message) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription(contents, delegate);
  EXPECT_TRUE(description == nullptr);
  ASSERT_EQ(1U, delegate.errors.size()) << contents.str();
  EXPECT_EQ(message.str(), delegate.errors[0]);
  EXPECT_TRUE(delegate.errorsHaveLocation[0]);
}

TEST(AnalysisFileTest, unexpectedSection) {
  checkLoadError("targets: {}\nbogus: {}\n",
                 "unexpected top-level section 'bogus'");
  checkLoadError("targets: {}\ntargets: {}\n",
                 "duplicate top-level section 'targets'");
  checkLoadError("- targets\n", "unexpected top-level node");
}

TEST(AnalysisFileTest, invalidOptions) {
  checkLoadError("options:\n  jobs: 4\n",
                 "unexpected key 'jobs' in 'options' map");
  checkLoadError("options:\n  skip: maybe\n",
                 "invalid value for 'skip' (expected 'true' or 'false')");
  checkLoadError("options:\n  build-root: [a, b]\n",
                 "invalid value type for 'build-root' (expected scalar)");
}

TEST(AnalysisFileTest, invalidTargets) {
  checkLoadError("targets:\n  a:\n    kind: binary\n",
                 "invalid target kind 'binary'");
  checkLoadError("targets:\n  a:\n    deps: [b]\n",
                 "unexpected attribute 'deps' for target 'a'");
  checkLoadError("targets:\n  a: {}\n  a: {}\n", "duplicate target 'a'");
  checkLoadError("targets:\n  a:\n    sources: A.java\n",
                 "invalid value type for 'sources' (expected list)");
  checkLoadError("targets:\n  a:\n    libraries: [\"acme\"]\n"
                 "    kind: library\n",
                 "invalid library reference 'acme' (expected 'org:name')");
  checkLoadError("targets:\n  a:\n    libraries: [\"acme:widgets\"]\n",
                 "'libraries' is only valid for library targets");
  checkLoadError("targets:\n  a:\n    nested: [b]\n  b: {}\n",
                 "'nested' is only valid for wrapper targets");
}

TEST(AnalysisFileTest, unknownTargets) {
  checkLoadError("targets:\n  a:\n    dependencies: [b]\n",
                 "unknown target 'b'");
  checkLoadError("targets:\n  a:\n    kind: wrapper\n    nested: [b]\n",
                 "unknown target 'b'");
  checkLoadError("targets:\n  a: {}\noutputs:\n  ghost:\n    /out: [A.class]\n",
                 "unknown target 'ghost' in 'outputs' map");
}

TEST(AnalysisFileTest, invalidResolution) {
  checkLoadError("resolution:\n  - modules:\n      \"acme\": {}\n",
                 "invalid module coordinate 'acme' (expected "
                 "'org:name[:rev]')");
  checkLoadError("resolution:\n  - modules:\n      \"acme:widgets:1.0\":\n"
                 "        dependencies: [\"a:b:c:d\"]\n",
                 "invalid module coordinate 'a:b:c:d' (expected "
                 "'org:name[:rev]')");
  checkLoadError("resolution:\n  - modules:\n      \"acme:widgets\": {}\n"
                 "      \"acme:widgets\": {}\n",
                 "duplicate module 'acme:widgets'");
  checkLoadError("resolution:\n  - conflicts: {}\n",
                 "unexpected key 'conflicts' in resolution report");
  checkLoadError("resolution:\n  modules: {}\n",
                 "unexpected 'resolution' value (expected list)");
}

TEST(AnalysisFileTest, syntaxError) {
  TestAnalysisFileDelegate delegate;
  auto description = loadDescription("targets:\n  a: [unterminated\n",
                                     delegate);
  EXPECT_TRUE(description == nullptr);
  EXPECT_FALSE(delegate.errors.empty());
}

TEST(AnalysisFileTest, additionalDocument) {
  checkLoadError("targets: {}\n---\ntargets: {}\n",
                 "unexpected additional document in stream");
}

}
