//===- unittests/Analysis/FileOwnershipIndexTest.cpp ----------------------===//
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

#include "jvmdeps/Analysis/AnalysisContext.h"
#include "jvmdeps/Analysis/CompiledOutputManifest.h"
#include "jvmdeps/Analysis/FileOwnershipIndex.h"
#include "jvmdeps/Analysis/TransitiveDependencyMap.h"
#include "jvmdeps/Archive/ArchiveIndex.h"
#include "jvmdeps/Archive/AttributionError.h"
#include "jvmdeps/Basic/FileSystem.h"
#include "jvmdeps/Graph/TargetGraph.h"
#include "jvmdeps/Resolve/ResolutionReport.h"
#include "jvmdeps/Resolve/SymlinkMap.h"

#include "llvm/Support/Path.h"

#include "gtest/gtest.h"

using namespace jvmdeps;
using namespace jvmdeps::analysis;
using namespace jvmdeps::graph;
using namespace jvmdeps::unittests;

namespace {

/// The inputs of one analysis invocation.
///
/// The archive paths used here don't exist, so the local file system leaves
/// them unchanged when canonicalizing.
struct OwnershipFixture {
  TargetGraph graph;
  CompiledOutputManifest outputs;
  resolve::ResolutionReport report;
  resolve::SymlinkMap symlinks;
  std::unique_ptr<basic::FileSystem> fs = basic::createLocalFileSystem();
  MockArchiveReader reader;
  MockAnalysisDelegate delegate;

  Target* addTarget(StringRef name, TargetKind kind,
                    std::vector<std::string> sources = {}) {
    Target* target = graph.addTarget(name, kind);
    for (const auto& source: sources) {
      target->addSource(source);
    }
    return target;
  }

  void addModule(StringRef spec, std::vector<std::string> artifacts,
                 std::vector<std::string> dependencies = {}) {
    resolve::ResolvedModule module;
    module.ref = resolve::ModuleRef::parse(spec).getValue();
    module.artifacts = std::move(artifacts);
    for (const auto& dependency: dependencies) {
      module.dependencies.push_back(
          resolve::ModuleRef::parse(dependency).getValue());
    }
    EXPECT_TRUE(report.addModule(std::move(module)));
  }

  /// Add a resolved archive, reachable through the resolve area.
  void addArchive(StringRef path, std::vector<std::string> entries) {
    std::string symlink = "/resolve/" + llvm::sys::path::filename(path).str();
    symlinks.set(path, symlink);
    reader.addArchive(symlink, std::move(entries));
  }

  AnalysisContext createContext(bool withReport = true) {
    AnalysisContext context(graph, outputs, *fs, delegate);
    if (withReport)
      context.reports.push_back(&report);
    context.symlinks = &symlinks;
    context.options.buildRoot = "/src";
    return context;
  }

  llvm::Expected<FileOwnershipIndex> build(bool withReport = true) {
    archive::ArchiveIndex archives(reader);
    return FileOwnershipIndex::build(createContext(withReport), archives);
  }
};

std::vector<std::string> names(ArrayRef<const Target*> targets) {
  std::vector<std::string> result;
  for (const auto* target: targets) {
    result.push_back(target->getName().str());
  }
  return result;
}

TEST(FileOwnershipIndexTest, declaredSources) {
  OwnershipFixture fixture;
  fixture.addTarget("lib-core", TargetKind::Source,
                    { "A.src", "util/B.java", "/abs/C.java" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // Relative sources are resolved against the build root.
  EXPECT_EQ(std::vector<std::string>{ "lib-core" },
            names(index->getOwners("/src/A.src")));
  EXPECT_EQ(std::vector<std::string>{ "lib-core" },
            names(index->getOwners("/src/util/B.java")));
  EXPECT_EQ(std::vector<std::string>{ "lib-core" },
            names(index->getOwners("/abs/C.java")));
  EXPECT_TRUE(index->getOwners("A.src").empty());
  EXPECT_EQ(nullptr, index->getCanonicalOwner("/src/missing.java"));
  EXPECT_EQ(3U, index->size());
}

TEST(FileOwnershipIndexTest, widgetsScenario) {
  OwnershipFixture fixture;
  Target* core = fixture.addTarget("lib-core", TargetKind::Source,
                                   { "A.src" });
  Target* app = fixture.addTarget("app", TargetKind::Library);
  app->addDependency(*core);
  app->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" });
  fixture.addArchive("/cache/widgets.jar", { "Widget.class" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());
  EXPECT_EQ(std::vector<std::string>{ "lib-core" },
            names(index->getOwners("/src/A.src")));
  EXPECT_EQ(std::vector<std::string>{ "app" },
            names(index->getOwners("Widget.class")));

  auto closure = TransitiveDependencyMap::compute(fixture.graph);
  EXPECT_TRUE(closure.dependsOn(*app, *core));
}

TEST(FileOwnershipIndexTest, directOwnershipTakesPrecedence) {
  OwnershipFixture fixture;
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  Target* local = fixture.addTarget("local-widgets", TargetKind::Source,
                                    { "com/acme/Widget.java" });
  fixture.outputs.addOutput(*local, "/out/classes", "com/acme/Widget.class");
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" });
  fixture.addArchive("/cache/widgets.jar", { "com/acme/Widget.class",
                                             "com/acme/Gear.class" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // The library is declared first, but the direct producer still comes first.
  std::vector<std::string> expected{ "local-widgets", "widgets-lib" };
  EXPECT_EQ(expected, names(index->getOwners("com/acme/Widget.class")));
  EXPECT_EQ(local, index->getCanonicalOwner("com/acme/Widget.class"));
  EXPECT_EQ(widgets, index->getCanonicalOwner("com/acme/Gear.class"));
}

TEST(FileOwnershipIndexTest, compiledOutputs) {
  OwnershipFixture fixture;
  Target* core = fixture.addTarget("lib-core", TargetKind::Source);
  fixture.outputs.addOutput(*core, "/out/classes", "com/acme/A.class");
  fixture.outputs.addOutput(*core, "/out/classes", "com/acme/A$1.class");

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // Both the bare and the joined forms are registered.
  EXPECT_EQ(core, index->getCanonicalOwner("com/acme/A.class"));
  EXPECT_EQ(core, index->getCanonicalOwner("/out/classes/com/acme/A.class"));
  EXPECT_EQ(core, index->getCanonicalOwner("com/acme/A$1.class"));
  EXPECT_EQ(core,
            index->getCanonicalOwner("/out/classes/com/acme/A$1.class"));
  EXPECT_EQ(4U, index->size());

  std::vector<StringRef> expected{ "/out/classes/com/acme/A$1.class",
                                   "/out/classes/com/acme/A.class",
                                   "com/acme/A$1.class", "com/acme/A.class" };
  EXPECT_EQ(expected, index->getSortedFiles());
}

TEST(FileOwnershipIndexTest, ownersAccumulate) {
  OwnershipFixture fixture;
  Target* first = fixture.addTarget("first", TargetKind::Source,
                                    { "shared/A.java" });
  Target* second = fixture.addTarget("second", TargetKind::Source,
                                     { "shared/A.java", "shared/A.java" });
  fixture.outputs.addOutput(*first, "/out", "A.class");
  fixture.outputs.addOutput(*second, "/out", "A.class");
  fixture.outputs.addOutput(*first, "/out", "A.class");

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // Registering again never overwrites or duplicates an owner.
  std::vector<std::string> expected{ "first", "second" };
  EXPECT_EQ(expected, names(index->getOwners("/src/shared/A.java")));
  EXPECT_EQ(expected, names(index->getOwners("A.class")));
  EXPECT_EQ(expected, names(index->getOwners("/out/A.class")));
}

TEST(FileOwnershipIndexTest, wrapperOwnsNestedSources) {
  OwnershipFixture fixture;
  Target* java = fixture.addTarget("java-part", TargetKind::Source,
                                   { "gen/J.java" });
  Target* scala = fixture.addTarget("scala-lib", TargetKind::Wrapper,
                                    { "src/B.scala" });
  scala->addNestedTarget(*java);
  java->addDependency(*scala);

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());
  EXPECT_EQ(std::vector<std::string>{ "scala-lib" },
            names(index->getOwners("/src/src/B.scala")));

  std::vector<std::string> expected{ "java-part", "scala-lib" };
  EXPECT_EQ(expected, names(index->getOwners("/src/gen/J.java")));
}

TEST(FileOwnershipIndexTest, librariesDoNotOwnSources) {
  OwnershipFixture fixture;
  Target* jars = fixture.addTarget("jars", TargetKind::Library,
                                   { "BUILD" });
  jars->addLibrary(LibraryReference("acme", "widgets"));

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());
  EXPECT_TRUE(index->empty());
}

TEST(FileOwnershipIndexTest, transitiveArchives) {
  OwnershipFixture fixture;
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" },
                    { "acme:gears:2.0" });
  fixture.addModule("acme:gears:2.0", { "/cache/gears.jar" });
  fixture.addArchive("/cache/widgets.jar", { "Widget.class" });
  fixture.addArchive("/cache/gears.jar", { "Gear.class", "gear.properties" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // The aggregate owns the classes of its transitive resolution, and no
  // resources.
  EXPECT_EQ(widgets, index->getCanonicalOwner("Widget.class"));
  EXPECT_EQ(widgets, index->getCanonicalOwner("Gear.class"));
  EXPECT_FALSE(index->contains("gear.properties"));

  // No aggregate declares the gears library itself.
  EXPECT_EQ(2U, index->size());
}

TEST(FileOwnershipIndexTest, diamondResolution) {
  OwnershipFixture fixture;
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  widgets->addLibrary(LibraryReference("acme", "gears"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" },
                    { "acme:bolts:3.0", "acme:gears:2.0" });
  fixture.addModule("acme:gears:2.0", { "/cache/gears.jar" },
                    { "acme:bolts:3.0" });
  fixture.addModule("acme:bolts:3.0", { "/cache/bolts.jar" });
  fixture.addArchive("/cache/widgets.jar", { "Widget.class" });
  fixture.addArchive("/cache/gears.jar", { "Gear.class" });
  fixture.addArchive("/cache/bolts.jar", { "Bolt.class" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // The shared archive contributes its classfiles exactly once.
  EXPECT_EQ(std::vector<std::string>{ "widgets-lib" },
            names(index->getOwners("Bolt.class")));
  EXPECT_EQ(std::vector<std::string>{ "widgets-lib" },
            names(index->getOwners("Gear.class")));

  // Each archive is listed once.
  EXPECT_EQ(3U, fixture.reader.reads.size());
}

TEST(FileOwnershipIndexTest, cyclicResolution) {
  OwnershipFixture fixture;
  Target* aLib = fixture.addTarget("a-lib", TargetKind::Library);
  aLib->addLibrary(LibraryReference("acme", "a"));
  Target* bLib = fixture.addTarget("b-lib", TargetKind::Library);
  bLib->addLibrary(LibraryReference("acme", "b"));
  fixture.addModule("acme:a:1", { "/cache/a.jar" }, { "acme:b:1" });
  fixture.addModule("acme:b:1", { "/cache/b.jar" }, { "acme:a:1" });
  fixture.addArchive("/cache/a.jar", { "A.class" });
  fixture.addArchive("/cache/b.jar", { "B.class" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // Each aggregate owns the classes of the whole cycle, whichever module is
  // mapped first.
  std::vector<std::string> expected{ "a-lib", "b-lib" };
  EXPECT_EQ(expected, names(index->getOwners("A.class")));
  EXPECT_EQ(expected, names(index->getOwners("B.class")));
  EXPECT_EQ(2U, fixture.reader.reads.size());
}

TEST(FileOwnershipIndexTest, sharedLibraryReference) {
  OwnershipFixture fixture;
  Target* first = fixture.addTarget("first", TargetKind::Library);
  first->addLibrary(LibraryReference("acme", "widgets"));
  Target* second = fixture.addTarget("second", TargetKind::Library);
  second->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" });
  fixture.addArchive("/cache/widgets.jar", { "Widget.class" });

  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  // Every declaring aggregate owns the classes, in declaration order.
  std::vector<std::string> expected{ "first", "second" };
  EXPECT_EQ(expected, names(index->getOwners("Widget.class")));
}

TEST(FileOwnershipIndexTest, missingResolutionReport) {
  OwnershipFixture fixture;
  Target* core = fixture.addTarget("lib-core", TargetKind::Source,
                                   { "A.src" });
  fixture.outputs.addOutput(*core, "/out", "A.class");
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" });
  fixture.addArchive("/cache/widgets.jar", { "Widget.class" });

  auto index = fixture.build(/*withReport=*/false);
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());
  EXPECT_EQ(core, index->getCanonicalOwner("/src/A.src"));
  EXPECT_EQ(core, index->getCanonicalOwner("A.class"));
  EXPECT_EQ(core, index->getCanonicalOwner("/out/A.class"));
  EXPECT_FALSE(index->contains("Widget.class"));
  EXPECT_EQ(3U, index->size());
  EXPECT_TRUE(fixture.reader.reads.empty());
}

TEST(FileOwnershipIndexTest, missingSymlink) {
  OwnershipFixture fixture;
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar",
                                          "/cache/widgets-extra.jar" });
  fixture.addArchive("/cache/widgets.jar", { "Widget.class" });

  // The second archive was never materialized in the resolve area.
  auto index = fixture.build();
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());
  EXPECT_EQ(widgets, index->getCanonicalOwner("Widget.class"));
  EXPECT_EQ(1U, index->size());
  EXPECT_EQ(std::vector<std::string>{ "/resolve/widgets.jar" },
            fixture.reader.reads);
}

TEST(FileOwnershipIndexTest, symlinkSnapshot) {
  OwnershipFixture fixture;
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" });
  fixture.reader.addArchive("/resolve/widgets.jar", { "Widget.class" });

  // Without a symlink map, no archive is reachable.
  auto context = fixture.createContext();
  context.symlinks = nullptr;
  archive::ArchiveIndex archives(fixture.reader);
  auto index = FileOwnershipIndex::build(context, archives);
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());
  EXPECT_TRUE(index->empty());

  fixture.symlinks.set("/cache/widgets.jar", "/resolve/widgets.jar");
  auto updated = fixture.build();
  ASSERT_TRUE(bool(updated)) << llvm::toString(updated.takeError());
  EXPECT_EQ(widgets, updated->getCanonicalOwner("Widget.class"));
}

TEST(FileOwnershipIndexTest, unreadableArchive) {
  OwnershipFixture fixture;
  Target* widgets = fixture.addTarget("widgets-lib", TargetKind::Library);
  widgets->addLibrary(LibraryReference("acme", "widgets"));
  fixture.addModule("acme:widgets:1.0", { "/cache/widgets.jar" });
  fixture.symlinks.set("/cache/widgets.jar", "/resolve/corrupt.jar");

  auto index = fixture.build();
  ASSERT_FALSE(bool(index));

  std::string path;
  llvm::handleAllErrors(index.takeError(),
                        [&](const archive::AttributionError& error) {
                          path = error.getPath().str();
                        });
  EXPECT_EQ("/resolve/corrupt.jar", path);
}

TEST(FileOwnershipIndexTest, verboseNotes) {
  OwnershipFixture fixture;
  fixture.addTarget("lib-core", TargetKind::Source, { "A.src" });

  auto context = fixture.createContext();
  context.options.verbose = true;
  archive::ArchiveIndex archives(fixture.reader);
  auto index = FileOwnershipIndex::build(context, archives);
  ASSERT_TRUE(bool(index)) << llvm::toString(index.takeError());

  std::vector<std::string> expected{ "mapping sources...",
                                     "mapping classes...",
                                     "mapping jars..." };
  EXPECT_EQ(expected, fixture.delegate.notes);

  // Progress is only reported when asked for.
  fixture.delegate.notes.clear();
  auto quiet = fixture.build();
  ASSERT_TRUE(bool(quiet)) << llvm::toString(quiet.takeError());
  EXPECT_TRUE(fixture.delegate.notes.empty());
}

}
