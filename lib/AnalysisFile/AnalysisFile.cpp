//===-- AnalysisFile.cpp --------------------------------------------------===//
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

#include "jvmdeps/AnalysisFile/AnalysisFile.h"

#include "jvmdeps/Basic/FileSystem.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"

using namespace jvmdeps;
using namespace jvmdeps::analysisfile;

AnalysisFileDelegate::~AnalysisFileDelegate() {}

#pragma mark - AnalysisDescription

analysis::AnalysisContext
AnalysisDescription::createContext(basic::FileSystem& fileSystem,
                                   analysis::AnalysisDelegate& delegate) const {
  analysis::AnalysisContext context(graph, outputs, fileSystem, delegate);
  for (const auto& report: reports) {
    context.reports.push_back(report.get());
  }
  context.symlinks = &symlinks;
  context.distribution = distribution.get();
  context.options = options;
  return context;
}

#pragma mark - AnalysisFileImpl

namespace {

class AnalysisFileImpl {
  /// A reference to a target which may not have been declared yet.
  struct PendingReference {
    enum class Kind { Dependency, Nested };

    Kind kind;
    graph::Target* from;
    std::string name;
    llvm::SMRange at;
  };

  /// An output of a target which may not have been declared yet.
  struct PendingOutput {
    std::string target;
    llvm::SMRange at;
    std::string directory;
    std::string relativePath;
  };

  /// The name of the main input file.
  std::string mainFilename;

  /// The delegate the AnalysisFile was configured with.
  AnalysisFileDelegate& delegate;

  /// The description being loaded.
  std::unique_ptr<AnalysisDescription> description;

  /// The target references to resolve once all targets are known.
  std::vector<PendingReference> pendingReferences;

  /// The outputs to register once all targets are known.
  std::vector<PendingOutput> pendingOutputs;

  /// The number of parsing errors.
  int numErrors = 0;

  std::string stringFromScalarNode(llvm::yaml::ScalarNode* scalar) {
    SmallString<256> storage;
    return scalar->getValue(storage).str();
  }

  /// Emit an error.
  void error(StringRef filename, llvm::SMRange at,
             const Twine& message) {
    AnalysisFileToken atToken{at.Start.getPointer(),
        unsigned(at.End.getPointer()-at.Start.getPointer())};
    delegate.error(filename, atToken, message);
    ++numErrors;
  }

  void error(const Twine& message) {
    error(mainFilename, {}, message);
  }

  void error(llvm::yaml::Node* node, const Twine& message) {
    error(mainFilename, node->getSourceRange(), message);
  }

  /// Forward YAML syntax errors to the delegate.
  static void handleDiagnostic(const llvm::SMDiagnostic& diagnostic,
                               void* context) {
    auto impl = static_cast<AnalysisFileImpl*>(context);
    impl->delegate.error(impl->mainFilename,
                         AnalysisFileToken{diagnostic.getLoc().getPointer(), 0},
                         diagnostic.getMessage());
    ++impl->numErrors;
  }

  /// Get the value of a scalar node which must be a string.
  bool parseScalar(llvm::yaml::Node* node, const Twine& what,
                   std::string& result) {
    if (node->getType() != llvm::yaml::Node::NK_Scalar) {
      error(node, "invalid value type for " + what + " (expected scalar)");
      return false;
    }
    result = stringFromScalarNode(static_cast<llvm::yaml::ScalarNode*>(node));
    return true;
  }

  bool parseBool(llvm::yaml::Node* node, const Twine& what, bool& result) {
    std::string value;
    if (!parseScalar(node, what, value))
      return false;
    if (value == "true") {
      result = true;
    } else if (value == "false") {
      result = false;
    } else {
      error(node, "invalid value for " + what + " (expected 'true' or "
            "'false')");
      return false;
    }
    return true;
  }

  /// Visit each scalar of a sequence node. A null node is an empty sequence.
  bool parseScalarSequence(
      llvm::yaml::Node* node, const Twine& what,
      llvm::function_ref<bool(llvm::yaml::ScalarNode*)> visit) {
    if (node->getType() == llvm::yaml::Node::NK_Null)
      return true;
    if (node->getType() != llvm::yaml::Node::NK_Sequence) {
      error(node, "invalid value type for " + what + " (expected list)");
      return false;
    }

    for (auto& item: *static_cast<llvm::yaml::SequenceNode*>(node)) {
      if (item.getType() != llvm::yaml::Node::NK_Scalar) {
        error(&item, "invalid item type in " + what + " (expected scalar)");
        return false;
      }
      if (!visit(static_cast<llvm::yaml::ScalarNode*>(&item)))
        return false;
    }
    return true;
  }

  /// Visit each entry of a mapping node with a scalar key. A null node is an
  /// empty mapping.
  bool parseMapping(
      llvm::yaml::Node* node, const Twine& what,
      llvm::function_ref<bool(llvm::yaml::ScalarNode*,
                              llvm::yaml::Node*)> visit) {
    if (node->getType() == llvm::yaml::Node::NK_Null)
      return true;
    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected " + what + " value (expected map)");
      return false;
    }

    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      // Syntax errors have already been reported.
      if (!entry.getKey() || !entry.getValue())
        return false;
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in " + what + " map");
        return false;
      }
      if (!visit(static_cast<llvm::yaml::ScalarNode*>(entry.getKey()),
                 entry.getValue()))
        return false;
    }
    return true;
  }

  bool parseRootNode(llvm::yaml::Node* node) {
    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected top-level node");
      return false;
    }

    llvm::StringSet<> seenSections;
    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      if (!entry.getKey() || !entry.getValue())
        return false;
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in top-level map");
        return false;
      }

      std::string section = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getKey()));
      if (!seenSections.insert(section).second) {
        error(entry.getKey(), "duplicate top-level section '" + section + "'");
        return false;
      }

      llvm::yaml::Node* value = entry.getValue();
      bool success;
      if (section == "options") {
        success = parseOptionsMapping(value);
      } else if (section == "targets") {
        success = parseTargetsMapping(value);
      } else if (section == "outputs") {
        success = parseOutputsMapping(value);
      } else if (section == "resolution") {
        success = parseResolutionSequence(value);
      } else if (section == "symlinks") {
        success = parseSymlinksMapping(value);
      } else if (section == "distribution") {
        success = parseDistributionMapping(value);
      } else {
        error(entry.getKey(), "unexpected top-level section '" + section + "'");
        return false;
      }
      if (!success)
        return false;
    }

    return true;
  }

  bool parseOptionsMapping(llvm::yaml::Node* node) {
    auto& options = description->getOptions();
    return parseMapping(
        node, "'options'",
        [&](llvm::yaml::ScalarNode* key, llvm::yaml::Node* value) {
          std::string name = stringFromScalarNode(key);
          if (name == "build-root") {
            return parseScalar(value, "'build-root'", options.buildRoot);
          } else if (name == "classfile-suffix") {
            return parseScalar(value, "'classfile-suffix'",
                               options.classfileSuffix);
          } else if (name == "archive-suffix") {
            return parseScalar(value, "'archive-suffix'",
                               options.archiveSuffix);
          } else if (name == "skip") {
            return parseBool(value, "'skip'", options.skip);
          } else if (name == "verbose") {
            return parseBool(value, "'verbose'", options.verbose);
          }
          error(key, "unexpected key '" + name + "' in 'options' map");
          return false;
        });
  }

  bool parseTargetsMapping(llvm::yaml::Node* node) {
    return parseMapping(
        node, "'targets'",
        [&](llvm::yaml::ScalarNode* key, llvm::yaml::Node* value) {
          return parseTarget(key, value);
        });
  }

  bool parseTarget(llvm::yaml::ScalarNode* key, llvm::yaml::Node* node) {
    std::string name = stringFromScalarNode(key);
    if (description->getGraph().findTarget(name)) {
      error(key, "duplicate target '" + name + "'");
      return false;
    }

    // Collect the attributes, the kind may follow the attributes it governs.
    graph::TargetKind kind = graph::TargetKind::Source;
    std::vector<std::string> sources;
    std::vector<std::pair<std::string, llvm::SMRange>> dependencies;
    std::vector<std::pair<graph::LibraryReference, llvm::yaml::Node*>>
      libraries;
    std::vector<std::pair<std::string, llvm::SMRange>> nested;
    llvm::yaml::Node* nestedNode = nullptr;

    bool success = parseMapping(
        node, "target",
        [&](llvm::yaml::ScalarNode* attrKey, llvm::yaml::Node* value) {
          std::string attribute = stringFromScalarNode(attrKey);
          if (attribute == "kind") {
            std::string kindName;
            if (!parseScalar(value, "'kind'", kindName))
              return false;
            auto parsed = graph::parseTargetKind(kindName);
            if (!parsed.hasValue()) {
              error(value, "invalid target kind '" + kindName + "'");
              return false;
            }
            kind = parsed.getValue();
            return true;
          } else if (attribute == "sources") {
            return parseScalarSequence(
                value, "'sources'", [&](llvm::yaml::ScalarNode* item) {
                  sources.push_back(stringFromScalarNode(item));
                  return true;
                });
          } else if (attribute == "dependencies") {
            return parseScalarSequence(
                value, "'dependencies'", [&](llvm::yaml::ScalarNode* item) {
                  dependencies.emplace_back(stringFromScalarNode(item),
                                            item->getSourceRange());
                  return true;
                });
          } else if (attribute == "libraries") {
            return parseScalarSequence(
                value, "'libraries'", [&](llvm::yaml::ScalarNode* item) {
                  std::string spec = stringFromScalarNode(item);
                  auto library = graph::LibraryReference::parse(spec);
                  if (!library.hasValue()) {
                    error(item, "invalid library reference '" + spec +
                          "' (expected 'org:name')");
                    return false;
                  }
                  libraries.emplace_back(library.getValue(), item);
                  return true;
                });
          } else if (attribute == "nested") {
            nestedNode = value;
            return parseScalarSequence(
                value, "'nested'", [&](llvm::yaml::ScalarNode* item) {
                  nested.emplace_back(stringFromScalarNode(item),
                                      item->getSourceRange());
                  return true;
                });
          }
          error(attrKey, "unexpected attribute '" + attribute +
                "' for target '" + name + "'");
          return false;
        });
    if (!success)
      return false;

    if (!libraries.empty() && kind != graph::TargetKind::Library) {
      error(libraries.front().second,
            "'libraries' is only valid for library targets");
      return false;
    }
    if (!nested.empty() && kind != graph::TargetKind::Wrapper) {
      error(nestedNode, "'nested' is only valid for wrapper targets");
      return false;
    }

    graph::Target* target = description->getGraph().addTarget(name, kind);
    for (const auto& source: sources) {
      target->addSource(source);
    }
    for (auto& library: libraries) {
      target->addLibrary(std::move(library.first));
    }
    for (auto& dependency: dependencies) {
      pendingReferences.push_back(
          {PendingReference::Kind::Dependency, target,
           std::move(dependency.first), dependency.second});
    }
    for (auto& item: nested) {
      pendingReferences.push_back(
          {PendingReference::Kind::Nested, target, std::move(item.first),
           item.second});
    }
    return true;
  }

  bool parseOutputsMapping(llvm::yaml::Node* node) {
    return parseMapping(
        node, "'outputs'",
        [&](llvm::yaml::ScalarNode* key, llvm::yaml::Node* value) {
          std::string target = stringFromScalarNode(key);
          return parseMapping(
              value, "outputs of '" + target + "'",
              [&](llvm::yaml::ScalarNode* dirKey, llvm::yaml::Node* files) {
                std::string directory = stringFromScalarNode(dirKey);
                return parseScalarSequence(
                    files, "outputs of '" + target + "'",
                    [&](llvm::yaml::ScalarNode* item) {
                      pendingOutputs.push_back(
                          {target, key->getSourceRange(), directory,
                           stringFromScalarNode(item)});
                      return true;
                    });
              });
        });
  }

  bool parseResolutionSequence(llvm::yaml::Node* node) {
    if (node->getType() == llvm::yaml::Node::NK_Null)
      return true;
    if (node->getType() != llvm::yaml::Node::NK_Sequence) {
      error(node, "unexpected 'resolution' value (expected list)");
      return false;
    }

    for (auto& item: *static_cast<llvm::yaml::SequenceNode*>(node)) {
      auto report = std::make_unique<resolve::ResolutionReport>();
      bool success = parseMapping(
          &item, "resolution report",
          [&](llvm::yaml::ScalarNode* key, llvm::yaml::Node* value) {
            std::string name = stringFromScalarNode(key);
            if (name != "modules") {
              error(key, "unexpected key '" + name + "' in resolution report");
              return false;
            }
            return parseMapping(
                value, "'modules'",
                [&](llvm::yaml::ScalarNode* moduleKey,
                    llvm::yaml::Node* attrs) {
                  return parseModule(*report, moduleKey, attrs);
                });
          });
      if (!success)
        return false;
      description->getReports().push_back(std::move(report));
    }
    return true;
  }

  bool parseModuleRef(llvm::yaml::ScalarNode* node, resolve::ModuleRef& result) {
    std::string spec = stringFromScalarNode(node);
    auto ref = resolve::ModuleRef::parse(spec);
    if (!ref.hasValue()) {
      error(node, "invalid module coordinate '" + spec +
            "' (expected 'org:name[:rev]')");
      return false;
    }
    result = ref.getValue();
    return true;
  }

  bool parseModule(resolve::ResolutionReport& report,
                   llvm::yaml::ScalarNode* key, llvm::yaml::Node* node) {
    resolve::ResolvedModule module;
    if (!parseModuleRef(key, module.ref))
      return false;

    bool success = parseMapping(
        node, "module",
        [&](llvm::yaml::ScalarNode* attrKey, llvm::yaml::Node* value) {
          std::string attribute = stringFromScalarNode(attrKey);
          if (attribute == "artifacts") {
            return parseScalarSequence(
                value, "'artifacts'", [&](llvm::yaml::ScalarNode* item) {
                  module.artifacts.push_back(stringFromScalarNode(item));
                  return true;
                });
          } else if (attribute == "dependencies") {
            return parseScalarSequence(
                value, "'dependencies'", [&](llvm::yaml::ScalarNode* item) {
                  resolve::ModuleRef dependency;
                  if (!parseModuleRef(item, dependency))
                    return false;
                  module.dependencies.push_back(std::move(dependency));
                  return true;
                });
          }
          error(attrKey, "unexpected attribute '" + attribute +
                "' for module '" + module.ref.str() + "'");
          return false;
        });
    if (!success)
      return false;

    std::string name = module.ref.str();
    if (!report.addModule(std::move(module))) {
      error(key, "duplicate module '" + name + "'");
      return false;
    }
    return true;
  }

  bool parseSymlinksMapping(llvm::yaml::Node* node) {
    return parseMapping(
        node, "'symlinks'",
        [&](llvm::yaml::ScalarNode* key, llvm::yaml::Node* value) {
          std::string symlink;
          if (!parseScalar(value, "symlink", symlink))
            return false;
          description->getSymlinks().set(stringFromScalarNode(key), symlink);
          return true;
        });
  }

  bool parseDistributionMapping(llvm::yaml::Node* node) {
    auto distribution =
      std::make_unique<analysis::StaticDistributionLocator>();
    bool success = parseMapping(
        node, "'distribution'",
        [&](llvm::yaml::ScalarNode* key, llvm::yaml::Node* value) {
          std::string property;
          if (!parseScalar(value, "system property", property))
            return false;
          distribution->setSystemProperty(stringFromScalarNode(key), property);
          return true;
        });
    if (!success)
      return false;
    description->getDistribution() = std::move(distribution);
    return true;
  }

  /// Resolve the target references collected while parsing.
  bool resolveReferences() {
    auto& graph = description->getGraph();
    for (const auto& reference: pendingReferences) {
      const graph::Target* target = graph.findTarget(reference.name);
      if (!target) {
        error(mainFilename, reference.at,
              "unknown target '" + reference.name + "'");
        return false;
      }
      switch (reference.kind) {
      case PendingReference::Kind::Dependency:
        reference.from->addDependency(*target);
        break;
      case PendingReference::Kind::Nested:
        reference.from->addNestedTarget(*target);
        break;
      }
    }

    for (const auto& output: pendingOutputs) {
      const graph::Target* target = graph.findTarget(output.target);
      if (!target) {
        error(mainFilename, output.at,
              "unknown target '" + output.target + "' in 'outputs' map");
        return false;
      }
      description->getOutputs().addOutput(*target, output.directory,
                                          output.relativePath);
    }
    return true;
  }

public:
  AnalysisFileImpl(StringRef mainFilename,
                   AnalysisFileDelegate& delegate)
    : mainFilename(mainFilename), delegate(delegate) {}

  AnalysisFileDelegate* getDelegate() {
    return &delegate;
  }

  std::unique_ptr<AnalysisDescription> load() {
    llvm::SourceMgr sourceMgr;
    auto input = delegate.getFileSystem().getFileContents(mainFilename);
    if (!input) {
      error("unable to open '" + mainFilename + "'");
      return nullptr;
    }

    delegate.setFileContentsBeingParsed(input->getBuffer());
    sourceMgr.setDiagHandler(handleDiagnostic, this);

    description = std::make_unique<AnalysisDescription>();
    pendingReferences.clear();
    pendingOutputs.clear();
    numErrors = 0;

    // Relative sources are resolved against the working directory, unless the
    // file names a build root.
    SmallString<256> currentPath;
    if (!llvm::sys::fs::current_path(currentPath))
      description->getOptions().buildRoot = currentPath.str().str();

    // Create a YAML parser.
    llvm::yaml::Stream stream(input->getMemBufferRef(), sourceMgr);

    // Read the stream, we only expect a single document.
    auto it = stream.begin();
    if (it == stream.end()) {
      error("missing document in stream");
      return nullptr;
    }

    auto& document = *it;
    auto root = document.getRoot();
    if (!root) {
      error("missing document in stream");
      return nullptr;
    }

    if (!parseRootNode(root) || numErrors != 0) {
      return nullptr;
    }

    if (++it != stream.end()) {
      error(it->getRoot(), "unexpected additional document in stream");
      return nullptr;
    }

    if (!resolveReferences())
      return nullptr;

    return std::move(description);
  }
};

}

#pragma mark - AnalysisFile

AnalysisFile::AnalysisFile(StringRef mainFilename,
                           AnalysisFileDelegate& delegate)
  : impl(new AnalysisFileImpl(mainFilename, delegate))
{
}

AnalysisFile::~AnalysisFile() {
  delete static_cast<AnalysisFileImpl*>(impl);
}

AnalysisFileDelegate* AnalysisFile::getDelegate() {
  return static_cast<AnalysisFileImpl*>(impl)->getDelegate();
}

std::unique_ptr<AnalysisDescription> AnalysisFile::load() {
  return static_cast<AnalysisFileImpl*>(impl)->load();
}
