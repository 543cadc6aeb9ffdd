//===-- RuleKeyConfiguration.cpp ------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "rulekit/RuleKey/RuleKeyConfiguration.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"
#include "llvm/Support/raw_ostream.h"

using namespace rulekit;
using namespace rulekit::rulekey;

namespace {

class ConfigurationParser {
  StringRef data;
  StringRef filename;
  llvm::SourceMgr sourceMgr;

  /// The first diagnostic, if any.
  std::string firstError;
  unsigned numErrors = 0;

  RuleKeyConfiguration config;

  static void handleDiagnostic(const llvm::SMDiagnostic& diag, void* context) {
    auto parser = static_cast<ConfigurationParser*>(context);
    parser->error(diag.getLoc(), diag.getMessage());
  }

  std::string stringFromScalarNode(llvm::yaml::ScalarNode* scalar) {
    SmallString<256> storage;
    return scalar->getValue(storage).str();
  }

  void error(llvm::SMLoc at, const Twine& message) {
    if (numErrors++ != 0)
      return;

    std::string location = filename.str();
    if (at.isValid()) {
      auto lineAndColumn = sourceMgr.getLineAndColumn(at);
      location += ":" + std::to_string(lineAndColumn.first) + ":" +
        std::to_string(lineAndColumn.second);
    }
    firstError = (location + ": error: " + message).str();
  }

  void error(llvm::yaml::Node* node, const Twine& message) {
    error(node->getSourceRange().Start, message);
  }

  bool parseBoolean(llvm::yaml::Node* node, bool& result) {
    if (node->getType() != llvm::yaml::Node::NK_Scalar) {
      error(node, "expected a boolean");
      return false;
    }
    std::string value = stringFromScalarNode(
        static_cast<llvm::yaml::ScalarNode*>(node));
    auto parsed = llvm::StringSwitch<Optional<bool>>(value)
      .Cases("true", "yes", "on", true)
      .Cases("false", "no", "off", false)
      .Default(None);
    if (!parsed.hasValue()) {
      error(node, "invalid boolean '" + value + "'");
      return false;
    }
    result = *parsed;
    return true;
  }

  bool parseRuleKeyMapping(llvm::yaml::MappingNode* map) {
    for (auto& entry: *map) {
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getKey(), "invalid key type in 'rulekey' map");
        return false;
      }
      if (entry.getValue()->getType() != llvm::yaml::Node::NK_Scalar) {
        error(entry.getValue(), "invalid value type in 'rulekey' map");
        return false;
      }

      std::string key = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getKey()));
      std::string value = stringFromScalarNode(
          static_cast<llvm::yaml::ScalarNode*>(entry.getValue()));
      if (key == "seed") {
        if (StringRef(value).getAsInteger(10, config.seed)) {
          error(entry.getValue(), "invalid seed '" + value + "'");
          return false;
        }
      } else if (key == "hash-function") {
        auto kind = parseHashFunctionKind(value);
        if (!kind.hasValue()) {
          error(entry.getValue(), "unknown hash function '" + value + "'");
          return false;
        }
        config.hashFunction = *kind;
      } else if (key == "log-field-diagnostics") {
        if (!parseBoolean(entry.getValue(), config.logFieldDiagnostics))
          return false;
      } else if (key == "threads") {
        if (StringRef(value).getAsInteger(10, config.threads)) {
          error(entry.getValue(), "invalid thread count '" + value + "'");
          return false;
        }
      } else {
        error(entry.getKey(), "unknown key '" + key + "' in 'rulekey' map");
        return false;
      }
    }
    return true;
  }

  bool parseRootNode(llvm::yaml::Node* node) {
    // An empty document uses the defaults.
    if (node->getType() == llvm::yaml::Node::NK_Null)
      return true;

    if (node->getType() != llvm::yaml::Node::NK_Mapping) {
      error(node, "unexpected top-level node");
      return false;
    }

    for (auto& entry: *static_cast<llvm::yaml::MappingNode*>(node)) {
      if (entry.getKey()->getType() != llvm::yaml::Node::NK_Scalar ||
          stringFromScalarNode(static_cast<llvm::yaml::ScalarNode*>(
                                   entry.getKey())) != "rulekey") {
        error(entry.getKey(), "unexpected top-level section");
        return false;
      }
      if (entry.getValue()->getType() != llvm::yaml::Node::NK_Mapping) {
        error(entry.getValue(), "unexpected 'rulekey' value (expected map)");
        return false;
      }
      if (!parseRuleKeyMapping(
              static_cast<llvm::yaml::MappingNode*>(entry.getValue())))
        return false;
    }
    return true;
  }

public:
  ConfigurationParser(StringRef data, StringRef filename)
    : data(data), filename(filename) {
    sourceMgr.setDiagHandler(handleDiagnostic, this);
  }

  Expected<RuleKeyConfiguration> parse() {
    llvm::yaml::Stream stream(data, sourceMgr);
    auto it = stream.begin();
    if (it != stream.end()) {
      llvm::yaml::Node* root = it->getRoot();
      if (!root) {
        error(llvm::SMLoc(), "missing configuration document");
      } else if (parseRootNode(root)) {
        // There shouldn't be any trailing documents.
        if (++it != stream.end()) {
          error(llvm::SMLoc(), "unexpected trailing document");
        }
      }
    }

    if (numErrors != 0) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     firstError);
    }
    return config;
  }
};

}

Expected<RuleKeyConfiguration>
RuleKeyConfiguration::parse(StringRef data, StringRef filename) {
  ConfigurationParser parser(data, filename);
  return parser.parse();
}

Expected<RuleKeyConfiguration> RuleKeyConfiguration::load(StringRef path) {
  auto buffer = llvm::MemoryBuffer::getFile(path);
  if (!buffer) {
    return llvm::createStringError(buffer.getError(),
                                   "unable to read '%s': %s",
                                   path.str().c_str(),
                                   buffer.getError().message().c_str());
  }
  return parse((*buffer)->getBuffer(), path);
}

void RuleKeyConfiguration::print(raw_ostream& os) const {
  os << "rulekey:\n";
  os << "  seed: " << seed << "\n";
  os << "  hash-function: " << getHashFunctionKindName(hashFunction) << "\n";
  os << "  log-field-diagnostics: "
     << (logFieldDiagnostics ? "true" : "false") << "\n";
  os << "  threads: " << threads << "\n";
}
