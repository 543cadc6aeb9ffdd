//===-- BuildTarget.cpp ---------------------------------------------------===//
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

#include "rulekit/RuleKey/BuildTarget.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace rulekit;
using namespace rulekit::rulekey;

static Error makeTargetError(StringRef name, const Twine& message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "invalid build target '" + name + "': " +
                                 message);
}

BuildTarget::BuildTarget(StringRef cellName, StringRef basePath,
                         StringRef shortName, ArrayRef<std::string> flavors)
  : cellName(cellName), basePath(basePath), shortName(shortName),
    flavors(flavors.begin(), flavors.end())
{
  std::sort(this->flavors.begin(), this->flavors.end());
  this->flavors.erase(std::unique(this->flavors.begin(), this->flavors.end()),
                      this->flavors.end());
}

Expected<BuildTarget> BuildTarget::parse(StringRef name) {
  size_t slashes = name.find("//");
  if (slashes == StringRef::npos)
    return makeTargetError(name, "expected '//' before the base path");
  StringRef cell = name.substr(0, slashes);
  StringRef rest = name.substr(slashes + 2);

  size_t colon = rest.find(':');
  if (colon == StringRef::npos)
    return makeTargetError(name, "expected ':' before the rule name");
  StringRef basePath = rest.substr(0, colon);
  StringRef shortName, flavorList;
  std::tie(shortName, flavorList) = rest.substr(colon + 1).split('#');

  std::vector<std::string> flavors;
  if (rest.substr(colon + 1).contains('#')) {
    SmallVector<StringRef, 4> parts;
    flavorList.split(parts, ',');
    for (auto flavor: parts) {
      flavors.push_back(flavor.str());
    }
  }

  BuildTarget target(cell, basePath, shortName, flavors);
  if (Error err = target.validate())
    return std::move(err);
  return target;
}

BuildTarget BuildTarget::withFlavors(ArrayRef<std::string> newFlavors) const {
  std::vector<std::string> allFlavors(flavors);
  allFlavors.insert(allFlavors.end(), newFlavors.begin(), newFlavors.end());
  return BuildTarget(cellName, basePath, shortName, allFlavors);
}

std::string BuildTarget::getUnflavoredName() const {
  return cellName + "//" + basePath + ":" + shortName;
}

std::string BuildTarget::getFullyQualifiedName() const {
  std::string result = getUnflavoredName();
  if (!flavors.empty()) {
    result += "#";
    result += llvm::join(flavors, ",");
  }
  return result;
}

Error BuildTarget::validate() const {
  std::string name = getFullyQualifiedName();
  if (cellName.find_first_of("/:#") != std::string::npos)
    return makeTargetError(name, "invalid cell name '" + cellName + "'");
  if (basePath.find_first_of(":#") != std::string::npos)
    return makeTargetError(name, "invalid base path '" + basePath + "'");
  if (!basePath.empty()) {
    if (basePath.front() == '/' || basePath.back() == '/')
      return makeTargetError(name, "base path must not begin or end with '/'");
    SmallVector<StringRef, 8> components;
    StringRef(basePath).split(components, '/');
    for (auto component: components) {
      if (component.empty() || component == "." || component == "..")
        return makeTargetError(name, "invalid base path '" + basePath + "'");
    }
  }
  if (shortName.empty())
    return makeTargetError(name, "missing rule name");
  if (shortName.find_first_of("/:#,") != std::string::npos)
    return makeTargetError(name, "invalid rule name '" + shortName + "'");
  for (const auto& flavor: flavors) {
    if (flavor.empty())
      return makeTargetError(name, "empty flavor");
    if (flavor.find_first_of("/:#") != std::string::npos)
      return makeTargetError(name, "invalid flavor '" + flavor + "'");
  }
  return Error::success();
}

raw_ostream& rulekit::rulekey::operator<<(raw_ostream& os,
                                          const BuildTarget& target) {
  return os << target.getFullyQualifiedName();
}

Expected<BuildTarget> BuildTargetFactory::createFromAttributes(
    StringRef cellRoot, StringRef cellName,
    const std::map<std::string, std::string>& attributes,
    StringRef buildFilePath) {
  auto error = [&](const Twine& message) -> Error {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   buildFilePath + ": " + message);
  };

  // Compute the base path from the build file location.
  StringRef root = cellRoot.rtrim('/');
  StringRef directory = llvm::sys::path::parent_path(buildFilePath);
  StringRef basePath;
  if (directory == root) {
    basePath = "";
  } else if (directory.startswith(root) &&
             directory.substr(root.size()).startswith("/")) {
    basePath = directory.substr(root.size() + 1);
  } else {
    return error("build file is not inside cell root '" + cellRoot + "'");
  }

  auto it = attributes.find("name");
  if (it == attributes.end()) {
    std::string description;
    for (const auto& entry : attributes) {
      if (!description.empty())
        description += ",";
      description += entry.first + "->" + entry.second;
    }
    return error("malformed raw data, missing required attribute 'name': {" +
                 description + "}");
  }
  const std::string& shortName = it->second;
  if (shortName.empty())
    return error("rule attribute 'name' must not be empty");

  it = attributes.find("base_path");
  if (it != attributes.end() && it->second != basePath) {
    return error("rule '" + shortName + "' declares base_path '" +
                 it->second + "' but is defined in '" + basePath + "'");
  }

  BuildTarget target(cellName, basePath, shortName);
  if (Error err = target.validate())
    return std::move(err);
  return target;
}
