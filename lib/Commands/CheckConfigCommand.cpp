//===-- CheckConfigCommand.cpp --------------------------------------------===//
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

#include "rulekit/Commands/Commands.h"

#include "rulekit/RuleKey/RuleKeyConfiguration.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace rulekit;
using namespace rulekit::commands;
using namespace rulekit::rulekey;

static void usage() {
  fprintf(stderr, "Usage: %s check-config [--help] <path>\n",
          getProgramName());
  fprintf(stderr, "\nValidate a rule key configuration file and print the "
          "effective settings.\n");
  ::exit(1);
}

int commands::executeCheckConfigCommand(
    const std::vector<std::string> &args) {
  if (args.size() != 1 || args[0] == "--help")
    usage();

  auto config = RuleKeyConfiguration::load(args[0]);
  if (!config) {
    llvm::errs() << "error: " << getProgramName() << ": "
                 << llvm::toString(config.takeError()) << "\n";
    return 1;
  }

  config->print(llvm::outs());
  return 0;
}
