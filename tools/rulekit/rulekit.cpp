//===-- rulekit.cpp -------------------------------------------------------===//
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

#include "rulekit/Basic/Version.h"

#include "rulekit/Commands/Commands.h"

#include <cstdio>
#include <cstdlib>

using namespace rulekit;
using namespace rulekit::commands;

static void usage() {
  fprintf(stderr, "Usage: %s [--version] [--help] <command> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\n");
  fprintf(stderr, "Available commands:\n");
  fprintf(stderr, "  hash-file     -- Print the content hash of a file\n");
  fprintf(stderr, "  check-config  -- Validate a rule key configuration\n");
  fprintf(stderr, "  exec          -- Run a command as a build step\n");
  fprintf(stderr, "\n");
  exit(1);
}

int main(int argc, const char **argv) {
  setProgramName("rulekit");

  // Expect the first argument to be the name of a subtool to delegate to.
  if (argc == 1 || std::string(argv[1]) == "--help")
    usage();

  if (std::string(argv[1]) == "--version") {
    // Print the version and exit.
    printf("%s\n", getRuleKitFullVersion().c_str());
    return 0;
  }

  // Otherwise, expect a command name.
  std::string command(argv[1]);
  std::vector<std::string> args;
  for (int i = 2; i != argc; ++i) {
    args.push_back(argv[i]);
  }

  if (command == "hash-file") {
    return executeHashFileCommand(args);
  } else if (command == "check-config") {
    return executeCheckConfigCommand(args);
  } else if (command == "exec") {
    return executeExecCommand(args);
  } else {
    fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
            command.c_str());
    return 1;
  }
}
