//===-- HashFileCommand.cpp -----------------------------------------------===//
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

#include "rulekit/RuleKey/FileHashCache.h"
#include "rulekit/RuleKey/HashFunction.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace rulekit;
using namespace rulekit::commands;
using namespace rulekit::rulekey;

static void usage() {
  int optionWidth = 28;
  fprintf(stderr, "Usage: %s hash-file [options] <path> [<member>]\n",
          getProgramName());
  fprintf(stderr, "\nPrint the content hash of a file, or of a member of an "
          "archive file.\n");
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--hash-function <NAME>",
          "the hash function to use (sha1 or sha256)");
  ::exit(1);
}

int commands::executeHashFileCommand(const std::vector<std::string> &argsIn) {
  std::vector<std::string> args(argsIn);
  HashFunctionKind kind = HashFunctionKind::SHA1;
  while (!args.empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      usage();
    } else if (option == "--hash-function") {
      if (args.empty()) {
        fprintf(stderr, "error: %s: missing argument to '%s'\n\n",
                getProgramName(), option.c_str());
        usage();
      }
      auto parsed = parseHashFunctionKind(args[0]);
      if (!parsed.hasValue()) {
        fprintf(stderr, "error: %s: unknown hash function '%s'\n\n",
                getProgramName(), args[0].c_str());
        usage();
      }
      kind = *parsed;
      args.erase(args.begin());
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      usage();
    }
  }

  if (args.size() != 1 && args.size() != 2) {
    fprintf(stderr, "error: %s: invalid number of arguments\n",
            getProgramName());
    usage();
  }

  DefaultFileHashCache cache(kind);
  auto hash = args.size() == 1 ? cache.get(args[0]) :
    cache.getForArchiveMember(args[0], args[1]);
  if (!hash) {
    llvm::errs() << "error: " << getProgramName() << ": "
                 << llvm::toString(hash.takeError()) << "\n";
    return 1;
  }

  llvm::outs() << hash->toHex() << "\n";
  return 0;
}
