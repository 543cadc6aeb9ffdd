//===-- ExecCommand.cpp ---------------------------------------------------===//
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

#include "rulekit/Execution/BuildEvent.h"
#include "rulekit/Execution/Console.h"
#include "rulekit/Execution/ExecutionContext.h"
#include "rulekit/Execution/IsolatedEventBus.h"
#include "rulekit/Execution/PluginLoaderCache.h"
#include "rulekit/Execution/ProcessExecutor.h"
#include "rulekit/Execution/Step.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>
#include <mutex>

using namespace rulekit;
using namespace rulekit::commands;
using namespace rulekit::execution;

namespace {

/// Echoes build events to a stream.
class EventPrinter : public BuildEventListener {
  raw_ostream& os;
  std::mutex mutex;

public:
  explicit EventPrinter(raw_ostream& os) : os(os) {}

  void handleEvent(const BuildEvent& event) override {
    std::lock_guard<std::mutex> guard(mutex);
    os << "[" << event.getBuildId() << "] " << event.describe() << "\n";
    os.flush();
  }
};

}

static void usage() {
  int optionWidth = 28;
  fprintf(stderr, "Usage: %s exec [options] [--] <command> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\nRun a command as a build step.\n");
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--verbosity <LEVEL>",
          "silent, standard, binary-outputs, commands, commands-and-output "
          "or all");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--chdir <PATH>",
          "run the command in PATH");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--show-events",
          "print the build events posted while running");
  ::exit(1);
}

int commands::executeExecCommand(const std::vector<std::string> &argsIn) {
  std::vector<std::string> args(argsIn);
  Verbosity verbosity = Verbosity::CommandsAndOutput;
  std::string workingDirectory;
  bool showEvents = false;
  while (!args.empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      usage();
    } else if (option == "--verbosity" || option == "--chdir") {
      if (args.empty()) {
        fprintf(stderr, "error: %s: missing argument to '%s'\n\n",
                getProgramName(), option.c_str());
        usage();
      }
      if (option == "--chdir") {
        workingDirectory = args[0];
      } else {
        auto parsed = parseVerbosity(args[0]);
        if (!parsed.hasValue()) {
          fprintf(stderr, "error: %s: invalid verbosity '%s'\n\n",
                  getProgramName(), args[0].c_str());
          usage();
        }
        verbosity = *parsed;
      }
      args.erase(args.begin());
    } else if (option == "--show-events") {
      showEvents = true;
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      usage();
    }
  }

  if (args.empty()) {
    fprintf(stderr, "error: %s: missing command\n", getProgramName());
    usage();
  }

  SmallString<256> cellRoot;
  if (std::error_code ec = llvm::sys::fs::current_path(cellRoot)) {
    fprintf(stderr, "error: %s: unable to get current directory: %s\n",
            getProgramName(), ec.message().c_str());
    return 1;
  }

  IsolatedEventBus eventBus("exec");
  if (showEvents)
    eventBus.registerListener(std::make_shared<EventPrinter>(llvm::errs()));

  Console console = Console::createDefault(verbosity);
  ExecutionContext context(
      console, eventBus,
      std::unique_ptr<ProcessExecutor>(
          new LocalProcessExecutor(llvm::outs(), llvm::errs())),
      std::make_shared<PluginLoaderCache>(), cellRoot);

  ShellStep step("exec", args, workingDirectory);
  auto result = runStep(step, context);
  if (!result) {
    console.printBuildFailure(llvm::toString(result.takeError()));
    return 1;
  }

  if (Error err = context.close()) {
    console.printErrorText(llvm::toString(std::move(err)));
    return 1;
  }
  return result->exitCode;
}
