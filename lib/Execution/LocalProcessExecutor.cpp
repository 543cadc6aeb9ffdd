//===-- LocalProcessExecutor.cpp ------------------------------------------===//
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

#include "rulekit/Execution/ProcessExecutor.h"

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/Defer.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Errno.h"
#include "llvm/Support/Program.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using namespace rulekit;
using namespace rulekit::execution;

ProcessExecutor::~ProcessExecutor() {}

namespace {

/// A file descriptor which is closed when it goes out of scope.
class ManagedDescriptor {
  int fd = -1;

  // Copying is disabled.
  ManagedDescriptor(const ManagedDescriptor&) RULEKIT_DELETED_FUNCTION;
  void operator=(const ManagedDescriptor&) RULEKIT_DELETED_FUNCTION;

public:
  ManagedDescriptor() {}
  explicit ManagedDescriptor(int fd) : fd(fd) {}
  ~ManagedDescriptor() { close(); }

  int get() const { return fd; }
  bool isValid() const { return fd >= 0; }

  void reset(int newFD) {
    close();
    fd = newFD;
  }

  void close() {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

/// Create a pipe whose ends are not inherited by other children.
static bool createPipe(ManagedDescriptor& readEnd,
                       ManagedDescriptor& writeEnd) {
  int fds[2];
  if (::pipe(fds) < 0)
    return false;
  for (int fd: fds) {
    ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) | FD_CLOEXEC);
  }
  readEnd.reset(fds[0]);
  writeEnd.reset(fds[1]);
  return true;
}

static Error makeSpawnError(StringRef program, const Twine& reason) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "unable to spawn process '" + program +
                                 "' (" + reason + ")");
}

}

Expected<ProcessResult>
LocalProcessExecutor::execute(const ProcessExecutorParams& params) {
  if (params.command.empty()) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unable to spawn process (empty command)");
  }

  // Resolve the program.
  std::string program = params.command[0];
  if (StringRef(program).find('/') == StringRef::npos) {
    auto path = llvm::sys::findProgramByName(program);
    if (!path)
      return makeSpawnError(program, "not found in PATH");
    program = *path;
  }

  std::vector<const char*> argv;
  argv.push_back(program.c_str());
  for (size_t i = 1, e = params.command.size(); i != e; ++i) {
    argv.push_back(params.command[i].c_str());
  }
  argv.push_back(nullptr);

  std::vector<std::string> environmentStorage;
  std::vector<const char*> envp;
  char* const* environment = environ;
  if (params.environment.hasValue()) {
    for (const auto& entry: *params.environment) {
      environmentStorage.push_back(entry.first + "=" + entry.second);
    }
    for (const auto& entry: environmentStorage) {
      envp.push_back(entry.c_str());
    }
    envp.push_back(nullptr);
    environment = const_cast<char* const*>(envp.data());
  }

  ManagedDescriptor outRead, outWrite, errRead, errWrite;
  if (!createPipe(outRead, outWrite) || !createPipe(errRead, errWrite))
    return makeSpawnError(program, "unable to create pipes: " +
                          llvm::sys::StrError());

  // Initialize the spawn attributes.
  posix_spawnattr_t attributes;
  posix_spawnattr_init(&attributes);
  rulekit_defer { posix_spawnattr_destroy(&attributes); };

  // Unmask all signals, and reset them to their default behavior.
  sigset_t noSignals;
  sigemptyset(&noSignals);
  posix_spawnattr_setsigmask(&attributes, &noSignals);
  sigset_t mostSignals;
  sigemptyset(&mostSignals);
  for (int i = 1; i < SIGSYS; ++i) {
    if (i == SIGKILL || i == SIGSTOP) continue;
    sigaddset(&mostSignals, i);
  }
  posix_spawnattr_setsigdefault(&attributes, &mostSignals);
  posix_spawnattr_setflags(&attributes,
                           POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  posix_spawn_file_actions_t fileActions;
  posix_spawn_file_actions_init(&fileActions);
  rulekit_defer { posix_spawn_file_actions_destroy(&fileActions); };

  posix_spawn_file_actions_addopen(&fileActions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&fileActions, outWrite.get(),
                                   STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&fileActions, errWrite.get(),
                                   STDERR_FILENO);
  if (!params.workingDirectory.empty()) {
    int chdirResult = posix_spawn_file_actions_addchdir_np(
        &fileActions, params.workingDirectory.c_str());
    if (chdirResult != 0)
      return makeSpawnError(program, "unable to change directory to '" +
                            params.workingDirectory + "': " +
                            llvm::sys::StrError(chdirResult));
  }

  pid_t pid = -1;
  int result = posix_spawn(&pid, program.c_str(), &fileActions, &attributes,
                           const_cast<char**>(argv.data()), environment);
  if (result != 0)
    return makeSpawnError(program, llvm::sys::StrError(result));

  // Close the child ends of the pipes, and forward the output.
  outWrite.close();
  errWrite.close();

  ProcessResult processResult = ProcessResult::makeFailed();
  struct pollfd fds[2] = {
    { outRead.get(), POLLIN, 0 },
    { errRead.get(), POLLIN, 0 },
  };
  int numOpen = 2;
  char buffer[4096];
  while (numOpen != 0) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i != 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t numBytes = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (numBytes < 0 && errno == EINTR)
        continue;
      if (numBytes <= 0) {
        fds[i].fd = -1;
        --numOpen;
        continue;
      }
      StringRef chunk(buffer, numBytes);
      if (params.captureOutput) {
        (i == 0 ? processResult.stdOut : processResult.stdErr) += chunk.str();
      } else {
        (i == 0 ? stdOut : stdErr) << chunk;
      }
    }
  }
  outRead.close();
  errRead.close();
  stdOut.flush();
  stdErr.flush();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return llvm::createStringError(
          llvm::inconvertibleErrorCode(),
          "unable to wait for process '" + program + "' (" +
          llvm::sys::StrError() + ")");
    }
  }

  if (WIFEXITED(status)) {
    processResult.exitCode = WEXITSTATUS(status);
    processResult.status = processResult.exitCode == 0 ?
      ProcessStatus::Succeeded : ProcessStatus::Failed;
  } else if (WIFSIGNALED(status)) {
    processResult.exitCode = -WTERMSIG(status);
    processResult.status = WTERMSIG(status) == SIGINT ?
      ProcessStatus::Cancelled : ProcessStatus::Failed;
  }
  return processResult;
}

std::unique_ptr<ProcessExecutor>
LocalProcessExecutor::cloneWithOutputStreams(raw_ostream& newStdOut,
                                             raw_ostream& newStdErr) {
  return std::unique_ptr<ProcessExecutor>(
      new LocalProcessExecutor(newStdOut, newStdErr));
}
