//===- unittests/Execution/ExecutionContextTest.cpp -----------------------===//
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

#include "../TestSupport/TempDir.h"

#include "rulekit/Execution/Console.h"
#include "rulekit/Execution/ExecutionContext.h"
#include "rulekit/Execution/IsolatedEventBus.h"
#include "rulekit/Execution/PluginLoaderCache.h"
#include "rulekit/Execution/ProcessExecutor.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <map>
#include <memory>
#include <string>

using namespace rulekit;
using namespace rulekit::execution;

namespace {

class ExecutionContextTest : public ::testing::Test {
protected:
  std::string output;
  llvm::raw_string_ostream outputStream{output};
  IsolatedEventBus eventBus{"context-test"};
  std::shared_ptr<PluginLoaderCache> plugins =
    std::make_shared<PluginLoaderCache>();

  std::unique_ptr<ExecutionContext> createRootContext(
      std::map<std::string, std::string> environment = {}) {
    return std::unique_ptr<ExecutionContext>(new ExecutionContext(
        Console(Verbosity::Commands, outputStream, outputStream), eventBus,
        std::unique_ptr<ProcessExecutor>(
            new LocalProcessExecutor(outputStream, outputStream)),
        plugins, "/work/cell", std::move(environment), Platform::Linux));
  }
};

TEST_F(ExecutionContextTest, accessors) {
  auto context = createRootContext({{"LANG", "C"}});
  EXPECT_EQ(Verbosity::Commands, context->getVerbosity());
  EXPECT_EQ("/work/cell", context->getCellRoot());
  EXPECT_EQ(Platform::Linux, context->getPlatform());
  EXPECT_EQ(&eventBus, &context->getEventBus());
  EXPECT_EQ(plugins.get(), &context->getPluginLoaderCache());
  EXPECT_EQ(1u, context->getEnvironment().size());
  EXPECT_EQ("C", context->getEnvironment().at("LANG"));
  EXPECT_FALSE(context->isClosed());

  context->getStdOut() << "out ";
  context->getStdErr() << "err";
  EXPECT_EQ("out err", outputStream.str());
}

TEST_F(ExecutionContextTest, subContextInheritsSettings) {
  auto root = createRootContext({{"LANG", "C"}});
  std::string subOutput;
  llvm::raw_string_ostream subStream(subOutput);

  auto sub = root->createSubContext(subStream, subStream);
  EXPECT_EQ(Verbosity::Commands, sub->getVerbosity());
  EXPECT_EQ("/work/cell", sub->getCellRoot());
  EXPECT_EQ(root->getEnvironment(), sub->getEnvironment());
  EXPECT_EQ(&eventBus, &sub->getEventBus());
  EXPECT_EQ(Platform::Linux, sub->getPlatform());

  sub->getStdErr() << "redirected";
  EXPECT_EQ("redirected", subStream.str());
  EXPECT_EQ("", outputStream.str());

  auto quiet = root->createSubContext(subStream, subStream,
                                      Verbosity::Silent);
  EXPECT_EQ(Verbosity::Silent, quiet->getVerbosity());
  EXPECT_EQ(Verbosity::Commands, root->getVerbosity());

  // The process executor writes to the sub-context's streams.
  ProcessExecutorParams params;
  params.command = { "/bin/sh", "-c", "echo from-process" };
  auto result = sub->getProcessExecutor().execute(params);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_EQ("redirectedfrom-process\n", subStream.str());

  EXPECT_FALSE(bool(quiet->close()));
  EXPECT_FALSE(bool(sub->close()));
}

TEST_F(ExecutionContextTest, pluginCacheIsReleasedOnce) {
  auto root = createRootContext();
  EXPECT_EQ(1u, plugins->getRefCount());

  auto first = root->createSubContext(outputStream, outputStream);
  auto second = first->createSubContext(outputStream, outputStream);
  EXPECT_EQ(3u, plugins->getRefCount());

  // Closing the root first leaves the cache alive for the sub-contexts.
  EXPECT_FALSE(bool(root->close()));
  EXPECT_TRUE(root->isClosed());
  EXPECT_EQ(2u, plugins->getRefCount());
  EXPECT_FALSE(plugins->isReleased());

  // Closing twice gives back only one reference.
  EXPECT_FALSE(bool(second->close()));
  EXPECT_FALSE(bool(second->close()));
  EXPECT_EQ(1u, plugins->getRefCount());

  first.reset();
  EXPECT_EQ(0u, plugins->getRefCount());
  EXPECT_TRUE(plugins->isReleased());
}

TEST_F(ExecutionContextTest, ownedStreamsAreFlushedOnClose) {
  TmpDir tempDir(__func__);
  std::string outPath = tempDir.path("stdout.txt");
  std::string errPath = tempDir.path("stderr.txt");

  auto root = createRootContext();
  std::error_code ec;
  std::unique_ptr<llvm::raw_fd_ostream> outFile(
      new llvm::raw_fd_ostream(outPath, ec, llvm::sys::fs::OF_None));
  ASSERT_FALSE(ec) << ec.message();
  std::unique_ptr<llvm::raw_fd_ostream> errFile(
      new llvm::raw_fd_ostream(errPath, ec, llvm::sys::fs::OF_None));
  ASSERT_FALSE(ec) << ec.message();

  auto sub = root->createSubContext(std::move(outFile), std::move(errFile));
  sub->getStdOut() << "step output";
  sub->getStdErr() << "step errors";
  EXPECT_FALSE(bool(sub->close()));

  auto outContents = llvm::MemoryBuffer::getFile(outPath);
  ASSERT_TRUE(bool(outContents));
  EXPECT_EQ("step output", (*outContents)->getBuffer());
  auto errContents = llvm::MemoryBuffer::getFile(errPath);
  ASSERT_TRUE(bool(errContents));
  EXPECT_EQ("step errors", (*errContents)->getBuffer());

  // The streams stay usable until the context is destroyed.
  sub->getStdOut() << ", late output";
  sub.reset();
  outContents = llvm::MemoryBuffer::getFile(outPath);
  ASSERT_TRUE(bool(outContents));
  EXPECT_EQ("step output, late output", (*outContents)->getBuffer());
}

TEST_F(ExecutionContextTest, ownedStreamsOutliveClose) {
  auto root = createRootContext();
  std::string subOutput;
  std::string subErrors;
  auto sub = root->createSubContext(
      std::unique_ptr<raw_ostream>(new llvm::raw_string_ostream(subOutput)),
      std::unique_ptr<raw_ostream>(new llvm::raw_string_ostream(subErrors)));
  EXPECT_FALSE(bool(sub->close()));
  EXPECT_TRUE(sub->isClosed());

  sub->getStdOut() << "after close;";
  sub->getStdErr() << "errors after close";
  ProcessExecutorParams params;
  params.command = { "/bin/sh", "-c", "echo from-process" };
  auto result = sub->getProcessExecutor().execute(params);
  ASSERT_TRUE(bool(result)) << llvm::toString(result.takeError());
  EXPECT_TRUE(result->isSuccess());

  sub.reset();
  EXPECT_EQ("after close;from-process\n", subOutput);
  EXPECT_EQ("errors after close", subErrors);
}

TEST_F(ExecutionContextTest, ownedFileWriteFailureIsReportedOnClose) {
  if (!llvm::sys::fs::exists("/dev/full"))
    GTEST_SKIP() << "/dev/full is unavailable";

  auto root = createRootContext();
  std::error_code ec;
  std::unique_ptr<llvm::raw_fd_ostream> outFile(
      new llvm::raw_fd_ostream("/dev/full", ec, llvm::sys::fs::OF_None));
  ASSERT_FALSE(ec) << ec.message();
  std::unique_ptr<llvm::raw_fd_ostream> errFile(
      new llvm::raw_fd_ostream("/dev/full", ec, llvm::sys::fs::OF_None));
  ASSERT_FALSE(ec) << ec.message();

  auto sub = root->createSubContext(std::move(outFile), std::move(errFile));
  sub->getStdOut() << "lost output";
  Error err = sub->close();
  ASSERT_TRUE(bool(err));
  EXPECT_EQ(0u, llvm::toString(std::move(err)).find(
                "unable to write step output: "));
  EXPECT_FALSE(bool(sub->close()));
}

TEST(PluginLoaderCacheTest, referenceCounting) {
  PluginLoaderCache cache;
  EXPECT_EQ(1u, cache.getRefCount());
  cache.addRef();
  cache.addRef();
  EXPECT_EQ(3u, cache.getRefCount());

  EXPECT_FALSE(bool(cache.close()));
  EXPECT_FALSE(bool(cache.close()));
  EXPECT_FALSE(cache.isReleased());
  EXPECT_FALSE(bool(cache.close()));
  EXPECT_TRUE(cache.isReleased());
  EXPECT_EQ(0u, cache.getRefCount());
}

TEST(PluginLoaderCacheTest, loading) {
  PluginLoaderCache cache;

  auto handle = cache.getOrLoad("libc.so.6");
  ASSERT_TRUE(bool(handle)) << llvm::toString(handle.takeError());
  auto again = cache.getOrLoad("libc.so.6");
  ASSERT_TRUE(bool(again)) << llvm::toString(again.takeError());
  EXPECT_EQ(*handle, *again);
  EXPECT_EQ(1u, cache.getNumLoadedModules());

  auto symbol = cache.lookupSymbol("libc.so.6", "strlen");
  ASSERT_TRUE(bool(symbol)) << llvm::toString(symbol.takeError());
  EXPECT_NE(nullptr, *symbol);

  auto missingSymbol = cache.lookupSymbol("libc.so.6",
                                          "rulekit_no_such_symbol");
  ASSERT_FALSE(bool(missingSymbol));
  EXPECT_EQ(0u, llvm::toString(missingSymbol.takeError()).find(
                "unable to find symbol 'rulekit_no_such_symbol'"));

  auto missing = cache.getOrLoad("/rulekit/no/such/plugin.so");
  ASSERT_FALSE(bool(missing));
  EXPECT_EQ(0u, llvm::toString(missing.takeError()).find(
                "unable to load plugin '/rulekit/no/such/plugin.so': "));
  EXPECT_EQ(1u, cache.getNumLoadedModules());

  EXPECT_FALSE(bool(cache.close()));
  EXPECT_EQ(0u, cache.getNumLoadedModules());
}

TEST(PluginLoaderCacheTest, misuseIsFatal) {
  PluginLoaderCache cache;
  EXPECT_FALSE(bool(cache.close()));
  EXPECT_DEATH(cache.addRef(), "plugin loader cache used after release");
  EXPECT_DEATH(llvm::consumeError(cache.close()),
               "plugin loader cache closed too many times");
}

}
