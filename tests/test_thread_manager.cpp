// File: tests/test_thread_manager.cpp
// Purpose: per-thread attachment records, ownership and exit-time detach.

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "errors.h"
#include "fake_runtime_api.h"
#include "log.h"
#include "runtime_gate.h"
#include "thread_manager.h"

using namespace monoattach;
using monoattach::fakes::FakeConfig;
using monoattach::fakes::FakeRuntimeApi;

namespace {

class ThreadManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SetLogFileEnabled(false);
    ClearLog();
    api_.AddModule("libmonosgen-2.0.so", "/opt/game/lib/libmonosgen-2.0.so");
    ASSERT_TRUE(gate_.Initialize().get());
  }

  FakeRuntimeApi api_;
  BridgeConfig cfg_ = FakeConfig();
  ModuleLocator locator_{api_, 5};
  RuntimeGate gate_{api_, locator_, cfg_};
  ThreadManager threads_{api_, gate_};
};

}  // namespace

TEST_F(ThreadManagerTest, AttachesOncePerThread) {
  EXPECT_FALSE(threads_.IsAttached());
  ThreadManager::AttachResult first = threads_.EnsureAttached();
  ThreadManager::AttachResult second = threads_.EnsureAttached();

  EXPECT_TRUE(first.performed_attach);
  EXPECT_FALSE(second.performed_attach);
  EXPECT_EQ(first.handle, second.handle);
  EXPECT_EQ(api_.attach_calls.load(), 1);
  EXPECT_TRUE(threads_.IsAttached());
  EXPECT_EQ(threads_.AttachedThreadCount(), 1u);
}

TEST_F(ThreadManagerTest, EachThreadGetsItsOwnRecord) {
  threads_.EnsureAttached();
  std::thread worker([this]() { threads_.EnsureAttached(); });
  worker.join();
  EXPECT_EQ(api_.attach_calls.load(), 2);
}

TEST_F(ThreadManagerTest, NotReadyGateRefusesAttach) {
  gate_.Reset();
  EXPECT_THROW(threads_.EnsureAttached(), RuntimeNotReadyError);
  EXPECT_EQ(api_.attach_calls.load(), 0);
}

TEST_F(ThreadManagerTest, NullAttachThrows) {
  api_.FailAttach(true);
  EXPECT_THROW(threads_.EnsureAttached(), AttachmentError);
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);
}

TEST_F(ThreadManagerTest, ExternallyAttachedThreadIsAdoptedNotOwned) {
  MonoThread* external = api_.PreAttachCurrentThread();
  EXPECT_TRUE(threads_.IsAttached());

  ThreadManager::AttachResult result = threads_.EnsureAttached();
  EXPECT_FALSE(result.performed_attach);
  EXPECT_EQ(result.handle, external);
  EXPECT_EQ(api_.attach_calls.load(), 0);

  threads_.MarkBridgeOwned();
  EXPECT_FALSE(threads_.IsBridgeOwned());
  EXPECT_FALSE(threads_.DetachBridgeOwned());
  threads_.DetachAll();
  EXPECT_EQ(api_.detach_calls.load(), 0);
  EXPECT_TRUE(api_.IsNativelyAttached(std::this_thread::get_id()));
}

TEST_F(ThreadManagerTest, DetachBridgeOwnedOnlyWhenOwned) {
  threads_.EnsureAttached();
  EXPECT_FALSE(threads_.DetachBridgeOwned());
  EXPECT_EQ(api_.detach_calls.load(), 0);

  threads_.MarkBridgeOwned();
  EXPECT_TRUE(threads_.IsBridgeOwned());
  EXPECT_TRUE(threads_.DetachBridgeOwned());
  EXPECT_EQ(api_.detach_calls.load(), 1);
  EXPECT_FALSE(threads_.IsAttached());
}

TEST_F(ThreadManagerTest, DetachFailureIsSwallowed) {
  threads_.EnsureAttached();
  threads_.MarkBridgeOwned();
  api_.FailDetach(true);
  bool detached = true;
  EXPECT_NO_THROW(detached = threads_.DetachBridgeOwned());
  EXPECT_FALSE(detached);
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);
}

TEST_F(ThreadManagerTest, DetachIfExitingLeavesLiveThreadAttached) {
  threads_.EnsureAttached();
  EXPECT_FALSE(threads_.DetachIfExiting());
  EXPECT_EQ(api_.detach_calls.load(), 0);
  EXPECT_TRUE(threads_.IsAttached());
  EXPECT_TRUE(api_.IsNativelyAttached(std::this_thread::get_id()));
}

TEST_F(ThreadManagerTest, DetachIfExitingWithoutRecordMakesNoNativeCall) {
  EXPECT_FALSE(threads_.DetachIfExiting());
  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 0);
}

TEST_F(ThreadManagerTest, DetachIfExitingDetachesThreadInTeardown) {
  bool detached = false;
  std::thread worker([&]() {
    threads_.EnsureAttached();
    api_.MarkCurrentThreadExiting();
    detached = threads_.DetachIfExiting();
  });
  worker.join();

  EXPECT_TRUE(detached);
  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 1);
  EXPECT_EQ(api_.detach_calls.load(), 0);
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);
}

TEST_F(ThreadManagerTest, DetachIfExitingSkipsAdoptedThread) {
  api_.PreAttachCurrentThread();
  threads_.EnsureAttached();
  api_.MarkCurrentThreadExiting();
  EXPECT_FALSE(threads_.DetachIfExiting());
  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 0);
  EXPECT_TRUE(api_.IsNativelyAttached(std::this_thread::get_id()));
}

TEST_F(ThreadManagerTest, DetachIfExitingSkipsActiveFrame) {
  bool detached_inside = true;
  threads_.RunAsync([&]() {
    api_.MarkCurrentThreadExiting();
    detached_inside = threads_.DetachIfExiting();
  }).get();

  EXPECT_FALSE(detached_inside);
  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 0);
  EXPECT_TRUE(threads_.DetachIfExiting());
}

TEST_F(ThreadManagerTest, ExitingThreadIsDetached) {
  std::thread::id worker_id;
  std::thread worker([&]() {
    worker_id = std::this_thread::get_id();
    threads_.EnsureAttached();
  });
  worker.join();

  // The runtime had not flagged the thread yet, so the direct detach ran.
  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 1);
  EXPECT_EQ(api_.detach_calls.load(), 1);
  EXPECT_FALSE(api_.IsNativelyAttached(worker_id));
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);
}

TEST_F(ThreadManagerTest, ExitingThreadFlaggedByRuntimeUsesExitingDetach) {
  std::thread worker([&]() {
    threads_.EnsureAttached();
    api_.MarkCurrentThreadExiting();
  });
  worker.join();

  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 1);
  EXPECT_EQ(api_.detach_calls.load(), 0);
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);
}

TEST_F(ThreadManagerTest, ExitingAdoptedThreadIsLeftAlone) {
  std::thread worker([&]() {
    api_.PreAttachCurrentThread();
    threads_.EnsureAttached();
  });
  worker.join();

  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 0);
  EXPECT_EQ(api_.detach_calls.load(), 0);
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);
}

TEST_F(ThreadManagerTest, DetachAllReleasesEveryNativeAttach) {
  std::atomic<int> attached{0};
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();

  std::vector<std::thread> workers;
  for (int i = 0; i < 2; ++i) {
    workers.emplace_back([&]() {
      threads_.EnsureAttached();
      attached.fetch_add(1);
      released.wait();
    });
  }
  threads_.EnsureAttached();
  while (attached.load() < 2) std::this_thread::yield();
  ASSERT_EQ(threads_.AttachedThreadCount(), 3u);

  threads_.DetachAll();
  EXPECT_EQ(api_.detach_calls.load(), 3);
  EXPECT_EQ(threads_.AttachedThreadCount(), 0u);

  release.set_value();
  for (auto& t : workers) t.join();
  // Records are gone, so thread exit has nothing left to detach.
  EXPECT_EQ(api_.detach_if_exiting_calls.load(), 0);
}

TEST_F(ThreadManagerTest, RunAsyncTracksNestedDepth) {
  int outer_depth = 0;
  std::future<int> result = threads_.RunAsync([&]() {
    outer_depth = threads_.Depth();
    return threads_.RunAsync([&]() { return threads_.Depth(); }).get();
  });

  EXPECT_EQ(result.get(), 2);
  EXPECT_EQ(outer_depth, 1);
  EXPECT_EQ(threads_.Depth(), 0);
  EXPECT_EQ(api_.attach_calls.load(), 1);
}

TEST_F(ThreadManagerTest, ActiveFrameBlocksDetach) {
  bool detached_inside = true;
  threads_.RunAsync([&]() {
    threads_.MarkBridgeOwned();
    detached_inside = threads_.DetachBridgeOwned();
  }).get();

  EXPECT_FALSE(detached_inside);
  EXPECT_TRUE(threads_.DetachBridgeOwned());
}

TEST_F(ThreadManagerTest, RunAsyncSettlesReturnedFuture) {
  std::future<int> result = threads_.RunAsync([]() {
    std::promise<int> inner;
    inner.set_value(42);
    return inner.get_future();
  });
  EXPECT_EQ(result.get(), 42);
}

TEST_F(ThreadManagerTest, RunAsyncRejectsOnThrow) {
  std::future<void> result = threads_.RunAsync([]() { throw std::runtime_error("boom"); });
  EXPECT_THROW(result.get(), std::runtime_error);
  EXPECT_EQ(threads_.Depth(), 0);
}
