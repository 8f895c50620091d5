#include "framed/request-task.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <coroutine>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace framed {

namespace {

// Destroying the frame runs the guard's destructor, which flips the atomic.
struct FrameGuard {
  explicit FrameGuard(std::shared_ptr<std::atomic<int>> value) : alive(std::move(value)) {}
  FrameGuard(const FrameGuard&) = delete;
  FrameGuard& operator=(const FrameGuard&) = delete;
  ~FrameGuard() { alive->store(0, std::memory_order_relaxed); }

  std::shared_ptr<std::atomic<int>> alive;
};

RequestTask<int> MakeGuardedInt(std::shared_ptr<std::atomic<int>> alive) {
  FrameGuard guard(std::move(alive));
  co_await std::suspend_always{};
  co_return 42;
}

RequestTask<void> MakeGuardedVoid(std::shared_ptr<std::atomic<int>> alive) {
  FrameGuard guard(std::move(alive));
  co_await std::suspend_always{};
  co_return;
}

RequestTask<int> MakeIntOk() { co_return 7; }

RequestTask<int> MakeIntThrow() {
  throw std::runtime_error("boom");
  co_return 0;
}

RequestTask<void> MakeVoidOk() { co_return; }

RequestTask<void> MakeVoidThrow() {
  throw std::runtime_error("void boom");
  co_return;
}

RequestTask<std::string> MakeSuspendingTwice() {
  co_await std::suspend_always{};
  co_await std::suspend_always{};
  co_return "done";
}

// A type without default constructor can be produced.
struct NoDefault {
  explicit NoDefault(int val) : value(val) {}
  int value;
};

RequestTask<NoDefault> MakeNoDefault() { co_return NoDefault(3); }

}  // namespace

TEST(RequestTask, ResetDestroysActiveFrame_Value) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  auto task = MakeGuardedInt(alive);
  EXPECT_TRUE(task.valid());
  task.resume();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 1);
  task.reset();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 0);
  EXPECT_FALSE(task.valid());
}

TEST(RequestTask, ResetDestroysActiveFrame_Void) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  auto task = MakeGuardedVoid(alive);
  task.resume();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 1);
  task.reset();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 0);
}

TEST(RequestTask, DestructorDestroysActiveFrame) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  {
    auto task = MakeGuardedInt(alive);
    task.resume();
    EXPECT_EQ(alive->load(std::memory_order_relaxed), 1);
  }
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 0);
}

TEST(RequestTask, IsLazy) {
  auto task = MakeIntOk();
  EXPECT_TRUE(task.valid());
  EXPECT_FALSE(task.done());
  EXPECT_EQ(task.runSynchronously(), 7);
  EXPECT_TRUE(task.done());
}

TEST(RequestTask, StepResumesOnceUntilDone) {
  auto task = MakeSuspendingTwice();
  EXPECT_FALSE(task.step());
  EXPECT_FALSE(task.step());
  EXPECT_TRUE(task.step());
  // Stepping a finished task is a no-op.
  EXPECT_TRUE(task.step());
  EXPECT_EQ(task.consumeResult(), "done");
}

TEST(RequestTask, IntExceptionIsRethrownOnConsume) {
  auto task = MakeIntThrow();
  EXPECT_THROW(task.runSynchronously(), std::runtime_error);
}

TEST(RequestTask, VoidSuccessAndException) {
  auto okTask = MakeVoidOk();
  EXPECT_NO_THROW(okTask.runSynchronously());

  auto throwingTask = MakeVoidThrow();
  EXPECT_THROW(throwingTask.runSynchronously(), std::runtime_error);
}

TEST(RequestTask, ValueTypeWithoutDefaultConstructor) {
  auto task = MakeNoDefault();
  EXPECT_EQ(task.runSynchronously().value, 3);
}

TEST(RequestTask, DefaultConstructedIsInvalidAndDone) {
  RequestTask<int> task;
  EXPECT_FALSE(task.valid());
  EXPECT_TRUE(task.done());
  task.resume();
  EXPECT_TRUE(task.step());
}

TEST(RequestTask, EmptyTaskRunSynchronously) {
  RequestTask<void> empty;
  EXPECT_NO_THROW(empty.runSynchronously());
  EXPECT_NO_THROW(empty.consumeResult());

  RequestTask<int> emptyInt;
  EXPECT_THROW(emptyInt.runSynchronously(), std::logic_error);

  auto source = MakeIntOk();
  auto target = std::move(source);
  EXPECT_THROW(source.consumeResult(), std::logic_error);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(target.runSynchronously(), 7);

  auto alive = std::make_shared<std::atomic<int>>(1);
  auto released = MakeGuardedVoid(alive);
  auto handle = released.release();
  EXPECT_NO_THROW(released.runSynchronously());
  handle.destroy();
}

TEST(RequestTask, ConsumeBeforeCompletionThrows) {
  auto task = MakeSuspendingTwice();
  EXPECT_THROW(task.consumeResult(), std::logic_error);
  EXPECT_FALSE(task.step());
  EXPECT_THROW(task.consumeResult(), std::logic_error);
  EXPECT_EQ(task.runSynchronously(), "done");

  auto voidTask = MakeGuardedVoid(std::make_shared<std::atomic<int>>(1));
  EXPECT_THROW(voidTask.consumeResult(), std::logic_error);
}

TEST(RequestTask, MoveAssignmentDestroysPreviousFrame) {
  auto aliveOld = std::make_shared<std::atomic<int>>(1);
  RequestTask<int> target = MakeGuardedInt(aliveOld);
  target.resume();
  EXPECT_EQ(aliveOld->load(std::memory_order_relaxed), 1);

  RequestTask<int> source = MakeIntOk();
  target = std::move(source);
  EXPECT_FALSE(source.valid());  // NOLINT(bugprone-use-after-move)
  EXPECT_TRUE(target.valid());
  EXPECT_EQ(aliveOld->load(std::memory_order_relaxed), 0);
  EXPECT_EQ(target.runSynchronously(), 7);
}

TEST(RequestTask, ReleaseTransfersOwnership) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  RequestTask<void> task = MakeGuardedVoid(alive);
  task.resume();
  auto handle = task.release();
  EXPECT_FALSE(task.valid());
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 1);
  ASSERT_TRUE(handle);
  handle.destroy();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 0);
}

}  // namespace framed
