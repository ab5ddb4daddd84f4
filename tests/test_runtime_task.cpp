#include <gtest/gtest.h>

#include "selio/selio.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>

namespace {

auto return_value_task() -> selio::task<int> {
  co_return 42;
}

auto child_increment(std::atomic<int>& counter) -> selio::task<void> {
  counter.fetch_add(1, std::memory_order_relaxed);
  co_return;
}

auto spawn_children(std::atomic<int>& counter) -> selio::task<void> {
  selio::spawn(child_increment(counter));
  selio::spawn(child_increment(counter));
  co_return;
}

auto throwing_task() -> selio::task<int> {
  throw std::runtime_error("boom");
  co_return 0;
}

auto cancel_of_child() -> selio::task<selio::coroutine::detail::Cancel*> {
  auto cancel = co_await selio::coroutine::detail::current_cancel();
  co_return cancel.get();
}

auto child_shares_cancel() -> selio::task<bool> {
  auto cancel = co_await selio::coroutine::detail::current_cancel();
  auto child = co_await cancel_of_child();
  co_return child == cancel.get();
}

}  // namespace

TEST(RuntimeTaskTest, BlockOnReturnsValue) {
  selio::runtime_context ctx;
  const auto value = selio::block_on(ctx, return_value_task());
  EXPECT_EQ(value, 42);
}

TEST(RuntimeTaskTest, SpawnIsTrackedByBlockOn) {
  selio::runtime_context ctx;
  std::atomic<int> counter{0};
  selio::block_on(ctx, spawn_children(counter));
  EXPECT_EQ(counter.load(std::memory_order_relaxed), 2);
}

TEST(RuntimeTaskTest, BlockOnRethrowsException) {
  selio::runtime_context ctx;
  EXPECT_THROW(selio::block_on(ctx, throwing_task()), std::runtime_error);
}

TEST(RuntimeTaskTest, AwaitedTaskInheritsCancelSlot) {
  selio::runtime_context ctx;
  EXPECT_TRUE(selio::block_on(ctx, child_shares_cancel()));
}

TEST(RuntimeTaskTest, CancelHandleBeforeStart) {
  auto t = return_value_task();
  auto handle = t.cancel_handle();
  EXPECT_TRUE(handle.valid());
  EXPECT_FALSE(handle.is_canceled());
  handle.cancel();
  EXPECT_TRUE(handle.is_canceled());
  EXPECT_FALSE(selio::CancelHandle{}.is_canceled());
}

TEST(RuntimeTaskTest, SpawnOutsideWorkerThrows) {
  EXPECT_THROW(selio::spawn(return_value_task()), std::runtime_error);
}

TEST(RuntimeTaskTest, StoppedContextRejectsWork) {
  selio::runtime_context ctx;
  ctx.stop();
  EXPECT_FALSE(ctx.running());
  EXPECT_THROW(ctx.spawn(return_value_task()), std::logic_error);
}

TEST(RuntimeTaskTest, ConfigBuilderAppliesValues) {
  auto cfg = selio::ConfigBuilder{}
                 .set_num_events(2048)
                 .set_num_workers(2)
                 .set_io_interval(5)
                 .set_global_queue_interval(7)
                 .set_max_selector_events(64)
                 .set_io_timeout(std::chrono::milliseconds{250})
                 .build();

  EXPECT_EQ(cfg._num_events, 2048u);
  EXPECT_EQ(cfg._num_workers, 2u);
  EXPECT_EQ(cfg._io_interval, 5u);
  EXPECT_EQ(cfg._global_queue_interval, 7u);
  EXPECT_EQ(cfg._max_selector_events, 64u);
  EXPECT_EQ(cfg._io_timeout, std::chrono::milliseconds{250});
}

TEST(RuntimeTaskTest, ConfigBuilderRejectsZeroWorkers) {
  EXPECT_THROW(selio::ConfigBuilder{}.set_num_workers(0).build(),
               std::invalid_argument);
}

TEST(RuntimeTaskTest, DefaultIoTimeoutIsTenSeconds) {
  selio::runtime::detail::Config cfg{};
  EXPECT_EQ(cfg._io_timeout, std::chrono::seconds{10});
}
