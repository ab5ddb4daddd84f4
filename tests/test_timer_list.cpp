#include <gtest/gtest.h>

#include "selio/selio.hpp"

#include <chrono>
#include <memory>
#include <vector>

using selio::io::detail::IoData;
using selio::io::detail::TimerEntry;
using selio::io::detail::TimerList;

namespace {
using namespace std::chrono_literals;

auto make_registration() -> std::shared_ptr<IoData> {
  return std::make_shared<IoData>(-1, 0,
                                  std::weak_ptr<selio::io::detail::Selector>{});
}
}  // namespace

TEST(TimerListTest, EmptyHasNoDeadline) {
  TimerList timers;
  EXPECT_FALSE(timers.next_deadline_ms().has_value());
  EXPECT_TRUE(timers.take_expired(std::chrono::steady_clock::now()).empty());
}

TEST(TimerListTest, ReportsEarliestAndExpiresInOrder) {
  TimerList timers;
  auto io = make_registration();
  auto now = std::chrono::steady_clock::now();

  EXPECT_TRUE(timers.add(TimerEntry{now + 300ms, io, 1}));
  EXPECT_FALSE(timers.add(TimerEntry{now + 500ms, io, 2}));
  EXPECT_TRUE(timers.add(TimerEntry{now + 100ms, io, 3}));
  EXPECT_EQ(timers.size(), 3u);

  auto ms = timers.next_deadline_ms();
  ASSERT_TRUE(ms.has_value());
  EXPECT_LE(ms.value(), 100);
  EXPECT_GT(ms.value(), 0);

  auto expired = timers.take_expired(now + 350ms);
  ASSERT_EQ(expired.size(), 2u);
  EXPECT_EQ(expired[0].generation, 3u);
  EXPECT_EQ(expired[1].generation, 1u);
  EXPECT_EQ(timers.size(), 1u);
}

TEST(TimerListTest, PastDeadlineIsZero) {
  TimerList timers;
  auto io = make_registration();
  timers.add(TimerEntry{std::chrono::steady_clock::now() - 1ms, io, 1});
  EXPECT_EQ(timers.next_deadline_ms(), 0);
}

TEST(TimerListTest, GenerationMarksStaleTimers) {
  auto io = make_registration();
  auto first = io->next_timer_generation();
  EXPECT_TRUE(io->is_current_timer(first));
  io->invalidate_timers();
  EXPECT_FALSE(io->is_current_timer(first));
  auto second = io->next_timer_generation();
  EXPECT_TRUE(io->is_current_timer(second));
}

TEST(TimerListTest, EntryDoesNotKeepRegistrationAlive) {
  TimerList timers;
  auto io = make_registration();
  timers.add(TimerEntry{std::chrono::steady_clock::now(), io, 1});
  io.reset();
  auto expired = timers.take_expired(std::chrono::steady_clock::now());
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_TRUE(expired[0].io.expired());
}

TEST(TimerListTest, SupersededTimersArePrunedOnAdd) {
  TimerList timers;
  auto io = make_registration();
  auto deadline = std::chrono::steady_clock::now() + 1h;
  // 每一轮挂起都换一个新代数，之前的定时器全部失效
  for (int i = 0; i < 1000; ++i) {
    timers.add(TimerEntry{deadline, io, io->next_timer_generation()});
    EXPECT_LE(timers.size(), 64u);
  }
  EXPECT_GE(timers.size(), 1u);
}

TEST(TimerListTest, LiveTimersSurvivePruning) {
  TimerList timers;
  std::vector<std::shared_ptr<IoData>> ios;
  auto deadline = std::chrono::steady_clock::now() + 1h;
  for (int i = 0; i < 200; ++i) {
    auto io = make_registration();
    timers.add(TimerEntry{deadline, io, io->next_timer_generation()});
    ios.push_back(std::move(io));
  }
  EXPECT_EQ(timers.size(), 200u);

  // 释放一半注册记录，下一次清理时它们的定时器被去掉
  ios.resize(100);
  for (int i = 0; i < 200; ++i) {
    auto io = make_registration();
    timers.add(TimerEntry{deadline, io, io->next_timer_generation()});
    ios.push_back(std::move(io));
  }
  EXPECT_GE(timers.size(), 300u);
  EXPECT_LT(timers.size(), 400u);

  auto expired = timers.take_expired(deadline);
  for (const auto &entry : expired) {
    auto io = entry.io.lock();
    ASSERT_NE(io, nullptr);
  }
}
