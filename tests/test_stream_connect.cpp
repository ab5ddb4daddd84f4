#include <gtest/gtest.h>

#include "scripted_socket.hpp"
#include "selio/selio.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <unistd.h>

using selio::tests::ConnectScript;
using selio::tests::ScriptedConnect;

namespace {

struct Outcome {
  int calls{0};
  int error{0}; // 0 表示连接成功
  std::uint64_t suspensions{0};
  int fd{-1};
  std::weak_ptr<selio::io::detail::IoData> registration;
};

auto test_config() -> selio::runtime::detail::Config {
  return selio::ConfigBuilder{}
      .set_num_workers(1)
      .set_io_timeout(std::chrono::milliseconds{100})
      .build();
}

auto dummy_addr() -> selio::net::UnixSocketAddr {
  return selio::net::UnixSocketAddr::parse("/selio/scripted").value();
}

// create + is_connected + done，把观察到的结果写进 Outcome
auto run_connect(ConnectScript &script, Outcome &out) -> selio::task<void> {
  auto op = ScriptedConnect::create(dummy_addr());
  if (!op) {
    out.error = op.error().value();
    co_return;
  }
  auto io = op.value().registration();
  out.registration = io;
  out.fd = io->fd;

  if (auto ret = op.value().is_connected(); !ret) {
    out.error = ret.error().value();
    out.calls = script.call_count();
    co_return;
  }

  auto stream = co_await ScriptedConnect::done(std::move(op.value()));
  out.calls = script.call_count();
  // 每一次挂起都会为本轮设置一个新的超时代数
  out.suspensions = io->timer_generation.load();
  if (!stream) {
    out.error = stream.error().value();
    co_return;
  }
  EXPECT_EQ(stream.value().registration(), io);
}

// 同 run_connect，完成后通过 promise 通知主线程
auto run_connect_and_signal(ConnectScript &script, Outcome &out,
                            std::promise<void> &done) -> selio::task<void> {
  co_await run_connect(script, out);
  done.set_value();
}

// 读一个字节，把读到的字节数或者错误码的相反数交给主线程
auto read_one(selio::net::UnixStream stream, std::promise<long> &result)
    -> selio::task<void> {
  char byte{};
  auto n = co_await stream.read(std::span<char>{&byte, 1});
  result.set_value(n ? static_cast<long>(n.value())
                     : -static_cast<long>(n.error().value()));
}

// 挂起一次之后连上，再把流交给另一个任务去读
auto connect_then_hand_off(ConnectScript &script, std::promise<long> &result)
    -> selio::task<void> {
  auto op = ScriptedConnect::create(dummy_addr());
  EXPECT_TRUE(op.has_value());
  if (!op) {
    co_return;
  }
  EXPECT_EQ(op.value().is_connected(), false);
  auto stream = co_await ScriptedConnect::done(std::move(op.value()));
  if (!stream) {
    result.set_value(-static_cast<long>(stream.error().value()));
    co_return;
  }
  // 清掉连接阶段用来制造就绪的字节
  char buf[16];
  while (::read(script.read_fd, buf, sizeof(buf)) > 0) {
  }
  selio::spawn(read_one(std::move(stream.value()), result));
}

// 等待条件成立，最多 2 秒
template <typename Pred> bool wait_until(Pred pred) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  return true;
}

} // namespace

TEST(StreamConnectTest, CreateOutsideRuntimeFails) {
  ConnectScript script{};
  selio::tests::current_script = &script;
  auto op = ScriptedConnect::create(dummy_addr());
  ASSERT_FALSE(op.has_value());
  EXPECT_EQ(op.error().value(), selio::Error::NoRuntime);
}

TEST(StreamConnectTest, ImmediateConnectDoesNotSuspend) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{0};
  selio::tests::current_script = &script;
  Outcome out;

  selio::block_on(ctx, run_connect(script, out));

  EXPECT_EQ(out.error, 0);
  EXPECT_EQ(out.calls, 1);
  EXPECT_EQ(out.suspensions, 0u);
}

TEST(StreamConnectTest, FatalErrorFromImmediateAttempt) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{ENOENT};
  selio::tests::current_script = &script;
  Outcome out;

  selio::block_on(ctx, run_connect(script, out));

  EXPECT_EQ(out.error, ENOENT);
  EXPECT_EQ(out.calls, 1);
}

TEST(StreamConnectTest, ReadinessThenIsConnectedAfterOneSuspension) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS, EINPROGRESS, EISCONN};
  selio::tests::current_script = &script;
  // 唯一的 worker 正在执行这个协程，事件要等协程挂起之后才会被取出
  script.on_connect = [&script](int call) {
    if (call == 1) {
      script.make_ready();
    }
  };
  Outcome out;

  selio::block_on(ctx, run_connect(script, out));

  EXPECT_EQ(out.error, 0);
  EXPECT_EQ(out.calls, 3);
  EXPECT_EQ(out.suspensions, 1u);
}

TEST(StreamConnectTest, AlreadyKeepsWaiting) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS, EALREADY, EALREADY, 0};
  selio::tests::current_script = &script;
  script.on_connect = [&script](int call) {
    if (call == 1 || call == 2) {
      script.make_ready();
    }
  };
  Outcome out;

  selio::block_on(ctx, run_connect(script, out));

  EXPECT_EQ(out.error, 0);
  EXPECT_EQ(out.calls, 4);
  EXPECT_EQ(out.suspensions, 2u);
}

TEST(StreamConnectTest, FatalErrorInLoopIsNotRetried) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS, ECONNREFUSED, EISCONN};
  selio::tests::current_script = &script;
  Outcome out;

  selio::block_on(ctx, run_connect(script, out));

  EXPECT_EQ(out.error, ECONNREFUSED);
  EXPECT_EQ(out.calls, 2);
  EXPECT_EQ(out.suspensions, 0u);
}

TEST(StreamConnectTest, ReadinessRaceRetriesWithoutSuspending) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS, EINPROGRESS, EISCONN};
  selio::tests::current_script = &script;
  Outcome out;
  // 在清除标志和复查之间置位
  script.on_connect = [&out](int call) {
    if (call == 1) {
      out.registration.lock()->io_flag.store(true);
    }
  };

  selio::block_on(ctx, run_connect(script, out));

  EXPECT_EQ(out.error, 0);
  EXPECT_EQ(out.calls, 3);
  EXPECT_EQ(out.suspensions, 0u);
}

TEST(StreamConnectTest, NoEventTimesOut) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS, EINPROGRESS};
  selio::tests::current_script = &script;
  Outcome out;

  auto start = std::chrono::steady_clock::now();
  selio::block_on(ctx, run_connect(script, out));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(out.error, ETIMEDOUT);
  EXPECT_EQ(out.calls, 2);
  EXPECT_GE(elapsed, std::chrono::milliseconds{90});
}

TEST(StreamConnectTest, CancelWhileParkedReleasesEverything) {
  auto config = selio::ConfigBuilder{}.set_num_workers(1).build();
  selio::runtime_context ctx{config};
  ConnectScript script{EINPROGRESS, EINPROGRESS};
  selio::tests::current_script = &script;
  Outcome out;
  std::promise<void> done;
  auto finished = done.get_future();

  auto cancel = ctx.spawn(run_connect_and_signal(script, out, done));

  // 等到协程挂在注册记录上
  std::weak_ptr<selio::io::detail::IoData> registration;
  ASSERT_TRUE(wait_until([&] {
    std::lock_guard lock{script.mutex};
    return script.calls == 2;
  }));
  ASSERT_TRUE(wait_until([&] {
    // 第二次 connect 返回之后协程很快就会挂起
    if (auto io = out.registration.lock(); io != nullptr) {
      registration = io;
      return io->has_waiter();
    }
    return false;
  }));

  cancel.cancel();
  ASSERT_EQ(finished.wait_for(std::chrono::seconds{2}),
            std::future_status::ready);

  EXPECT_TRUE(cancel.is_canceled());
  EXPECT_EQ(out.error, selio::Error::Canceled);
  EXPECT_EQ(out.calls, 2);
  // 注册记录在所属 worker 的下一轮 poll 中释放
  EXPECT_TRUE(wait_until([&] { return registration.expired(); }));
  errno = 0;
  EXPECT_EQ(::fcntl(out.fd, F_GETFD), -1);
  EXPECT_EQ(errno, EBADF);
}

TEST(StreamConnectTest, CancelBeforeStartIsObservedAtLoopTop) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS};
  selio::tests::current_script = &script;
  Outcome out;
  std::promise<void> done;
  auto finished = done.get_future();

  auto task = run_connect_and_signal(script, out, done);
  auto cancel = task.cancel_handle();
  cancel.cancel();
  ctx.spawn(std::move(task));

  ASSERT_EQ(finished.wait_for(std::chrono::seconds{2}),
            std::future_status::ready);
  EXPECT_EQ(out.error, selio::Error::Canceled);
  EXPECT_EQ(out.calls, 1);
  EXPECT_EQ(out.suspensions, 0u);
}

TEST(StreamConnectTest, CancelBeforeSubscribeCompletesIsObserved) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS, EINPROGRESS};
  selio::tests::current_script = &script;
  Outcome out;
  std::promise<void> done;
  auto finished = done.get_future();

  auto task = run_connect_and_signal(script, out, done);
  auto cancel = task.cancel_handle();
  // 循环开头的检查已经过去，协程还没有登记到注册记录上
  script.on_connect = [cancel](int call) {
    if (call == 1) {
      cancel.cancel();
    }
  };
  ctx.spawn(std::move(task));

  ASSERT_EQ(finished.wait_for(std::chrono::seconds{2}),
            std::future_status::ready);
  EXPECT_EQ(out.error, selio::Error::Canceled);
  EXPECT_EQ(out.calls, 2);
  EXPECT_EQ(out.suspensions, 1u);
}

TEST(StreamConnectTest, DroppedBeforeDoneDeregisters) {
  selio::runtime_context ctx{test_config()};
  ConnectScript script{EINPROGRESS};
  selio::tests::current_script = &script;
  std::weak_ptr<selio::io::detail::IoData> registration;
  int fd{-1};

  selio::block_on(ctx, [&]() -> selio::task<void> {
    auto op = ScriptedConnect::create(dummy_addr());
    EXPECT_TRUE(op.has_value());
    registration = op.value().registration();
    fd = op.value().registration()->fd;
    EXPECT_EQ(op.value().is_connected(), false);
    EXPECT_EQ(op.value().state(), selio::net::detail::ConnectState::InProgress);
    co_return;
  }());

  EXPECT_TRUE(wait_until([&] { return registration.expired(); }));
  errno = 0;
  EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
  EXPECT_EQ(errno, EBADF);
}

TEST(StreamConnectTest, ReadinessFromOtherWorkerWhileParking) {
  auto config = selio::ConfigBuilder{}.set_num_workers(2).build();
  selio::runtime_context ctx{config};
  // 读端按 fd % 2 分到两个 worker 的 selector 上，
  // 就绪事件可能由另一个 worker 在协程挂起的同时投递，
  // 协程随后在另一个线程上连上并交出注册记录
  for (int i = 0; i < 200; ++i) {
    ConnectScript script{EINPROGRESS, EINPROGRESS, EISCONN};
    selio::tests::current_script = &script;
    script.on_connect = [&script](int call) {
      if (call == 1) {
        script.make_ready();
      }
    };
    Outcome out;

    selio::block_on(ctx, run_connect(script, out));

    ASSERT_EQ(out.error, 0) << "iteration " << i;
    ASSERT_EQ(out.calls, 3) << "iteration " << i;
    ASSERT_LE(out.suspensions, 1u) << "iteration " << i;
  }
}

TEST(StreamConnectTest, CancelOfConnectingTaskDoesNotReachHandedOffStream) {
  auto config = selio::ConfigBuilder{}.set_num_workers(2).build();
  selio::runtime_context ctx{config};
  ConnectScript script{EINPROGRESS, EINPROGRESS, EISCONN};
  selio::tests::current_script = &script;
  script.on_connect = [&script](int call) {
    if (call == 1) {
      script.make_ready();
    }
  };
  std::promise<long> read_promise;
  auto read_future = read_promise.get_future();

  auto connecting =
      ctx.spawn(connect_then_hand_off(script, read_promise));
  ASSERT_TRUE(wait_until([&] { return script.call_count() == 3; }));

  // 读任务挂在交接过来的注册记录上之后再取消发起连接的任务
  std::this_thread::sleep_for(std::chrono::milliseconds{50});
  connecting.cancel();
  EXPECT_EQ(read_future.wait_for(std::chrono::milliseconds{50}),
            std::future_status::timeout);

  script.make_ready();
  ASSERT_EQ(read_future.wait_for(std::chrono::seconds{2}),
            std::future_status::ready);
  EXPECT_EQ(read_future.get(), 1);
}
