#include <gtest/gtest.h>

#include "selio/selio.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

using selio::net::UnixListener;
using selio::net::UnixSocketAddr;
using selio::net::UnixStream;

namespace {

auto unique_name(std::string_view tag) -> std::string {
  return std::format("selio-test-{}-{}", tag, ::getpid());
}

auto echo_once(UnixListener &listener) -> selio::task<void> {
  auto conn = co_await listener.accept();
  EXPECT_TRUE(conn.has_value());
  if (!conn) {
    co_return;
  }
  auto &stream = conn.value().first;
  std::array<char, 64> buf{};
  while (true) {
    auto n = co_await stream.read(buf);
    if (!n || n.value() == 0) {
      break;
    }
    auto ret = co_await stream.write_all(std::span<const char>{buf.data(), n.value()});
    EXPECT_TRUE(ret.has_value());
  }
}

auto echo_roundtrip(std::string name) -> selio::task<std::string> {
  auto addr = UnixSocketAddr::abstract(name).value();
  auto listener = UnixListener::bind(addr);
  EXPECT_TRUE(listener.has_value());
  if (!listener) {
    co_return std::string{};
  }
  selio::spawn(echo_once(listener.value()));

  auto stream = co_await UnixStream::connect(addr);
  EXPECT_TRUE(stream.has_value());
  if (!stream) {
    co_return std::string{};
  }
  EXPECT_EQ(stream->peer_addr().value().to_string(), "@" + name);

  std::string_view message{"hello selio"};
  auto sent = co_await stream->write_all(message);
  EXPECT_TRUE(sent.has_value());

  std::string reply(message.size(), '\0');
  auto got = co_await stream->read_exact(reply);
  EXPECT_TRUE(got.has_value());

  // 关闭写端，服务端读到 EOF 后退出
  EXPECT_TRUE(stream->shutdown(selio::net::ShutdownBehavior::Write).has_value());
  std::array<char, 8> tail{};
  auto eof = co_await stream->read(tail);
  EXPECT_TRUE(eof.has_value());
  EXPECT_EQ(eof.value_or(1), 0u);
  co_return reply;
}

auto connect_error(UnixSocketAddr addr) -> selio::task<int> {
  auto stream = co_await UnixStream::connect(addr);
  if (stream) {
    co_return 0;
  }
  co_return stream.error().value();
}

auto refused_after_listener_closed(std::string name) -> selio::task<int> {
  auto addr = UnixSocketAddr::abstract(name).value();
  {
    auto listener = UnixListener::bind(addr);
    EXPECT_TRUE(listener.has_value());
  }
  co_return co_await connect_error(addr);
}

auto connected_pair(std::string name)
    -> selio::task<std::pair<UnixStream, UnixStream>> {
  auto addr = UnixSocketAddr::abstract(name).value();
  auto listener = UnixListener::bind(addr).value();
  auto client = co_await UnixStream::connect(addr);
  auto accepted = co_await listener.accept();
  co_return std::make_pair(std::move(client.value()),
                           std::move(accepted.value().first));
}

}  // namespace

TEST(UnixStreamTest, EchoOverAbstractAddress) {
  selio::runtime_context ctx;
  auto reply = selio::block_on(ctx, echo_roundtrip(unique_name("echo")));
  EXPECT_EQ(reply, "hello selio");
}

TEST(UnixStreamTest, MissingPathReportsNotFound) {
  selio::runtime_context ctx;
  auto addr = UnixSocketAddr::parse(
                  std::format("/tmp/{}-missing.sock", unique_name("nf")))
                  .value();
  EXPECT_EQ(selio::block_on(ctx, connect_error(addr)), ENOENT);
}

TEST(UnixStreamTest, ClosedListenerReportsRefused) {
  selio::runtime_context ctx;
  auto err = selio::block_on(ctx, refused_after_listener_closed(unique_name("refused")));
  EXPECT_EQ(err, ECONNREFUSED);
}

TEST(UnixStreamTest, ConnectOutsideRuntimeFails) {
  auto addr = UnixSocketAddr::abstract(unique_name("none")).value();
  auto op = selio::net::UnixStreamConnect::create(addr);
  ASSERT_FALSE(op.has_value());
  EXPECT_EQ(op.error().value(), selio::Error::NoRuntime);
}

TEST(UnixStreamTest, StreamsMayOutliveRuntime) {
  std::optional<std::pair<UnixStream, UnixStream>> streams;
  int client_fd{-1};
  {
    auto ctx = std::make_unique<selio::runtime_context>();
    streams.emplace(selio::block_on(*ctx, connected_pair(unique_name("outlive"))));
    client_fd = streams->first.fd();
    ctx->stop();
  }
  // 运行时已经销毁，注销直接跳过，描述符照常关闭
  EXPECT_TRUE(streams->first.registration() != nullptr);
  streams.reset();
  errno = 0;
  EXPECT_EQ(::fcntl(client_fd, F_GETFD), -1);
  EXPECT_EQ(errno, EBADF);
}
