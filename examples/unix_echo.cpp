#include "selio/selio.hpp"
#include "fastlog/fastlog.hpp"

#include <format>
#include <string_view>
#include <unistd.h>

// ============================================================================
// 示例: unix 域 echo，服务端和客户端在同一个运行时里
// ============================================================================

auto echo(selio::net::UnixStream stream) -> selio::task<void> {
  char buf[1024];
  while (true) {
    auto n = co_await stream.read(buf);
    if (!n) {
      fastlog::console.error("  read failed: {}", n.error().message());
      co_return;
    }
    if (n.value() == 0) {
      break;
    }
    if (auto ret = co_await stream.write_all({buf, n.value()}); !ret) {
      fastlog::console.error("  write failed: {}", ret.error().message());
      co_return;
    }
  }
  fastlog::console.info("  stream closed");
}

auto server(selio::net::UnixListener &listener) -> selio::task<void> {
  auto has_stream = co_await listener.accept();
  if (!has_stream) {
    fastlog::console.error("  accept failed: {}", has_stream.error().message());
    co_return;
  }
  auto &[stream, peer_addr] = has_stream.value();
  fastlog::console.info("  accept a connection from {}", peer_addr);
  co_await echo(std::move(stream));
}

auto client(selio::net::UnixSocketAddr addr) -> selio::task<void> {
  auto stream = co_await selio::net::UnixStream::connect(addr);
  if (!stream) {
    fastlog::console.error("  connect {} failed: {}", addr,
                           stream.error().message());
    co_return;
  }

  for (std::string_view message : {"hello", "from", "selio"}) {
    if (auto ret = co_await stream->write_all(message); !ret) {
      fastlog::console.error("  write failed: {}", ret.error().message());
      co_return;
    }
    std::string reply(message.size(), '\0');
    if (auto ret = co_await stream->read_exact(reply); !ret) {
      fastlog::console.error("  read failed: {}", ret.error().message());
      co_return;
    }
    fastlog::console.info("  echo: {}", reply);
  }
  [[maybe_unused]] auto ret =
      stream->shutdown(selio::net::ShutdownBehavior::Write);
}

auto run() -> selio::task<void> {
  auto addr = selio::net::UnixSocketAddr::abstract(
      std::format("selio-echo-{}", ::getpid()));
  if (!addr) {
    fastlog::console.error("  invalid address");
    co_return;
  }
  auto listener = selio::net::UnixListener::bind(addr.value());
  if (!listener) {
    fastlog::console.error("  bind failed: {}", listener.error().message());
    co_return;
  }
  fastlog::console.info("  echo server listening on {}", addr.value());

  selio::spawn(server(listener.value()));
  co_await client(addr.value());
}

int main() {
  fastlog::set_consolelog_level(fastlog::LogLevel::Info);
  selio::runtime_context ctx{selio::ConfigBuilder{}.set_num_workers(2).build()};
  selio::block_on(ctx, run());
  return 0;
}
