#include "selio/selio.hpp"
#include "fastlog/fastlog.hpp"

#include <charconv>
#include <chrono>
#include <string>
#include <string_view>

// ============================================================================
// 示例: TCP 客户端，连接 ip:port，发送一行并打印回复
// 用法: tcp_connect [ip] [port] [timeout_ms]
// ============================================================================

auto client(selio::net::SocketAddr addr) -> selio::task<void> {
  fastlog::console.info("  connecting to {}", addr);
  auto start = std::chrono::steady_clock::now();
  auto stream = co_await selio::net::TcpStream::connect(addr);
  auto cost = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (!stream) {
    fastlog::console.error("  connect failed after {}ms: {}", cost.count(),
                           stream.error().message());
    co_return;
  }
  fastlog::console.info("  connected in {}ms, local {}", cost.count(),
                        stream->local_addr().value());

  if (auto ret = stream->set_nodelay(true); !ret) {
    fastlog::console.warn("  set nodelay failed: {}", ret.error().message());
  }
  stream->set_read_timeout(std::chrono::seconds{3});

  std::string_view line{"hello from selio\n"};
  if (auto ret = co_await stream->write_all(line); !ret) {
    fastlog::console.error("  write failed: {}", ret.error().message());
    co_return;
  }

  char buf[1024];
  auto n = co_await stream->read(buf);
  if (!n) {
    fastlog::console.error("  read failed: {}", n.error().message());
    co_return;
  }
  fastlog::console.info("  reply: {}", std::string_view{buf, n.value()});
}

int main(int argc, char **argv) {
  fastlog::set_consolelog_level(fastlog::LogLevel::Info);

  std::string_view ip{argc > 1 ? argv[1] : "127.0.0.1"};
  std::uint16_t port{8080};
  std::uint32_t timeout_ms{10000};
  if (argc > 2) {
    std::string_view arg{argv[2]};
    std::from_chars(arg.data(), arg.data() + arg.size(), port);
  }
  if (argc > 3) {
    std::string_view arg{argv[3]};
    std::from_chars(arg.data(), arg.data() + arg.size(), timeout_ms);
  }

  auto addr = selio::net::SocketAddr::parse(ip, port);
  if (!addr) {
    fastlog::console.error("  invalid address {}: {}", ip,
                           addr.error().message());
    return 1;
  }

  auto config = selio::ConfigBuilder{}
                    .set_num_workers(1)
                    .set_io_timeout(std::chrono::milliseconds{timeout_ms})
                    .build();
  selio::runtime_context ctx{config};
  selio::block_on(ctx, client(addr.value()));
  return 0;
}
