#ifndef SELIO_TESTS_SCRIPTED_SOCKET_HPP
#define SELIO_TESTS_SCRIPTED_SOCKET_HPP

#include "selio/selio.hpp"

#include <cerrno>
#include <deque>
#include <fcntl.h>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <unistd.h>

namespace selio::tests {

// 脚本化的连接结果
// 每次 connect 按顺序取出一个结果：0 表示成功，其它是 errno。
// 脚本用完之后一直返回 EALREADY。
// on_connect 在 connect 内部、结果返回之前执行，用来制造交错。
struct ConnectScript {
  std::mutex mutex;
  std::deque<int> results;
  int calls{0};
  int read_fd{-1};  // 管道读端，由 ScriptedSocket 持有
  int write_fd{-1}; // 管道写端，写入一个字节即让注册的读端就绪
  std::function<void(int call)> on_connect;

  ConnectScript() = default;
  ConnectScript(std::initializer_list<int> init) : results{init} {}

  ~ConnectScript() {
    if (write_fd >= 0) {
      ::close(write_fd);
    }
  }

  // 先清空读端，保证边沿触发的 epoll 一定能看到一次新的就绪
  void make_ready() const {
    char buf[16];
    while (::read(read_fd, buf, sizeof(buf)) > 0) {
    }
    char byte{'x'};
    [[maybe_unused]] auto n = ::write(write_fd, &byte, 1);
  }

  auto call_count() -> int {
    std::lock_guard lock{mutex};
    return calls;
  }

  auto next() -> std::pair<int, int> {
    std::lock_guard lock{mutex};
    auto call = calls++;
    if (results.empty()) {
      return {call, EALREADY};
    }
    auto result = results.front();
    results.pop_front();
    return {call, result};
  }
};

inline ConnectScript *current_script{nullptr};

// 用管道读端代替真实 socket：注册到 selector 之后，
// 测试往写端写入之前它永远不会就绪
class ScriptedSocket : public net::detail::Socket {
public:
  explicit ScriptedSocket(int fd) : Socket{fd} {}

public:
  [[nodiscard]]
  static auto create(int, int, int) -> expected<ScriptedSocket> {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      return std::unexpected{make_error(errno)};
    }
    current_script->read_fd = fds[0];
    current_script->write_fd = fds[1];
    return ScriptedSocket{fds[0]};
  }

  template <typename Addr>
  [[nodiscard]]
  auto connect(const Addr &) -> expected<void> {
    auto [call, result] = current_script->next();
    if (current_script->on_connect) {
      current_script->on_connect(call);
    }
    if (result == 0) {
      return {};
    }
    return std::unexpected{make_error(result)};
  }
};

using ScriptedConnect =
    net::detail::BasicStreamConnect<net::UnixStream, net::UnixSocketAddr,
                                    ScriptedSocket>;

} // namespace selio::tests

#endif // SELIO_TESTS_SCRIPTED_SOCKET_HPP
