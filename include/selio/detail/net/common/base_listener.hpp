#ifndef SELIO_DETAIL_NET_COMMON_BASE_LISTENER_HPP
#define SELIO_DETAIL_NET_COMMON_BASE_LISTENER_HPP

#include "selio/detail/common/error.hpp"
#include "selio/detail/coroutine/task.hpp"
#include "selio/detail/io/co_io.hpp"
#include "selio/detail/net/common/addr_util.hpp"
#include "selio/detail/net/common/socket.hpp"
#include "selio/detail/net/common/sockopt.hpp"
#include "selio/detail/runtime/core/poller.hpp"
#include "fastlog/fastlog.hpp"
#include <span>
#include <sys/socket.h>
#include <utility>

namespace selio::net::detail {

template <class Listener, class Stream, class Addr>
class BaseListener
    : public ImplLocalAddr<BaseListener<Listener, Stream, Addr>, Addr> {

protected:
  explicit BaseListener(io::detail::CoIo &&io) : _io{std::move(io)} {}

public:
  // 接受一个连接，新连接注册到同一个运行时的 selector 上
  auto accept() -> task<expected<std::pair<Stream, Addr>>> {
    sockaddr_storage storage{};
    socklen_t length{sizeof(storage)};
    auto ret = co_await _io.wait_io(
        [fd = fd(), &storage, &length] {
          length = sizeof(storage);
          return ::accept4(fd, reinterpret_cast<struct sockaddr *>(&storage),
                           &length, SOCK_NONBLOCK | SOCK_CLOEXEC);
        },
        std::nullopt);
    if (!ret) [[unlikely]] {
      co_return std::unexpected{ret.error()};
    }

    io::detail::FileDescriptor conn{static_cast<int>(ret.value())};
    auto io = _io.selector()->add_socket(conn.fd());
    if (!io) [[unlikely]] {
      co_return std::unexpected{io.error()};
    }
    co_return std::make_pair(
        Stream{io::detail::CoIo{std::move(conn), _io.selector(),
                                std::move(io.value())}},
        Addr{reinterpret_cast<const struct sockaddr *>(&storage), length});
  }

  [[nodiscard]]
  auto fd() const noexcept {
    return _io.fd();
  }

public:
  // 绑定并监听，必须在运行时的 worker 线程上调用
  [[nodiscard]]
  static auto bind(const Addr &addr) -> expected<Listener> {
    auto selector = io::detail::current_selector();
    if (selector == nullptr) [[unlikely]] {
      return std::unexpected{make_error(Error::NoRuntime)};
    }

    auto ret = Socket::create(addr.family(),
                              SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (!ret) [[unlikely]] {
      return std::unexpected{ret.error()};
    }
    auto &inner = ret.value();

    if (addr.family() != AF_UNIX) {
      int on{1};
      if (auto res = set_sock_opt(inner.fd(), SOL_SOCKET, SO_REUSEADDR, &on,
                                  sizeof(on));
          !res) [[unlikely]] {
        return std::unexpected{res.error()};
      }
    }
    if (auto res = inner.bind(addr); !res) [[unlikely]] {
      return std::unexpected{res.error()};
    }
    if (auto res = inner.listen(); !res) [[unlikely]] {
      return std::unexpected{res.error()};
    }

    auto io = selector->add_socket(inner.fd());
    if (!io) [[unlikely]] {
      return std::unexpected{io.error()};
    }
    return Listener{io::detail::CoIo{io::detail::FileDescriptor{std::move(inner)},
                                     selector, std::move(io.value())}};
  }

  // 依次尝试，返回第一个绑定成功的
  [[nodiscard]]
  static auto bind(std::span<const Addr> addresses) -> expected<Listener> {
    for (const auto &address : addresses) {
      if (auto ret = bind(address); ret) [[likely]] {
        return ret;
      } else {
        fastlog::console.error("Bind {} failed, error: {}", address.to_string(),
                               ret.error().message());
      }
    }
    return std::unexpected{make_error(Error::InvalidAddresses)};
  }

private:
  io::detail::CoIo _io;
};

} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_COMMON_BASE_LISTENER_HPP
