#ifndef SELIO_DETAIL_NET_COMMON_SOCKET_HPP
#define SELIO_DETAIL_NET_COMMON_SOCKET_HPP

#include "selio/detail/common/concepts.hpp"
#include "selio/detail/common/error.hpp"
#include "selio/detail/io/fd.hpp"
#include <sys/socket.h>

namespace selio::net {

enum class ShutdownBehavior {
  Read = SHUT_RD,
  Write = SHUT_WR,
  ReadWrite = SHUT_RDWR,
};

} // namespace selio::net

namespace selio::net::detail {

// 同步的 socket 系统调用，非阻塞与否由调用者决定
class Socket : public io::detail::FileDescriptor {
public:
  explicit Socket(const int fd) : FileDescriptor{fd} {}

public:
  template <typename Addr>
    requires is_socket_address<Addr>
  [[nodiscard]]
  auto bind(const Addr &addr) -> expected<void> {
    if (::bind(_fd, addr.sockaddr(), addr.length()) != 0) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

  [[nodiscard]]
  auto listen(int maxn = SOMAXCONN) -> expected<void> {
    if (::listen(_fd, maxn) != 0) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

  // 发起一次连接，失败时携带原始 errno(包括 EINPROGRESS)
  template <typename Addr>
    requires is_socket_address<Addr>
  [[nodiscard]]
  auto connect(const Addr &addr) -> expected<void> {
    if (::connect(_fd, addr.sockaddr(), addr.length()) != 0) {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

  [[nodiscard]]
  auto shutdown(ShutdownBehavior how) noexcept -> expected<void> {
    if (::shutdown(_fd, static_cast<int>(how)) != 0) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

public:
  [[nodiscard]]
  static auto create(const int domain, const int type, const int protocol)
      -> expected<Socket> {
    auto fd = ::socket(domain, type, protocol);
    if (fd < 0) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return Socket{fd};
  }
};
} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_COMMON_SOCKET_HPP
