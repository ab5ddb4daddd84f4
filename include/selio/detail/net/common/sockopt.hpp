#ifndef SELIO_DETAIL_NET_COMMON_SOCKOPT_HPP
#define SELIO_DETAIL_NET_COMMON_SOCKOPT_HPP
#include "selio/detail/common/error.hpp"
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace selio::net::detail {
[[nodiscard]]
static inline auto set_sock_opt(int fd, int level, int optname,
                                const void *optval, socklen_t optlen) noexcept
    -> expected<void> {
  if (::setsockopt(fd, level, optname, optval, optlen) == -1) [[unlikely]] {
    return std::unexpected{make_error(errno)};
  }
  return {};
}

[[nodiscard]]
static inline auto get_sock_opt(int fd, int level, int optname, void *optval,
                                socklen_t optlen) noexcept -> expected<void> {
  if (::getsockopt(fd, level, optname, optval, &optlen) == -1) [[unlikely]] {
    return std::unexpected{make_error(errno)};
  }
  return {};
}

template <class T> struct ImplNodelay {
  [[nodiscard]]
  auto set_nodelay(bool on) noexcept -> expected<void> {
    int optval{on ? 1 : 0};
    return set_sock_opt(static_cast<T *>(this)->fd(), IPPROTO_TCP,
                        TCP_NODELAY, &optval, sizeof(optval));
  }

  [[nodiscard]]
  auto nodelay() const noexcept -> expected<bool> {
    int optval{0};
    if (auto ret = get_sock_opt(static_cast<const T *>(this)->fd(),
                                IPPROTO_TCP, TCP_NODELAY, &optval,
                                sizeof(optval));
        !ret) [[unlikely]] {
      return std::unexpected{ret.error()};
    }
    return optval != 0;
  }
};

} // namespace selio::net::detail

#endif // SELIO_DETAIL_NET_COMMON_SOCKOPT_HPP
