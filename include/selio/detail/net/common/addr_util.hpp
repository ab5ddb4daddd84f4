#ifndef SELIO_DETAIL_NET_COMMON_ADDR_UTIL_HPP
#define SELIO_DETAIL_NET_COMMON_ADDR_UTIL_HPP

#include "selio/detail/common/error.hpp"
#include <sys/socket.h>

namespace selio::net::detail {

template <class T, class Addr> struct ImplPeerAddr {
  [[nodiscard]]
  auto peer_addr() const noexcept -> expected<Addr> {
    sockaddr_storage storage{};
    socklen_t len{sizeof(storage)};
    if (::getpeername(static_cast<const T *>(this)->fd(),
                      reinterpret_cast<struct sockaddr *>(&storage),
                      &len) == -1) {
      return std::unexpected{make_error(errno)};
    }
    return Addr{reinterpret_cast<const struct sockaddr *>(&storage), len};
  }
};

template <class T, class Addr> struct ImplLocalAddr {
  [[nodiscard]]
  auto local_addr() const noexcept -> expected<Addr> {
    sockaddr_storage storage{};
    socklen_t len{sizeof(storage)};
    if (::getsockname(static_cast<const T *>(this)->fd(),
                      reinterpret_cast<struct sockaddr *>(&storage),
                      &len) == -1) {
      return std::unexpected{make_error(errno)};
    }
    return Addr{reinterpret_cast<const struct sockaddr *>(&storage), len};
  }
};

} // namespace selio::net::detail

#endif // SELIO_DETAIL_NET_COMMON_ADDR_UTIL_HPP
