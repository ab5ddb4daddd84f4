#ifndef SELIO_DETAIL_NET_COMMON_ADDRESS_HPP
#define SELIO_DETAIL_NET_COMMON_ADDRESS_HPP

#include "selio/detail/common/error.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <netinet/in.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/un.h>

namespace selio::net::detail {

// IPv4 / IPv6 地址加端口
class SocketAddr {
public:
  SocketAddr() noexcept { std::memset(&_addr, 0, sizeof(_addr)); }

  SocketAddr(const struct sockaddr *addr, socklen_t len) noexcept
      : SocketAddr{} {
    std::memcpy(&_addr, addr, std::min<std::size_t>(len, sizeof(_addr)));
  }

public:
  [[nodiscard]]
  auto is_ipv4() const noexcept -> bool {
    return _addr.in4.sin_family == AF_INET;
  }

  [[nodiscard]]
  auto is_ipv6() const noexcept -> bool {
    return _addr.in6.sin6_family == AF_INET6;
  }

  // in4 和 in6 的端口字段位置相同
  [[nodiscard]]
  auto port() const noexcept -> std::uint16_t {
    return ::ntohs(_addr.in4.sin_port);
  }

  void set_port(std::uint16_t port) noexcept {
    _addr.in4.sin_port = ::htons(port);
  }

  [[nodiscard]]
  auto ip() const -> std::string {
    char buf[INET6_ADDRSTRLEN]{};
    if (is_ipv4()) {
      ::inet_ntop(AF_INET, &_addr.in4.sin_addr, buf, sizeof(buf));
    } else {
      ::inet_ntop(AF_INET6, &_addr.in6.sin6_addr, buf, sizeof(buf));
    }
    return buf;
  }

  [[nodiscard]]
  auto to_string() const -> std::string {
    if (is_ipv4()) {
      return std::format("{}:{}", ip(), port());
    }
    return std::format("[{}]:{}", ip(), port());
  }

  [[nodiscard]]
  auto family() const noexcept -> sa_family_t {
    return _addr.in4.sin_family;
  }

  [[nodiscard]]
  auto sockaddr() const noexcept -> const struct sockaddr * {
    return reinterpret_cast<const struct sockaddr *>(&_addr);
  }

  [[nodiscard]]
  auto sockaddr() noexcept -> struct sockaddr * {
    return reinterpret_cast<struct sockaddr *>(&_addr);
  }

  [[nodiscard]]
  auto length() const noexcept -> socklen_t {
    return is_ipv4() ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
  }

  friend auto operator==(const SocketAddr &lhs, const SocketAddr &rhs) noexcept
      -> bool {
    return lhs.length() == rhs.length() &&
           std::memcmp(&lhs._addr, &rhs._addr, lhs.length()) == 0;
  }

public:
  // 只接受数字形式的地址，不做域名解析
  [[nodiscard]]
  static auto parse(std::string_view ip, std::uint16_t port)
      -> expected<SocketAddr> {
    std::string host{ip};
    SocketAddr addr;
    if (::inet_pton(AF_INET, host.c_str(), &addr._addr.in4.sin_addr) == 1) {
      addr._addr.in4.sin_family = AF_INET;
      addr.set_port(port);
      return addr;
    }
    if (::inet_pton(AF_INET6, host.c_str(), &addr._addr.in6.sin6_addr) == 1) {
      addr._addr.in6.sin6_family = AF_INET6;
      addr.set_port(port);
      return addr;
    }
    return std::unexpected{make_error(Error::InvalidAddresses)};
  }

private:
  union {
    sockaddr_in in4;
    sockaddr_in6 in6;
  } _addr;
};

// unix 域地址
// 普通路径、以 '\0' 开头的抽象地址，或者未命名(未绑定的一端)
class UnixSocketAddr {
public:
  UnixSocketAddr() noexcept {
    std::memset(&_addr, 0, sizeof(_addr));
    _addr.sun_family = AF_UNIX;
  }

  UnixSocketAddr(const struct sockaddr *addr, socklen_t len) noexcept
      : UnixSocketAddr{} {
    auto n = std::min<std::size_t>(len, sizeof(_addr));
    std::memcpy(&_addr, addr, n);
    _len = static_cast<socklen_t>(n);
  }

public:
  [[nodiscard]]
  auto is_unnamed() const noexcept -> bool {
    return _len <= path_offset();
  }

  [[nodiscard]]
  auto is_abstract() const noexcept -> bool {
    return !is_unnamed() && _addr.sun_path[0] == '\0';
  }

  // 抽象地址不包含开头的 '\0'
  [[nodiscard]]
  auto path() const noexcept -> std::string_view {
    if (is_unnamed()) {
      return {};
    }
    auto n = static_cast<std::size_t>(_len - path_offset());
    if (is_abstract()) {
      return {_addr.sun_path + 1, n - 1};
    }
    // 内核返回的长度可能包含结尾的 '\0'
    return {_addr.sun_path, ::strnlen(_addr.sun_path, n)};
  }

  [[nodiscard]]
  auto to_string() const -> std::string {
    if (is_unnamed()) {
      return "(unnamed)";
    }
    if (is_abstract()) {
      return std::format("@{}", path());
    }
    return std::string{path()};
  }

  [[nodiscard]]
  auto family() const noexcept -> sa_family_t {
    return _addr.sun_family;
  }

  [[nodiscard]]
  auto sockaddr() const noexcept -> const struct sockaddr * {
    return reinterpret_cast<const struct sockaddr *>(&_addr);
  }

  [[nodiscard]]
  auto sockaddr() noexcept -> struct sockaddr * {
    return reinterpret_cast<struct sockaddr *>(&_addr);
  }

  [[nodiscard]]
  auto length() const noexcept -> socklen_t {
    return _len;
  }

  friend auto operator==(const UnixSocketAddr &lhs,
                         const UnixSocketAddr &rhs) noexcept -> bool {
    return lhs.is_abstract() == rhs.is_abstract() && lhs.path() == rhs.path();
  }

public:
  // 文件系统路径，长度必须小于 sun_path
  [[nodiscard]]
  static auto parse(std::string_view path) -> expected<UnixSocketAddr> {
    if (path.empty() || path.size() >= sizeof(sockaddr_un::sun_path) ||
        path.find('\0') != std::string_view::npos) {
      return std::unexpected{make_error(Error::InvalidAddresses)};
    }
    UnixSocketAddr addr;
    std::memcpy(addr._addr.sun_path, path.data(), path.size());
    addr._len = static_cast<socklen_t>(path_offset() + path.size() + 1);
    return addr;
  }

  // linux 抽象命名空间地址，不在文件系统中留下文件
  [[nodiscard]]
  static auto abstract(std::string_view name) -> expected<UnixSocketAddr> {
    if (name.size() + 1 > sizeof(sockaddr_un::sun_path)) {
      return std::unexpected{make_error(Error::InvalidAddresses)};
    }
    UnixSocketAddr addr;
    std::memcpy(addr._addr.sun_path + 1, name.data(), name.size());
    addr._len = static_cast<socklen_t>(path_offset() + name.size() + 1);
    return addr;
  }

private:
  static constexpr auto path_offset() noexcept -> socklen_t {
    return static_cast<socklen_t>(offsetof(sockaddr_un, sun_path));
  }

private:
  sockaddr_un _addr;
  socklen_t _len{path_offset()};
};

} // namespace selio::net::detail

namespace std {

template <> class formatter<selio::net::detail::SocketAddr> {
public:
  constexpr auto parse(format_parse_context &context) {
    auto it{context.begin()};
    auto end{context.end()};
    if (it == end || *it == '}') {
      return it;
    }
    ++it;
    if (it != end && *it != '}') {
      throw format_error("Invalid format specifier for SocketAddr");
    }
    return it;
  }

  auto format(const selio::net::detail::SocketAddr &addr,
              auto &context) const {
    return format_to(context.out(), "{}", addr.to_string());
  }
};

template <> class formatter<selio::net::detail::UnixSocketAddr> {
public:
  constexpr auto parse(format_parse_context &context) {
    auto it{context.begin()};
    auto end{context.end()};
    if (it == end || *it == '}') {
      return it;
    }
    ++it;
    if (it != end && *it != '}') {
      throw format_error("Invalid format specifier for UnixSocketAddr");
    }
    return it;
  }

  auto format(const selio::net::detail::UnixSocketAddr &addr,
              auto &context) const {
    return format_to(context.out(), "{}", addr.to_string());
  }
};

} // namespace std
#endif // SELIO_DETAIL_NET_COMMON_ADDRESS_HPP
