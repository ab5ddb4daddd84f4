#ifndef SELIO_DETAIL_NET_COMMON_BASE_STREAM_HPP
#define SELIO_DETAIL_NET_COMMON_BASE_STREAM_HPP

#include "selio/detail/io/co_io.hpp"
#include "selio/detail/net/common/addr_util.hpp"
#include "selio/detail/net/common/socket.hpp"
#include "selio/detail/net/common/stream_connect.hpp"
#include "selio/detail/net/common/stream_io.hpp"
#include <chrono>
#include <optional>
#include <sys/socket.h>

namespace selio::net::detail {

// 已连接的字节流，unix 和 tcp 共用
template <class Stream, class Addr>
class BaseStream : public ImplStreamRead<BaseStream<Stream, Addr>>,
                   public ImplStreamWrite<BaseStream<Stream, Addr>>,
                   public ImplLocalAddr<BaseStream<Stream, Addr>, Addr>,
                   public ImplPeerAddr<BaseStream<Stream, Addr>, Addr> {
  friend struct ImplStreamRead<BaseStream<Stream, Addr>>;
  friend struct ImplStreamWrite<BaseStream<Stream, Addr>>;

public:
  using Connect = BasicStreamConnect<Stream, Addr>;

protected:
  explicit BaseStream(io::detail::CoIo &&io) : _io{std::move(io)} {}

public:
  auto shutdown(ShutdownBehavior how) noexcept -> expected<void> {
    if (::shutdown(fd(), static_cast<int>(how)) != 0) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

  [[nodiscard]]
  auto fd() const noexcept {
    return _io.fd();
  }

  // 读写的挂起超时，默认没有
  void set_read_timeout(std::optional<std::chrono::milliseconds> timeout) {
    _read_timeout = timeout;
  }

  void set_write_timeout(std::optional<std::chrono::milliseconds> timeout) {
    _write_timeout = timeout;
  }

  [[nodiscard]]
  auto read_timeout() const noexcept
      -> std::optional<std::chrono::milliseconds> {
    return _read_timeout;
  }

  [[nodiscard]]
  auto write_timeout() const noexcept
      -> std::optional<std::chrono::milliseconds> {
    return _write_timeout;
  }

  [[nodiscard]]
  auto registration() const noexcept
      -> const std::shared_ptr<io::detail::IoData> & {
    return _io.registration();
  }

public:
  // create + is_connected + done
  static auto connect(Addr addr) -> task<expected<Stream>> {
    auto op = Connect::create(addr);
    if (!op) {
      co_return std::unexpected{op.error()};
    }
    if (auto ret = op.value().is_connected(); !ret) {
      co_return std::unexpected{ret.error()};
    }
    co_return co_await Connect::done(std::move(op.value()));
  }

private:
  auto co_io() noexcept -> io::detail::CoIo & { return _io; }

private:
  io::detail::CoIo _io;
  std::optional<std::chrono::milliseconds> _read_timeout{std::nullopt};
  std::optional<std::chrono::milliseconds> _write_timeout{std::nullopt};
};

} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_COMMON_BASE_STREAM_HPP
