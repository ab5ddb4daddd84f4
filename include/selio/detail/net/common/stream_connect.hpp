#ifndef SELIO_DETAIL_NET_COMMON_STREAM_CONNECT_HPP
#define SELIO_DETAIL_NET_COMMON_STREAM_CONNECT_HPP

#include "selio/detail/common/concepts.hpp"
#include "selio/detail/common/error.hpp"
#include "selio/detail/coroutine/cancel.hpp"
#include "selio/detail/coroutine/task.hpp"
#include "selio/detail/coroutine/yield.hpp"
#include "selio/detail/io/co_io.hpp"
#include "selio/detail/io/selector/park.hpp"
#include "selio/detail/net/common/socket.hpp"
#include "selio/detail/runtime/core/poller.hpp"
#include "selio/detail/sync/delay_drop.hpp"
#include "fastlog/fastlog.hpp"
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <memory>
#include <utility>

namespace selio::net::detail {

enum class ConnectState {
  NotAttempted,
  InProgress,
  Connected,
};

// 非阻塞 connect
//
// 用法：create 创建并注册 socket，is_connected 同步尝试一次，
// 没有立即完成时 co_await done(std::move(op)) 等待连接完成。
// 内核异步地报告连接结果，done 的每一轮都重新调用一次 connect：
// 成功或 EISCONN 表示已经连上，EINPROGRESS / EALREADY 表示还在进行，
// 其它错误直接返回，不重试。
//
// Sock 是 socket 的提供者，默认是真实的系统调用，测试中可以替换成脚本化的实现。
template <class Stream, class Addr, class Sock = Socket>
  requires is_socket_address<Addr>
class BasicStreamConnect {
public:
  BasicStreamConnect(Sock &&socket, const Addr &addr,
                     io::detail::Selector *selector,
                     std::shared_ptr<io::detail::IoData> io)
      : _socket{std::move(socket)}, _addr{addr}, _selector{selector},
        _io{std::move(io)}, _timeout{selector->io_timeout()} {}

  // 没有被 done 消费：先等待令牌，再注销，最后由成员析构关闭 socket
  ~BasicStreamConnect() {
    _can_drop.reset();
    if (_io != nullptr) {
      io::detail::deregister(std::move(_io));
    }
  }

  BasicStreamConnect(BasicStreamConnect &&) noexcept = default;
  BasicStreamConnect &operator=(BasicStreamConnect &&) = delete;
  BasicStreamConnect(const BasicStreamConnect &) = delete;
  BasicStreamConnect &operator=(const BasicStreamConnect &) = delete;

public:
  // 创建 socket，注册之前必须先切换到非阻塞模式
  [[nodiscard]]
  static auto create(const Addr &addr) -> expected<BasicStreamConnect> {
    auto selector = io::detail::current_selector();
    if (selector == nullptr) [[unlikely]] {
      return std::unexpected{make_error(Error::NoRuntime)};
    }

    auto socket = Sock::create(addr.family(), SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (!socket) [[unlikely]] {
      return std::unexpected{socket.error()};
    }
    if (auto ret = socket.value().set_nonblocking(true); !ret) [[unlikely]] {
      return std::unexpected{ret.error()};
    }

    auto io = selector->add_socket(socket.value().fd());
    if (!io) [[unlikely]] {
      return std::unexpected{io.error()};
    }
    return BasicStreamConnect{std::move(socket.value()), addr, selector,
                              std::move(io.value())};
  }

  // 同步尝试一次 connect，返回是否已经连上
  [[nodiscard]]
  auto is_connected() -> expected<bool> {
    if (_state == ConnectState::Connected) {
      return true;
    }
    if (auto ret = _socket.connect(_addr); ret) {
      _state = ConnectState::Connected;
      return true;
    } else if (ret.error().value() == EINPROGRESS) {
      _state = ConnectState::InProgress;
      return false;
    } else {
      return std::unexpected{ret.error()};
    }
  }

  // 等待连接完成，成功时把 socket 和注册记录一起交给 Stream
  static auto done(BasicStreamConnect self) -> task<expected<Stream>> {
    if (self._state == ConnectState::Connected) {
      co_return self.into_stream();
    }

    auto cancel = co_await coroutine::detail::current_cancel();
    while (true) {
      // 超时或取消唤醒时带回的错误
      if (auto err = self._io->take_error(); err) {
        co_return std::unexpected{err.value()};
      }
      if (cancel->is_canceled()) {
        co_return std::unexpected{make_error(Error::Canceled)};
      }

      self._io->io_flag.store(false, std::memory_order::relaxed);

      if (auto ret = self._socket.connect(self._addr); ret) {
        break;
      } else if (auto code = ret.error().value(); code == EISCONN) {
        break;
      } else if (code != EINPROGRESS && code != EALREADY) {
        co_return std::unexpected{ret.error()};
      }

      // 清除标志之后到现在之间就绪事件已经到达，不挂起直接重试
      if (self._io->io_flag.exchange(false, std::memory_order::acq_rel)) {
        continue;
      }

      self._can_drop.reset();
      co_await coroutine::detail::yield_with(self);
    }

    self._state = ConnectState::Connected;
    fastlog::console.trace("fd {} connected to {}", self._socket.fd(),
                           self._addr.to_string());
    co_return self.into_stream();
  }

  void subscribe(std::coroutine_handle<> handle,
                 coroutine::detail::Cancel &cancel) {
    auto guard = _can_drop.delay_drop();
    // 恢复后的协程可能在 park 返回之前就通过 into_stream 交出 _io，
    // 参数在放入等待协程之前就已经复制好
    io::detail::park(*_selector, _io, handle, cancel, _timeout);
  }

public:
  [[nodiscard]]
  auto state() const noexcept -> ConnectState {
    return _state;
  }

  [[nodiscard]]
  auto registration() const noexcept
      -> const std::shared_ptr<io::detail::IoData> & {
    return _io;
  }

  [[nodiscard]]
  auto socket() noexcept -> Sock & {
    return _socket;
  }

  [[nodiscard]]
  auto addr() const noexcept -> const Addr & {
    return _addr;
  }

private:
  // 交出 socket 和注册记录，之后析构函数什么都不做
  auto into_stream() -> Stream {
    return Stream{io::detail::CoIo{
        io::detail::FileDescriptor{std::move(_socket)}, _selector,
        std::exchange(_io, nullptr)}};
  }

private:
  Sock _socket;
  Addr _addr;
  io::detail::Selector *_selector;
  std::shared_ptr<io::detail::IoData> _io;
  std::chrono::milliseconds _timeout;
  ConnectState _state{ConnectState::NotAttempted};
  sync::detail::DelayDrop _can_drop; // 必须最后声明，最先析构
};

} // namespace selio::net::detail

#endif // SELIO_DETAIL_NET_COMMON_STREAM_CONNECT_HPP
