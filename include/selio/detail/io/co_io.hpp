#ifndef SELIO_DETAIL_IO_CO_IO_HPP
#define SELIO_DETAIL_IO_CO_IO_HPP

#include "selio/detail/common/error.hpp"
#include "selio/detail/coroutine/cancel.hpp"
#include "selio/detail/coroutine/task.hpp"
#include "selio/detail/coroutine/yield.hpp"
#include "selio/detail/io/fd.hpp"
#include "selio/detail/io/selector/park.hpp"
#include "selio/detail/runtime/core/poller.hpp"
#include "selio/detail/sync/delay_drop.hpp"
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <memory>
#include <optional>
#include <span>
#include <sys/socket.h>
#include <unistd.h>

namespace selio::io::detail {

// 已注册到 selector 的描述符
//
// 持有描述符和它的注册记录，读写都走同一套就绪协议：
// 先尝试系统调用，EAGAIN 时清除并复查就绪标志，确实没有就绪才挂起。
// 析构顺序：等待延迟析构令牌，注销注册记录，最后关闭描述符。
class CoIo {
public:
  CoIo(FileDescriptor fd, Selector *selector, std::shared_ptr<IoData> io)
      : _fd{std::move(fd)}, _selector{selector}, _io{std::move(io)} {}

  ~CoIo() {
    _can_drop.reset();
    if (_io != nullptr) {
      deregister(std::move(_io));
    }
  }

  CoIo(CoIo &&) noexcept = default;
  CoIo &operator=(CoIo &&) = delete;
  CoIo(const CoIo &) = delete;
  CoIo &operator=(const CoIo &) = delete;

public:
  [[nodiscard]]
  auto fd() const noexcept -> int {
    return _fd.fd();
  }

  [[nodiscard]]
  auto registration() const noexcept -> const std::shared_ptr<IoData> & {
    return _io;
  }

  [[nodiscard]]
  auto selector() const noexcept -> Selector * {
    return _selector;
  }

  auto read(std::span<char> buf,
            std::optional<std::chrono::milliseconds> timeout)
      -> task<expected<std::size_t>> {
    return wait_io(
        [fd = fd(), buf] { return ::read(fd, buf.data(), buf.size()); },
        timeout);
  }

  auto write(std::span<const char> buf,
             std::optional<std::chrono::milliseconds> timeout)
      -> task<expected<std::size_t>> {
    return wait_io(
        [fd = fd(), buf] {
          return ::send(fd, buf.data(), buf.size(), MSG_NOSIGNAL);
        },
        timeout);
  }

  // 在就绪协议上反复执行 op，直到它不再返回 EAGAIN
  // op 返回非负数表示完成，返回 -1 时错误码在 errno 中
  template <typename Op>
  auto wait_io(Op op, std::optional<std::chrono::milliseconds> timeout)
      -> task<expected<std::size_t>> {
    auto cancel = co_await coroutine::detail::current_cancel();
    while (true) {
      if (auto err = _io->take_error(); err) {
        co_return std::unexpected{err.value()};
      }
      if (cancel->is_canceled()) {
        co_return std::unexpected{make_error(Error::Canceled)};
      }

      _io->io_flag.store(false, std::memory_order::relaxed);
      auto ret = op();
      if (ret >= 0) {
        co_return static_cast<std::size_t>(ret);
      }
      auto err = errno;
      if (err == EINTR) {
        continue;
      }
      if (err != EAGAIN && err != EWOULDBLOCK) {
        co_return std::unexpected{make_error(err)};
      }

      // 清除和系统调用之间就绪事件已经到达，直接重试
      if (_io->io_flag.exchange(false, std::memory_order::acq_rel)) {
        continue;
      }

      _timeout = timeout;
      _can_drop.reset();
      co_await coroutine::detail::yield_with(*this);
    }
  }

  void subscribe(std::coroutine_handle<> handle,
                 coroutine::detail::Cancel &cancel) {
    auto guard = _can_drop.delay_drop();
    park(*_selector, _io, handle, cancel, _timeout);
  }

private:
  FileDescriptor _fd;
  Selector *_selector;
  std::shared_ptr<IoData> _io;
  std::optional<std::chrono::milliseconds> _timeout{std::nullopt};
  sync::detail::DelayDrop _can_drop; // 必须最后声明，最先析构
};

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_CO_IO_HPP
