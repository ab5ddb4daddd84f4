#ifndef SELIO_DETAIL_IO_URING_WAKER_HPP
#define SELIO_DETAIL_IO_URING_WAKER_HPP
#include "selio/detail/io/uring/io_uring.hpp"
#include "fastlog/fastlog.hpp"
#include <cstdint>
#include <cstring>
#include <liburing.h>
#include <poll.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>

namespace selio::io::detail {

/// 唤醒器，其它线程通过 eventfd 打断 worker 的休眠
class Waker {
public:
  Waker() : _fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (_fd < 0) {
      throw std::runtime_error(
          std::format("eventfd failed, {}", strerror(errno)));
    }
  }

  ~Waker() { ::close(_fd); }

  Waker(const Waker &) = delete;
  Waker &operator=(const Waker &) = delete;

public:
  void wake_up() {
    static constexpr std::uint64_t buf{1};
    if (auto res = ::write(this->_fd, &buf, sizeof(buf)); res < 0) {
      // EAGAIN 是正常的：计数器溢出，说明已经有未消费的唤醒
      if (errno != EAGAIN) {
        fastlog::console.error("wake_up failed: {}", strerror(errno));
      }
    }
  }

  // 上一次读取已经完成(_flag 被写入)时重新挂上读请求
  void start_watch(IOuring &uring) {
    if (_flag != 0) {
      _flag = 0;
      auto sqe = uring.get_sqe();
      if (sqe == nullptr) {
        fastlog::console.error("get sqe failed");
        return;
      }
      io_uring_prep_read(sqe, _fd, &_flag, sizeof(_flag), 0);
      io_uring_sqe_set_data64(sqe, static_cast<__u64>(WatchTag::Waker));
    }
  }

private:
  std::uint64_t _flag{1};
  int _fd;
};

/// 监视 selector 的 epoll fd，有就绪事件时唤醒休眠在 io_uring 上的 worker
class SelectorWatch {
public:
  explicit SelectorWatch(int epoll_fd) : _epoll_fd{epoll_fd} {}

public:
  // 对应的完成事件已经到达
  void on_complete() noexcept { _armed = false; }

  // 一次性 poll 请求，完成后需要重新挂上。
  // 挂上时 epoll fd 已经可读会立即完成，所以不会丢失唤醒
  void start_watch(IOuring &uring) {
    if (_armed) {
      return;
    }
    auto sqe = uring.get_sqe();
    if (sqe == nullptr) {
      fastlog::console.error("get sqe failed");
      return;
    }
    io_uring_prep_poll_add(sqe, _epoll_fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<__u64>(WatchTag::Selector));
    _armed = true;
  }

private:
  int _epoll_fd;
  bool _armed{false};
};

} // namespace selio::io::detail
#endif // SELIO_DETAIL_IO_URING_WAKER_HPP
