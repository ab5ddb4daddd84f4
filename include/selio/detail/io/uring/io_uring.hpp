#ifndef SELIO_DETAIL_IO_URING_IO_URING_HPP
#define SELIO_DETAIL_IO_URING_IO_URING_HPP

#include "selio/detail/runtime/core/config.hpp"
#include "fastlog/fastlog.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <format>
#include <ctime>
#include <liburing.h>
#include <optional>
#include <span>
#include <stdexcept>

namespace selio::io::detail {

// 完成事件的 user_data 标签
enum class WatchTag : std::uint64_t {
  Waker = 0,    // eventfd 唤醒
  Selector = 1, // selector 的 epoll fd 可读
};

// 封装uring实例
// 每个 worker 一个，只用来监视唤醒和 selector，并在休眠时带超时地等待
class IOuring {
public:
  explicit IOuring(const runtime::detail::Config &config) {
    if (auto res = io_uring_queue_init(static_cast<unsigned>(config._num_events),
                                       &_uring, 0);
        res < 0) {
      throw std::runtime_error(
          std::format("io_uring_queue_init failed, {}", strerror(-res)));
    }
  }

  ~IOuring() { io_uring_queue_exit(&_uring); }

  IOuring(const IOuring &) = delete;
  IOuring &operator=(const IOuring &) = delete;

public:
  [[nodiscard]] struct io_uring *uring() noexcept { return &_uring; }

  [[nodiscard]] io_uring_sqe *get_sqe() noexcept {
    return io_uring_get_sqe(uring());
  }

  /// 预读完成队列
  [[nodiscard]] std::size_t peek_batch(std::span<io_uring_cqe *> cqes) {
    return io_uring_peek_batch_cqe(&_uring, cqes.data(),
                                   static_cast<unsigned>(cqes.size()));
  }

  // 消费完成队列
  void consume(std::size_t count) {
    io_uring_cq_advance(&_uring, static_cast<unsigned>(count));
  }

  /// 等待完成队列,可指定超时时间(毫秒)
  void wait(std::optional<time_t> timeout) {
    io_uring_cqe *cqe{nullptr};

    if (timeout) {
      struct __kernel_timespec ts{
          .tv_sec = timeout.value() / 1000,
          .tv_nsec = (timeout.value() % 1000) * 1000000,
      };
      if (auto res = io_uring_wait_cqe_timeout(&_uring, &cqe, &ts); res < 0) {
        // -ETIME 是正常超时，-EINTR 被信号打断，都不是错误
        if (res != -ETIME && res != -EINTR) {
          fastlog::console.error("wait cqe failed, {}", strerror(-res));
        }
      }
    } else {
      if (auto res = io_uring_wait_cqe(&_uring, &cqe);
          res < 0 && res != -EINTR) {
        fastlog::console.error("wait cqe failed, {}", strerror(-res));
      }
    }
  }

  void submit() {
    if (auto ret = io_uring_submit(&_uring); ret < 0) {
      fastlog::console.error("submit sqes failed, {}", strerror(-ret));
    }
  }

private:
  io_uring _uring;
};

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_URING_IO_URING_HPP
