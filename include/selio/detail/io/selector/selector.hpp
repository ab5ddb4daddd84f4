#ifndef SELIO_DETAIL_IO_SELECTOR_SELECTOR_HPP
#define SELIO_DETAIL_IO_SELECTOR_SELECTOR_HPP

#include "selio/detail/common/error.hpp"
#include "selio/detail/io/selector/io_data.hpp"
#include "selio/detail/io/selector/timer_list.hpp"
#include "fastlog/fastlog.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstring>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <sys/epoll.h>
#include <unistd.h>
#include <vector>

namespace selio::runtime::detail {
class Shared;
}

namespace selio::io::detail {

// 单个 epoll 实例
//
// 只有下标相同的 worker 调用 poll，其它线程只会注册、注销和添加定时器。
// 注销的记录先放进待释放列表，到下一次 poll 开始时才真正释放：
// 上一次 epoll_wait 取出的事件里可能还带着它的地址。
class SingleSelector {
public:
  SingleSelector(std::size_t index, std::size_t max_events)
      : _epoll_fd{::epoll_create1(EPOLL_CLOEXEC)}, _index{index},
        _events(max_events == 0 ? 1 : max_events) {
    if (_epoll_fd < 0) {
      throw std::runtime_error(
          std::format("epoll_create1 failed, {}", strerror(errno)));
    }
  }

  ~SingleSelector() { ::close(_epoll_fd); }

  SingleSelector(const SingleSelector &) = delete;
  SingleSelector &operator=(const SingleSelector &) = delete;

public:
  [[nodiscard]]
  int epoll_fd() const noexcept {
    return _epoll_fd;
  }

  // 边沿触发，同时关注读写和对端关闭
  [[nodiscard]]
  auto add(IoData &io) -> expected<void> {
    struct epoll_event event{};
    event.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET;
    event.data.ptr = &io;
    if (::epoll_ctl(_epoll_fd, EPOLL_CTL_ADD, io.fd, &event) < 0) {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

  // 返回待释放列表之前是否为空
  bool del(std::shared_ptr<IoData> io) {
    // fd 已经被关闭时 epoll 会自动移除，这里的失败不影响后续流程
    if (::epoll_ctl(_epoll_fd, EPOLL_CTL_DEL, io->fd, nullptr) < 0) {
      fastlog::console.debug("epoll_ctl del fd {} failed, {}", io->fd,
                             strerror(errno));
    }
    std::lock_guard lock{_retire_mutex};
    auto was_empty = _retired.empty();
    _retired.push_back(std::move(io));
    return was_empty;
  }

  bool add_timer(TimerEntry entry) { return _timers.add(std::move(entry)); }

  // 收集一轮就绪事件和到期的定时器，返回被唤醒的事件数
  // 1.释放待释放列表 2.非阻塞 epoll_wait 3.处理到期定时器
  auto poll() -> std::size_t {
    free_retired();

    std::size_t count{0};
    auto n = ::epoll_wait(_epoll_fd, _events.data(),
                          static_cast<int>(_events.size()), 0);
    if (n < 0) {
      if (errno != EINTR) {
        fastlog::console.error("epoll_wait failed, {}", strerror(errno));
      }
      n = 0;
    }
    for (int i = 0; i < n; ++i) {
      auto io = static_cast<IoData *>(_events[static_cast<std::size_t>(i)]
                                          .data.ptr);
      fastlog::console.trace("selector {} fd {} ready, events {:#x}", _index,
                             io->fd, _events[static_cast<std::size_t>(i)].events);
      io->set_ready();
      count += 1;
    }

    count += expire_timers();
    return count;
  }

  [[nodiscard]]
  auto next_deadline_ms() const -> std::optional<time_t> {
    return _timers.next_deadline_ms();
  }

private:
  void free_retired() {
    std::vector<std::shared_ptr<IoData>> retired;
    {
      std::lock_guard lock{_retire_mutex};
      retired.swap(_retired);
    }
  }

  // 先取走等待协程再核对代数：
  // 代数不符说明协程已经开始了新一轮挂起，这个句柄属于新的一轮，
  // 只能不带错误地交还调度器，由协程自己重新挂起
  auto expire_timers() -> std::size_t {
    std::size_t count{0};
    for (auto &entry : _timers.take_expired(std::chrono::steady_clock::now())) {
      auto io = entry.io.lock();
      if (io == nullptr || !io->is_current_timer(entry.generation)) {
        continue;
      }
      auto handle = io->take_waiter();
      if (!handle) {
        continue;
      }
      if (io->is_current_timer(entry.generation)) {
        fastlog::console.debug("fd {} wait timeout", io->fd);
        io->wake_error.store(ETIMEDOUT, std::memory_order::release);
      }
      io->resume_later(handle);
      count += 1;
    }
    return count;
  }

private:
  int _epoll_fd;
  std::size_t _index;
  std::vector<struct epoll_event> _events;
  TimerList _timers;
  std::mutex _retire_mutex;
  std::vector<std::shared_ptr<IoData>> _retired;
};

// 全部 epoll 实例，每个 worker 一个
// 描述符按 fd % 实例数 分配到实例上
// 由 Shared 通过 shared_ptr 持有，注册记录只保存弱引用。
// Shared 析构时调用 detach，之后的唤醒和调度请求都被丢弃。
class Selector : public std::enable_shared_from_this<Selector> {
public:
  Selector(std::size_t num, std::size_t max_events,
           std::chrono::milliseconds io_timeout,
           runtime::detail::Shared *shared)
      : _shared{shared}, _io_timeout{io_timeout} {
    _selectors.reserve(num);
    for (std::size_t i = 0; i < num; ++i) {
      _selectors.push_back(std::make_unique<SingleSelector>(i, max_events));
    }
  }

public:
  [[nodiscard]]
  std::size_t size() const noexcept {
    return _selectors.size();
  }

  // 挂起等待的默认超时
  [[nodiscard]]
  std::chrono::milliseconds io_timeout() const noexcept {
    return _io_timeout;
  }

  [[nodiscard]]
  SingleSelector &instance(std::size_t index) {
    return *_selectors[index];
  }

  [[nodiscard]]
  std::size_t index_of(int fd) const noexcept {
    return static_cast<std::size_t>(fd) % _selectors.size();
  }

  // 为 fd 建立注册记录并加入对应的 epoll 实例
  [[nodiscard]]
  auto add_socket(int fd) -> expected<std::shared_ptr<IoData>> {
    auto index = index_of(fd);
    auto io = std::make_shared<IoData>(fd, index, weak_from_this());
    if (auto ret = _selectors[index]->add(*io); !ret) {
      return std::unexpected{ret.error()};
    }
    fastlog::console.trace("fd {} registered on selector {}", fd, index);
    return io;
  }

  // 注销：从 epoll 中移除，记录延迟到所属 worker 的下一次 poll 释放
  void del_fd(std::shared_ptr<IoData> io) {
    auto index = io->selector_index;
    fastlog::console.trace("fd {} deregistered from selector {}", io->fd,
                           index);
    if (_selectors[index]->del(std::move(io))) {
      wake_owner(index);
    }
  }

  // 为当前这一轮挂起设置超时，必须在放入等待协程之前调用
  void add_io_timer(const std::shared_ptr<IoData> &io,
                    std::chrono::milliseconds timeout) {
    auto generation = io->next_timer_generation();
    auto index = io->selector_index;
    if (_selectors[index]->add_timer(TimerEntry{
            .deadline = std::chrono::steady_clock::now() + timeout,
            .io = io,
            .generation = generation,
        })) {
      // 新的最早到期时间，让可能正在休眠的 worker 重新计算等待时长
      wake_owner(index);
    }
  }

  // 所属运行时正在销毁，此时所有 worker 已经退出
  void detach() noexcept { _shared.store(nullptr, std::memory_order::release); }

  // 把协程交还所属运行时，在 worker 定义之后实现
  inline void schedule(std::coroutine_handle<> handle);

private:
  // 唤醒实例所属的 worker，在 worker 定义之后实现
  inline void wake_owner(std::size_t index);

private:
  std::atomic<runtime::detail::Shared *> _shared;
  std::chrono::milliseconds _io_timeout;
  std::vector<std::unique_ptr<SingleSelector>> _selectors;
};

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_SELECTOR_SELECTOR_HPP
