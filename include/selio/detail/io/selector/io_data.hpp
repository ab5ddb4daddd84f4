#ifndef SELIO_DETAIL_IO_SELECTOR_IO_DATA_HPP
#define SELIO_DETAIL_IO_SELECTOR_IO_DATA_HPP

#include "selio/detail/common/error.hpp"
#include "selio/detail/common/util/noncopyable.hpp"
#include <atomic>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace selio::io::detail {

class Selector;

// 就绪注册记录
//
// 由持有 socket 的协程和事件投递线程共享，注册后地址不再改变
// (总是通过 shared_ptr 持有)。
// 对 selector 只持有弱引用：运行时先于注册记录销毁时，唤醒和注销都直接跳过。
// 注册后投递线程随时可能访问 io_flag 和 co，所以对它们的每一次读/清除/交换
// 都必须是带内存序的原子操作。
struct IoData : public util::Nonmovable {
  IoData(int fd, std::size_t selector_index, std::weak_ptr<Selector> selector)
      : fd{fd}, selector_index{selector_index}, selector{std::move(selector)} {}

  // 就绪标志：投递线程置位，消费方清除。只用来提示"再试一次"，
  // 不承担其它数据的可见性，所以 relaxed 足够
  std::atomic<bool> io_flag{false};
  // 正在等待该描述符的协程句柄(最多一个)
  std::atomic<void *> co{nullptr};
  // 唤醒方携带的错误(超时/取消)，0 表示没有
  std::atomic<int> wake_error{0};
  // 当前生效的超时定时器代数，过期的定时器据此被忽略
  std::atomic<std::uint64_t> timer_generation{0};

  const int fd;                      // 文件描述符
  const std::size_t selector_index;  // 所属 selector 实例下标
  const std::weak_ptr<Selector> selector; // 所属 selector

public:
  // 放入等待协程，替换掉之前的占用者
  void set_waiter(std::coroutine_handle<> handle) noexcept {
    co.exchange(handle.address(), std::memory_order::release);
  }

  // 取出等待协程，同一个挂起周期只有一方能拿到非空句柄
  [[nodiscard]]
  auto take_waiter() noexcept -> std::coroutine_handle<> {
    return std::coroutine_handle<>::from_address(
        co.exchange(nullptr, std::memory_order::acq_rel));
  }

  [[nodiscard]]
  bool has_waiter() const noexcept {
    return co.load(std::memory_order::acquire) != nullptr;
  }

  // 取走唤醒错误
  [[nodiscard]]
  auto take_error() noexcept -> std::optional<Error> {
    if (auto err = wake_error.exchange(0, std::memory_order::acquire);
        err != 0) {
      return Error{err};
    }
    return std::nullopt;
  }

  // 开启新一轮超时，返回本轮代数
  [[nodiscard]]
  auto next_timer_generation() noexcept -> std::uint64_t {
    return timer_generation.fetch_add(1, std::memory_order::acq_rel) + 1;
  }

  // 让之前添加的定时器全部失效
  void invalidate_timers() noexcept {
    timer_generation.fetch_add(1, std::memory_order::acq_rel);
  }

  [[nodiscard]]
  bool is_current_timer(std::uint64_t generation) const noexcept {
    return timer_generation.load(std::memory_order::acquire) == generation;
  }

  // 就绪事件到达：置位并把等待协程交还调度器
  void set_ready() {
    io_flag.store(true, std::memory_order::release);
    schedule();
  }

  // 把等待协程(如果有)交还调度器
  inline void schedule();

  // 把已经取出的协程交还所属运行时
  inline void resume_later(std::coroutine_handle<> handle);

  // 带错误唤醒等待协程，返回是否真的唤醒了协程
  inline bool wake_with_error(int err);
};

// 从所属 selector 注销，运行时已经销毁时什么都不做
// 在 worker 定义之后实现
inline void deregister(std::shared_ptr<IoData> io);

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_SELECTOR_IO_DATA_HPP
