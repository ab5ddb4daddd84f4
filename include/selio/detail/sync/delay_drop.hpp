#ifndef SELIO_DETAIL_SYNC_DELAY_DROP_HPP
#define SELIO_DETAIL_SYNC_DELAY_DROP_HPP

#include <atomic>
#include <cstddef>
#include <thread>
#include <utility>

namespace selio::sync::detail {

class DelayDrop;

// 延迟析构令牌
// 持有期间，所属的 DelayDrop 无法完成 reset 和析构
class DropGuard {
public:
  explicit DropGuard(DelayDrop *owner) noexcept : _owner{owner} {}

  ~DropGuard() { release(); }

  DropGuard(const DropGuard &) = delete;
  DropGuard &operator=(const DropGuard &) = delete;

  DropGuard(DropGuard &&other) noexcept
      : _owner{std::exchange(other._owner, nullptr)} {}

  DropGuard &operator=(DropGuard &&other) noexcept {
    if (this != std::addressof(other)) [[likely]] {
      release();
      _owner = std::exchange(other._owner, nullptr);
    }
    return *this;
  }

public:
  // 提前释放令牌
  void release() noexcept;

private:
  DelayDrop *_owner;
};

// 延迟析构门闩
//
// 事件投递线程可能在任意时刻写入注册记录，subscribe 期间持有令牌，
// 保证被保护的对象在令牌释放之前不会被析构。
// 计数为 0 时才允许 reset / 析构继续执行，否则先短自旋，再让出线程。
// 释放令牌时的递减是对门闩内存的最后一次访问，所以这里不能用 wait/notify。
class DelayDrop {
  friend class DropGuard;

public:
  DelayDrop() = default;

  ~DelayDrop() { reset(); }

  DelayDrop(const DelayDrop &) = delete;
  DelayDrop &operator=(const DelayDrop &) = delete;

  // 移动只发生在注册之前或对象交接时，此时不会有未释放的令牌，
  // 目标对象总是得到一个全新的门闩
  DelayDrop(DelayDrop &&other) noexcept { other.reset(); }

  DelayDrop &operator=(DelayDrop &&other) noexcept {
    reset();
    other.reset();
    return *this;
  }

public:
  // 获取一个延迟析构令牌
  [[nodiscard]]
  auto delay_drop() noexcept -> DropGuard {
    _pending.fetch_add(1, std::memory_order::acq_rel);
    return DropGuard{this};
  }

  // 等待之前发出的所有令牌释放，开始新的保护周期
  void reset() const noexcept {
    if (drained()) {
      return;
    }
    for (int i = 0; i < 64; ++i) {
      if (drained()) {
        return;
      }
#if defined(__x86_64__) || defined(_M_X64)
      __builtin_ia32_pause();
#elif defined(__aarch64__)
      asm volatile("yield");
#endif
    }
    while (!drained()) {
      std::this_thread::yield();
    }
  }

  [[nodiscard]]
  auto pending() const noexcept -> std::size_t {
    return _pending.load(std::memory_order::acquire);
  }

private:
  [[nodiscard]]
  bool drained() const noexcept {
    return _pending.load(std::memory_order::acquire) == 0;
  }

  void on_release() noexcept {
    _pending.fetch_sub(1, std::memory_order::acq_rel);
  }

private:
  std::atomic<std::size_t> _pending{0};
};

inline void DropGuard::release() noexcept {
  if (_owner != nullptr) {
    std::exchange(_owner, nullptr)->on_release();
  }
}

} // namespace selio::sync::detail

#endif // SELIO_DETAIL_SYNC_DELAY_DROP_HPP
