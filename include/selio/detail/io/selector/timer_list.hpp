#ifndef SELIO_DETAIL_IO_SELECTOR_TIMER_LIST_HPP
#define SELIO_DETAIL_IO_SELECTOR_TIMER_LIST_HPP

#include "selio/detail/io/selector/io_data.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace selio::io::detail {

// 一个挂起周期的超时定时器
struct TimerEntry {
  std::chrono::steady_clock::time_point deadline;
  std::weak_ptr<IoData> io;  // 注册记录可能先于定时器被释放
  std::uint64_t generation;  // 添加时注册记录的定时器代数
};

// 按到期时间排序的定时器堆
//
// 任意线程都可以添加，只有所属 worker 取出到期项。
// 被新一轮挂起取代的旧定时器到期时按代数识别后丢弃；
// 堆的大小超过上一次清理后的两倍时，添加前先清掉已经失效的项，
// 保证堆的大小和仍在等待的注册记录数量同阶。
class TimerList {
  static constexpr std::size_t MIN_PRUNE_SIZE{64};

  struct Later {
    bool operator()(const TimerEntry &lhs, const TimerEntry &rhs) const {
      return lhs.deadline > rhs.deadline;
    }
  };

public:
  // 返回新定时器是否成为最早到期的一个
  bool add(TimerEntry entry) {
    std::lock_guard lock{_mutex};
    if (_heap.size() >= _prune_at) {
      prune();
    }
    auto earliest = _heap.empty() || entry.deadline < _heap.front().deadline;
    _heap.push_back(std::move(entry));
    std::push_heap(_heap.begin(), _heap.end(), Later{});
    return earliest;
  }

  // 取出所有到期的定时器
  auto take_expired(std::chrono::steady_clock::time_point now)
      -> std::vector<TimerEntry> {
    std::vector<TimerEntry> expired;
    std::lock_guard lock{_mutex};
    while (!_heap.empty() && _heap.front().deadline <= now) {
      std::pop_heap(_heap.begin(), _heap.end(), Later{});
      expired.push_back(std::move(_heap.back()));
      _heap.pop_back();
    }
    return expired;
  }

  // 距离最早的定时器到期还有多少毫秒，没有定时器时返回空
  [[nodiscard]]
  auto next_deadline_ms() const -> std::optional<time_t> {
    std::lock_guard lock{_mutex};
    if (_heap.empty()) {
      return std::nullopt;
    }
    auto now = std::chrono::steady_clock::now();
    if (_heap.front().deadline <= now) {
      return 0;
    }
    // 向上取整，避免提前醒来空转
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(
        _heap.front().deadline - now);
    return static_cast<time_t>(ms.count());
  }

  [[nodiscard]]
  auto size() const -> std::size_t {
    std::lock_guard lock{_mutex};
    return _heap.size();
  }

private:
  // 去掉注册记录已经释放或者代数已经过期的项，调用者持有锁
  void prune() {
    std::erase_if(_heap, [](const TimerEntry &entry) {
      auto io = entry.io.lock();
      return io == nullptr || !io->is_current_timer(entry.generation);
    });
    std::make_heap(_heap.begin(), _heap.end(), Later{});
    _prune_at = std::max(MIN_PRUNE_SIZE, _heap.size() * 2);
  }

private:
  mutable std::mutex _mutex;
  std::vector<TimerEntry> _heap;
  std::size_t _prune_at{MIN_PRUNE_SIZE};
};

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_SELECTOR_TIMER_LIST_HPP
