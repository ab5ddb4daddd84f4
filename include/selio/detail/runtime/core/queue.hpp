#ifndef SELIO_DETAIL_RUNTIME_CORE_QUEUE_HPP
#define SELIO_DETAIL_RUNTIME_CORE_QUEUE_HPP

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace selio::runtime::detail {

// 全局队列：所有线程都可以投递，worker 批量取走
class GlobalQueue {
public:
  GlobalQueue() = default;
  GlobalQueue(const GlobalQueue &) = delete;
  GlobalQueue &operator=(const GlobalQueue &) = delete;

public:
  void push_back(std::coroutine_handle<> task) {
    std::lock_guard lock{_mutex};
    _tasks.push_back(task);
  }

  [[nodiscard]]
  std::optional<std::coroutine_handle<>> try_pop() {
    std::lock_guard lock{_mutex};
    if (_tasks.empty()) {
      return std::nullopt;
    }
    auto task = _tasks.front();
    _tasks.pop_front();
    return task;
  }

  // 最多取出 n 个任务
  [[nodiscard]]
  std::optional<std::vector<std::coroutine_handle<>>>
  try_pop_batch(std::size_t n) {
    std::lock_guard lock{_mutex};
    if (_tasks.empty()) {
      return std::nullopt;
    }
    n = std::min(n, _tasks.size());
    std::vector<std::coroutine_handle<>> tasks(_tasks.begin(),
                                               _tasks.begin() + n);
    _tasks.erase(_tasks.begin(), _tasks.begin() + n);
    return tasks;
  }

  [[nodiscard]]
  bool empty() const {
    std::lock_guard lock{_mutex};
    return _tasks.empty();
  }

  void close() {
    std::lock_guard lock{_mutex};
    _closed = true;
  }

  [[nodiscard]]
  bool closed() const {
    std::lock_guard lock{_mutex};
    return _closed;
  }

private:
  mutable std::mutex _mutex;
  std::deque<std::coroutine_handle<>> _tasks;
  bool _closed{false};
};

// 本地队列：所属 worker 从头部取任务，其它 worker 可以窃取一半
// 超出容量的部分溢出到全局队列
template <std::size_t Capacity> class LocalQueue {
public:
  LocalQueue() = default;
  LocalQueue(const LocalQueue &) = delete;
  LocalQueue &operator=(const LocalQueue &) = delete;

public:
  void push_back(std::coroutine_handle<> task, GlobalQueue &global_queue) {
    {
      std::lock_guard lock{_mutex};
      if (_tasks.size() < Capacity) {
        _tasks.push_back(task);
        return;
      }
    }
    global_queue.push_back(task);
  }

  void push_back_batch(std::span<std::coroutine_handle<>> tasks) {
    std::lock_guard lock{_mutex};
    _tasks.insert(_tasks.end(), tasks.begin(), tasks.end());
  }

  [[nodiscard]]
  std::optional<std::coroutine_handle<>> try_pop() {
    std::lock_guard lock{_mutex};
    if (_tasks.empty()) {
      return std::nullopt;
    }
    auto task = _tasks.front();
    _tasks.pop_front();
    return task;
  }

  // 被 dst 窃取一半任务，返回其中一个直接执行
  [[nodiscard]]
  std::optional<std::coroutine_handle<>> be_stolen_by(LocalQueue &dst) {
    std::vector<std::coroutine_handle<>> stolen;
    {
      std::lock_guard lock{_mutex};
      auto n = (_tasks.size() + 1) / 2;
      if (n == 0) {
        return std::nullopt;
      }
      stolen.assign(_tasks.end() - static_cast<std::ptrdiff_t>(n),
                    _tasks.end());
      _tasks.erase(_tasks.end() - static_cast<std::ptrdiff_t>(n),
                   _tasks.end());
    }
    auto task = stolen.back();
    stolen.pop_back();
    if (!stolen.empty()) {
      dst.push_back_batch(stolen);
    }
    return task;
  }

  [[nodiscard]]
  std::size_t size() const {
    std::lock_guard lock{_mutex};
    return _tasks.size();
  }

  [[nodiscard]]
  std::size_t remain_size() const {
    return Capacity - std::min(Capacity, size());
  }

  [[nodiscard]]
  static constexpr std::size_t capacity() {
    return Capacity;
  }

  [[nodiscard]]
  bool empty() const {
    return size() == 0;
  }

private:
  mutable std::mutex _mutex;
  std::deque<std::coroutine_handle<>> _tasks;
};

} // namespace selio::runtime::detail

#endif // SELIO_DETAIL_RUNTIME_CORE_QUEUE_HPP
