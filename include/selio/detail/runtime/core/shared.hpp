#ifndef SELIO_DETAIL_RUNTIME_CORE_SHARED_HPP
#define SELIO_DETAIL_RUNTIME_CORE_SHARED_HPP

#include "selio/detail/io/selector/selector.hpp"
#include "selio/detail/runtime/core/config.hpp"
#include "selio/detail/runtime/core/queue.hpp"
#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <latch>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace selio::runtime::detail {
class Worker;
class Shared;

inline thread_local Shared *current_shared{nullptr};

// 运行时内所有 worker 共享的部分：全局队列、selector 和休眠中的 worker 集合
class Shared {
  friend class Worker;

public:
  Shared(const Config &config)
      : _config(config),
        _selector(std::make_shared<io::detail::Selector>(
            config._num_workers, config._max_selector_events,
            config._io_timeout, this)),
        _shutdown_latch(static_cast<std::ptrdiff_t>(config._num_workers)) {
    _workers.resize(config._num_workers);
  }

  // 注册记录可能比运行时活得更久，断开它们通往这里的路径
  ~Shared() { _selector->detach(); }

  Shared(const Shared &) = delete;
  Shared &operator=(const Shared &) = delete;

public:
  [[nodiscard]]
  const Config &config() const {
    return _config;
  }

  [[nodiscard]]
  io::detail::Selector &selector() {
    return *_selector;
  }

  // 关闭全局队列并唤醒所有worker
  void close() {
    if (!_global_queue.closed()) {
      _global_queue.close();
      wake_up_all();
    }
  }

  void register_worker(Worker *worker, std::size_t worker_id) {
    _workers[worker_id] = worker;
  }

  [[nodiscard]]
  std::optional<std::coroutine_handle<>> get_next_global_task() {
    return _global_queue.try_pop();
  }

  // 推送到全局队列并唤醒一个休眠中的worker
  void push_back_task_to_global_queue(std::coroutine_handle<> task) {
    _global_queue.push_back(task);
    wake_up_one();
  }

  // 恢复一个挂起的协程：
  // 在本运行时的 worker 线程上放进本地队列，否则放进全局队列
  inline void schedule(std::coroutine_handle<> handle);

public:
  // 以下接口需要 Worker 的完整定义，在 worker.hpp 中实现
  inline void wake_up_one();
  inline void wake_up_all();
  inline void wake_up(std::size_t worker_id);

private:
  // worker 进入休眠前登记，被唤醒或者自己醒来后注销
  void add_sleeper(std::size_t worker_id) {
    std::lock_guard lock{_sleepers_mutex};
    _sleepers.push_back(worker_id);
  }

  void remove_sleeper(std::size_t worker_id) {
    std::lock_guard lock{_sleepers_mutex};
    std::erase(_sleepers, worker_id);
  }

  [[nodiscard]]
  std::optional<std::size_t> pop_sleeper() {
    std::lock_guard lock{_sleepers_mutex};
    if (_sleepers.empty()) {
      return std::nullopt;
    }
    auto worker_id = _sleepers.back();
    _sleepers.pop_back();
    return worker_id;
  }

private:
  const detail::Config _config;
  std::shared_ptr<io::detail::Selector> _selector;
  GlobalQueue _global_queue;
  std::latch _shutdown_latch;
  std::vector<Worker *> _workers;
  std::mutex _sleepers_mutex;
  std::vector<std::size_t> _sleepers;
};
} // namespace selio::runtime::detail
#endif // SELIO_DETAIL_RUNTIME_CORE_SHARED_HPP
