#ifndef SELIO_DETAIL_RUNTIME_CORE_WORKER_HPP
#define SELIO_DETAIL_RUNTIME_CORE_WORKER_HPP

#include "selio/detail/runtime/core/io_engine.hpp"
#include "selio/detail/runtime/core/queue.hpp"
#include "selio/detail/runtime/core/shared.hpp"
#include "fastlog/fastlog.hpp"
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace selio::runtime::detail {

class Worker;
inline thread_local Worker *current_worker{nullptr};

class Worker {
  friend class Shared;

public:
  Worker(Shared *shared, std::size_t worker_id)
      : _shared(shared), _worker_id(worker_id),
        _io_engine{shared->_config, shared->_selector->instance(worker_id)} {
    _shared->register_worker(this, worker_id);
    current_worker = this;
    current_shared = shared;
  }
  ~Worker() {
    current_worker = nullptr;
    current_shared = nullptr;
    _shared->_shutdown_latch.arrive_and_wait();
  }

public:
  // worker运行的主函数
  // 逻辑：
  // 1.更新时间戳 2.周期性驱动selector，更新线程关闭标志 3.获取下一个任务
  // 4.窃取任务 5.驱动selector 6.休眠
  void run() {
    fastlog::console.debug("worker {} start", _worker_id);
    while (!_is_shutdown) {
      tick();
      periodic();
      if (auto task = get_next_task(); task) {
        execute(task.value());
        continue;
      }
      if (auto task = task_steal(); task) {
        execute(task.value());
        continue;
      }
      if (drive_io()) {
        continue;
      }
      sleep();
    }
    fastlog::console.debug("worker {} stop", _worker_id);
  }

public:
  void wake_up() { _io_engine.wake_up(); }

  [[nodiscard]]
  std::size_t id() const noexcept {
    return _worker_id;
  }

  // 将任务推送到本地队列
  // 如果存在缓存任务，则将旧缓存任务推送到本地队列，新任务替换缓存
  // 否则将任务缓存起来
  void push_back_task_to_local_queue(std::coroutine_handle<> task) {
    if (_task_cache.has_value()) {
      _local_queue.push_back(_task_cache.value(), _shared->_global_queue);
      _task_cache = task;
      _shared->wake_up_one();
    } else {
      _task_cache.emplace(task);
    }
  }

private:
  void periodic() {
    if (_tick % _shared->_config._io_interval == 0) {
      drive_io();
      update_shutdown_flag();
    }
  }

  bool drive_io() { return _io_engine.drive(); }

  // 休眠一次
  // 登记到休眠集合之后再检查一遍队列，
  // 推送方先入队再取休眠集合，两边至少有一方能看到对方
  void sleep() {
    update_shutdown_flag();
    if (_is_shutdown) {
      return;
    }
    _shared->add_sleeper(_worker_id);
    if (!has_task() && _shared->_global_queue.empty()) {
      _io_engine.wait_and_drive();
    }
    _shared->remove_sleeper(_worker_id);
    update_shutdown_flag();
  }

  std::optional<std::coroutine_handle<>> get_next_task() {
    // 每隔 global_queue_interval 次优先看一眼全局队列，避免全局队列饿死
    if (_tick % _shared->_config._global_queue_interval == 0) {
      return _shared->get_next_global_task().or_else(
          [this] { return get_next_local_task(); });
    }
    if (auto task = get_next_local_task(); task) {
      return task;
    }
    if (_shared->_global_queue.empty()) {
      return std::nullopt;
    }
    // 从全局队列批量搬运，最多填满本地队列容量的一半
    auto num = std::min(_local_queue.remain_size(), _local_queue.capacity() / 2);
    if (num == 0) {
      return std::nullopt;
    }
    auto tasks = _shared->_global_queue.try_pop_batch(num);
    if (!tasks.has_value() || tasks.value().empty()) {
      return std::nullopt;
    }
    auto &task_vec = tasks.value();
    auto task = task_vec.back();
    task_vec.pop_back();
    if (!task_vec.empty()) {
      _local_queue.push_back_batch(task_vec);
    }
    return task;
  }

  // 从本地队列最长的 worker 那里窃取一半，都为空时再看全局队列
  std::optional<std::coroutine_handle<>> task_steal() {
    Worker *victim{nullptr};
    std::size_t max_size{0};
    for (auto worker : _shared->_workers) {
      if (worker == this || worker == nullptr) {
        continue;
      }
      if (auto size = worker->_local_queue.size(); size > max_size) {
        victim = worker;
        max_size = size;
      }
    }
    if (victim != nullptr) {
      if (auto task = victim->_local_queue.be_stolen_by(_local_queue); task) {
        return task;
      }
    }
    return _shared->get_next_global_task();
  }

private:
  void execute(std::coroutine_handle<> task) { task.resume(); }

  [[nodiscard]]
  bool has_task() const {
    return _task_cache.has_value() || !_local_queue.empty();
  }

  std::optional<std::coroutine_handle<>> get_next_local_task() {
    if (_task_cache.has_value()) {
      std::optional<std::coroutine_handle<>> task{std::nullopt};
      task.swap(_task_cache);
      return task;
    }
    return _local_queue.try_pop();
  }

  void update_shutdown_flag() {
    if (!_is_shutdown) {
      _is_shutdown = _shared->_global_queue.closed();
    }
  }

  void tick() { _tick += 1; }

private:
  Shared *_shared;
  std::size_t _worker_id;
  std::uint32_t _tick{0};
  IOEngine _io_engine;
  LocalQueue<LOCAL_QUEUE_CAPACITY> _local_queue{};
  std::optional<std::coroutine_handle<>> _task_cache{std::nullopt}; // 任务缓存
  bool _is_shutdown{false};
};

inline void Shared::wake_up_one() {
  if (auto idx = pop_sleeper(); idx) {
    wake_up(idx.value());
  }
}

inline void Shared::wake_up_all() {
  for (auto worker : _workers) {
    if (worker != nullptr) {
      worker->wake_up();
    }
  }
}

inline void Shared::wake_up(std::size_t worker_id) {
  if (auto worker = _workers[worker_id]; worker != nullptr) {
    worker->wake_up();
  }
}

inline void Shared::schedule(std::coroutine_handle<> handle) {
  if (current_worker != nullptr && current_worker->_shared == this) {
    current_worker->push_back_task_to_local_queue(handle);
  } else {
    push_back_task_to_global_queue(handle);
  }
}

} // namespace selio::runtime::detail

namespace selio::io::detail {

inline void Selector::wake_owner(std::size_t index) {
  if (auto shared = _shared.load(std::memory_order::acquire); shared) {
    shared->wake_up(index);
  }
}

inline void Selector::schedule(std::coroutine_handle<> handle) {
  if (auto shared = _shared.load(std::memory_order::acquire); shared) {
    shared->schedule(handle);
  } else {
    fastlog::console.debug("runtime is stopped, drop a wakeup");
  }
}

inline void deregister(std::shared_ptr<IoData> io) {
  if (auto selector = io->selector.lock(); selector) {
    selector->del_fd(std::move(io));
  }
}

inline void IoData::resume_later(std::coroutine_handle<> handle) {
  if (auto owner = selector.lock(); owner) {
    owner->schedule(handle);
  }
}

inline void IoData::schedule() {
  if (auto handle = take_waiter(); handle) {
    resume_later(handle);
  }
}

inline bool IoData::wake_with_error(int err) {
  auto handle = take_waiter();
  if (!handle) {
    return false;
  }
  wake_error.store(err, std::memory_order::release);
  resume_later(handle);
  return true;
}

} // namespace selio::io::detail

#endif // SELIO_DETAIL_RUNTIME_CORE_WORKER_HPP
