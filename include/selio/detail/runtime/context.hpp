#ifndef SELIO_DETAIL_RUNTIME_CONTEXT_HPP
#define SELIO_DETAIL_RUNTIME_CONTEXT_HPP

#include "selio/detail/coroutine/cancel.hpp"
#include "selio/detail/coroutine/task.hpp"
#include "selio/detail/runtime/core/config.hpp"
#include "selio/detail/runtime/core/poller.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace selio::runtime::detail {

// 阻塞等待协程完成
// 等待方返回后信号随即被销毁，所以通知必须在锁内完成，
// 等待方拿到锁之前通知方已经不再访问信号
struct completion_signal {
  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  bool ready{false};

  void mark_ready() {
    std::lock_guard lock{mutex};
    ready = true;
    cv.notify_all();
  }

  [[nodiscard]]
  bool is_ready() const {
    std::lock_guard lock{mutex};
    return ready;
  }

  void wait() const {
    std::unique_lock lock{mutex};
    cv.wait(lock, [this] { return ready; });
  }
};

// 追踪 block_on 上下文中的所有协程
struct block_on_tracker {
  std::atomic<std::size_t> pending_count{0};
  completion_signal completion;

  void register_subtask() {
    pending_count.fetch_add(1, std::memory_order::acq_rel);
  }

  void complete_subtask() {
    if (pending_count.fetch_sub(1, std::memory_order::acq_rel) == 1) {
      completion.mark_ready();
    }
  }

  void wait_all_done() { completion.wait(); }

  static void on_task_complete(void *arg) {
    static_cast<block_on_tracker *>(arg)->complete_subtask();
  }
};

// 当前 tracker，在 worker 线程上传播给 spawn 出去的子协程
inline thread_local block_on_tracker *current_tracker{nullptr};

// 存放协程结果（值或异常），从 worker 线程传递到阻塞线程
template <typename T> struct result_slot {
  std::optional<T> value{std::nullopt};
  std::exception_ptr exception{nullptr};

  void set_value(T &&v) { value.emplace(std::move(v)); }

  void set_exception(std::exception_ptr e) { exception = std::move(e); }

  T get() {
    if (exception)
      std::rethrow_exception(exception);
    return std::move(value.value());
  }
};

template <> struct result_slot<void> {
  std::exception_ptr exception{nullptr};

  void set_value() {}

  void set_exception(std::exception_ptr e) { exception = std::move(e); }

  void get() {
    if (exception)
      std::rethrow_exception(exception);
  }
};

// block_on 外壳协程：co_await 用户协程，把结果写入 slot，再通知 tracker
template <typename T>
task<void> block_on_coro(task<T> t, result_slot<T> *slot,
                         block_on_tracker *tracker) {
  auto prev_tracker = current_tracker;
  current_tracker = tracker;
  try {
    if constexpr (std::is_void_v<T>) {
      co_await std::move(t);
      slot->set_value();
    } else {
      auto result = co_await std::move(t);
      slot->set_value(std::move(result));
    }
  } catch (...) {
    slot->set_exception(std::current_exception());
  }
  current_tracker = prev_tracker;
  tracker->complete_subtask();
}

// 提交一个顶层协程，返回它的取消接口
template <typename T>
auto submit(Shared &shared, task<T> &&t) -> CancelHandle {
  auto handle = t.take();
  CancelHandle cancel{handle.promise().cancel_data()};

  // 在 block_on 上下文中，注册 tracker 追踪
  if (auto *tracker = current_tracker) {
    tracker->register_subtask();
    auto &promise = handle.promise();
    promise._on_complete = &block_on_tracker::on_task_complete;
    promise._on_complete_arg = tracker;
  }

  shared.schedule(handle);
  return cancel;
}

class runtime_context {
public:
  explicit runtime_context()
      : _config{}, _poller{std::make_unique<RuntimePoller>(_config)} {}

  explicit runtime_context(Config config)
      : _config{config}, _poller{std::make_unique<RuntimePoller>(_config)} {}

  ~runtime_context() { stop(); }

  runtime_context(const runtime_context &) = delete;
  runtime_context &operator=(const runtime_context &) = delete;
  runtime_context(runtime_context &&) = delete;
  runtime_context &operator=(runtime_context &&) = delete;

public:
  [[nodiscard]]
  const Config &config() const noexcept {
    return _config;
  }

  void stop() {
    if (_poller) {
      _poller.reset();
    }
  }

  [[nodiscard]]
  bool running() const noexcept {
    return _poller != nullptr;
  }

  // 从任意线程提交协程到这个运行时
  template <typename T> auto spawn(task<T> &&t) -> CancelHandle {
    if (!running()) {
      throw std::logic_error("runtime is stopped");
    }
    return submit(_poller->shared(), std::move(t));
  }

  // 阻塞当前线程，等待 task 及其所有子 spawn 完成，返回 T
  // 主协程投递到全局队列，由 worker 线程执行
  template <typename T> auto block_on(task<T> t) -> T {
    if (!running()) {
      throw std::logic_error("runtime is stopped");
    }
    result_slot<T> slot;
    block_on_tracker tracker;
    tracker.register_subtask(); // 主 task 占一个 pending

    auto wrapper = block_on_coro<T>(std::move(t), &slot, &tracker);
    _poller->shared().push_back_task_to_global_queue(wrapper.take());

    tracker.wait_all_done();
    return slot.get();
  }

private:
  Config _config;
  std::unique_ptr<RuntimePoller> _poller;
};

} // namespace selio::runtime::detail

#endif // SELIO_DETAIL_RUNTIME_CONTEXT_HPP
