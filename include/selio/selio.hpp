#ifndef SELIO_SELIO_HPP
#define SELIO_SELIO_HPP
#include "selio/detail/common/error.hpp"
#include "selio/detail/coroutine/cancel.hpp"
#include "selio/detail/coroutine/task.hpp"
#include "selio/detail/net.hpp"
#include "selio/detail/runtime/context.hpp"
#include <chrono>
#include <stdexcept>

namespace selio {

using runtime_context = runtime::detail::runtime_context;

// spawn: 在 worker 线程上提交协程，返回它的取消接口
// 不在 worker 线程上时使用 runtime_context::spawn
template <typename T> inline auto spawn(task<T> &&t) -> CancelHandle {
  if (runtime::detail::current_shared == nullptr) {
    throw std::runtime_error("current_shared is nullptr");
  }
  return runtime::detail::submit(*runtime::detail::current_shared,
                                 std::move(t));
}

// block_on: 阻塞执行协程
template <typename T>
inline auto block_on(runtime_context &ctx, task<T> t) -> T {
  return ctx.block_on(std::move(t));
}

class ConfigBuilder {
public:
  ConfigBuilder() = default;
  ~ConfigBuilder() = default;

public:
  ConfigBuilder &set_num_events(std::size_t num_events) {
    _config._num_events = num_events;
    return *this;
  }

  ConfigBuilder &set_num_workers(std::size_t num_workers) {
    _config._num_workers = num_workers;
    return *this;
  }

  ConfigBuilder &set_io_interval(uint32_t io_interval) {
    _config._io_interval = io_interval;
    return *this;
  }

  ConfigBuilder &set_global_queue_interval(uint32_t global_queue_interval) {
    _config._global_queue_interval = global_queue_interval;
    return *this;
  }

  ConfigBuilder &set_max_selector_events(std::size_t max_selector_events) {
    _config._max_selector_events = max_selector_events;
    return *this;
  }

  // 挂起等待(connect 等)的超时
  ConfigBuilder &set_io_timeout(std::chrono::milliseconds io_timeout) {
    _config._io_timeout = io_timeout;
    return *this;
  }

  // 参数不合法时抛出 std::invalid_argument
  runtime::detail::Config build() {
    if (_config._num_workers == 0) {
      throw std::invalid_argument("num_workers must be greater than 0");
    }
    if (_config._io_interval == 0 || _config._global_queue_interval == 0) {
      throw std::invalid_argument("intervals must be greater than 0");
    }
    return _config;
  }

private:
  runtime::detail::Config _config;
};
} // namespace selio

#endif // SELIO_SELIO_HPP
