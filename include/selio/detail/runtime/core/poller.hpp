#ifndef SELIO_DETAIL_RUNTIME_CORE_POLLER_HPP
#define SELIO_DETAIL_RUNTIME_CORE_POLLER_HPP

#include "selio/detail/runtime/core/worker.hpp"
#include "fastlog/fastlog.hpp"
#include <latch>
#include <span>
#include <thread>
#include <vector>

namespace selio::runtime::detail {

class RuntimePoller {
public:
  RuntimePoller(const Config &config)
      : _shared(config), _sync_start(static_cast<std::ptrdiff_t>(
                             _shared.config()._num_workers + 1)) {
    fastlog::console.debug("runtime start, {}", _shared.config());
    work();
  }

  ~RuntimePoller() {
    close();
    wait_for_all();
  }

public:
  void wait_for_all() {
    for (auto &worker : _runtime_thread_pool) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  void close() { _shared.close(); }

  [[nodiscard]]
  Shared &shared() noexcept {
    return _shared;
  }

private:
  // 创建线程并运行 worker，所有 worker 注册完成后统一启动
  void work() {
    for (std::size_t i = 0; i < _shared.config()._num_workers; ++i) {
      _runtime_thread_pool.emplace_back([this, i]() {
        Worker worker{&_shared, i};
        _sync_start.arrive_and_wait();
        worker.run();
      });
    }
    _sync_start.arrive_and_wait();
  }

private:
  Shared _shared;
  std::latch _sync_start;
  std::vector<std::jthread> _runtime_thread_pool;
};

} // namespace selio::runtime::detail

namespace selio::io::detail {

// 当前线程所属运行时的 selector，不在 worker 线程上时返回空
[[nodiscard]]
inline auto current_selector() -> Selector * {
  if (runtime::detail::current_shared == nullptr) {
    return nullptr;
  }
  return &runtime::detail::current_shared->selector();
}

} // namespace selio::io::detail

#endif // SELIO_DETAIL_RUNTIME_CORE_POLLER_HPP
