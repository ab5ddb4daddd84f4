#ifndef SELIO_DETAIL_RUNTIME_CONFIG_HPP
#define SELIO_DETAIL_RUNTIME_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <thread>

namespace selio::runtime::detail {
static inline constexpr std::size_t LOCAL_QUEUE_CAPACITY{256uz};
static inline constexpr std::size_t MAX_COMPLETIONS{64uz};

struct Config {
  std::size_t _num_events{256}; // iouring队列大小
  std::size_t _num_workers{std::thread::hardware_concurrency()}; // 工作线程数量
  uint32_t _io_interval{61};                                     // io间隔
  uint32_t _global_queue_interval{61};                           // 全局队列间隔
  std::size_t _max_selector_events{256}; // 单次 epoll_wait 最多取出的事件数
  std::chrono::milliseconds _io_timeout{std::chrono::seconds{10}}; // 挂起等待的超时
};

} // namespace selio::runtime::detail

namespace std {

template <> class formatter<selio::runtime::detail::Config> {
public:
  constexpr auto parse(format_parse_context &context) {
    auto it{context.begin()};
    auto end{context.end()};
    if (it == end || *it == '}') {
      return it;
    }
    ++it;
    if (it != end && *it != '}') {
      throw format_error("Invalid format specifier for Config");
    }
    return it;
  }

  auto format(const selio::runtime::detail::Config &config,
              auto &context) const noexcept {
    return format_to(context.out(),
                     "num_events: {}, num_workers: {}, io_interval: {}, "
                     "global_queue_interval: {}, "
                     "max_selector_events: {}, io_timeout: {}",
                     config._num_events, config._num_workers,
                     config._io_interval, config._global_queue_interval,
                     config._max_selector_events,
                     config._io_timeout);
  }
};

} // namespace std

#endif // SELIO_DETAIL_RUNTIME_CONFIG_HPP
