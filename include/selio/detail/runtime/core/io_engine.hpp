#ifndef SELIO_DETAIL_RUNTIME_CORE_ENGINE_HPP
#define SELIO_DETAIL_RUNTIME_CORE_ENGINE_HPP

#include "selio/detail/io/selector/selector.hpp"
#include "selio/detail/io/uring/io_uring.hpp"
#include "selio/detail/io/uring/waker.hpp"
#include "selio/detail/runtime/core/config.hpp"
#include <array>
#include <liburing.h>

namespace selio::runtime::detail {

// IOEngine 类，驱动当前 worker 的 selector 实例
//
// io_uring 只承担"等待"：挂着 eventfd 的读请求和对 epoll fd 的 poll 请求，
// 休眠时带着最早的定时器期限阻塞在完成队列上。
// 真正的就绪事件由 selector 的非阻塞 epoll_wait 取出。
class IOEngine {
public:
  IOEngine(const Config &config, io::detail::SingleSelector &selector)
      : _uring(config), _selector{selector}, _watch{selector.epoll_fd()} {}

public:
  // 阻塞到有唤醒、有就绪事件或者最早的定时器到期，然后驱动一次
  void wait_and_drive(this IOEngine &engine) {
    engine._uring.wait(engine._selector.next_deadline_ms());
    engine.drive();
  }

  // 驱动一次，返回是否唤醒了协程
  // 逻辑：1.消费完成队列并记录 poll 请求是否完成 2.selector 取出就绪事件和到期定时器
  // 3.重新挂上 eventfd 读请求和 epoll fd 的 poll 请求 4.提交
  bool drive(this IOEngine &engine) {
    std::array<io_uring_cqe *, MAX_COMPLETIONS> cqes;

    auto completed_count = engine._uring.peek_batch(cqes);
    for (std::size_t i = 0; i < completed_count; i++) {
      auto tag = static_cast<io::detail::WatchTag>(
          io_uring_cqe_get_data64(cqes[i]));
      if (tag == io::detail::WatchTag::Selector) {
        engine._watch.on_complete();
      }
    }
    engine._uring.consume(completed_count);

    auto woken = engine._selector.poll();

    engine._waker.start_watch(engine._uring);
    engine._watch.start_watch(engine._uring);
    engine._uring.submit();
    return woken > 0;
  }

  // 唤醒IO处理引擎
  void wake_up(this IOEngine &engine) { engine._waker.wake_up(); }

private:
  // uring 先于 waker 析构，保证挂着的读请求不会写入已经释放的内存
  io::detail::Waker _waker;
  io::detail::IOuring _uring;
  io::detail::SingleSelector &_selector;
  io::detail::SelectorWatch _watch;
};
} // namespace selio::runtime::detail
#endif // SELIO_DETAIL_RUNTIME_CORE_ENGINE_HPP
