#ifndef SELIO_DETAIL_IO_SELECTOR_PARK_HPP
#define SELIO_DETAIL_IO_SELECTOR_PARK_HPP

#include "selio/detail/coroutine/cancel.hpp"
#include "selio/detail/io/selector/io_data.hpp"
#include "selio/detail/io/selector/selector.hpp"
#include <chrono>
#include <coroutine>
#include <memory>
#include <optional>

namespace selio::io::detail {

// 把即将挂起的协程放到注册记录上
//
// 调用者必须持有延迟析构令牌：放入等待协程之后，
// 其它线程随时可能恢复协程并开始析构持有 io 的对象。
// io 按值传入，放入等待协程之后不再读取调用者的成员。
// 1.设置本轮超时(没有超时也要让旧定时器失效) 2.登记取消回引用
// 3.放入等待协程 4.就绪标志已经置位则直接交还调度器
// 5.再检查一次取消标志，防止取消请求落在放入等待协程之前
// 回引用必须先于等待协程登记：协程恢复后 clear_io 总是发生在登记之后
inline void park(Selector &selector, std::shared_ptr<IoData> io,
                 std::coroutine_handle<> handle,
                 coroutine::detail::Cancel &cancel,
                 std::optional<std::chrono::milliseconds> timeout) {
  if (timeout.has_value()) {
    selector.add_io_timer(io, timeout.value());
  } else {
    io->invalidate_timers();
  }
  cancel.set_io(io);
  io->set_waiter(handle);

  if (io->io_flag.load(std::memory_order::acquire)) {
    io->schedule();
    return;
  }

  if (cancel.is_canceled()) {
    cancel.cancel();
  }
}

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_SELECTOR_PARK_HPP
