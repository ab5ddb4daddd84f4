#ifndef SELIO_DETAIL_COROUTINE_YIELD_HPP
#define SELIO_DETAIL_COROUTINE_YIELD_HPP

#include "selio/detail/common/concepts.hpp"
#include "selio/detail/coroutine/cancel.hpp"
#include "selio/detail/coroutine/task.hpp"
#include <coroutine>
#include <memory>

namespace selio::coroutine::detail {

// 挂起当前协程并交给事件源
//
// await_suspend 把协程句柄和它的取消槽交给 subscribe。subscribe 一旦把句柄
// 放进注册记录，其它线程就可能恢复这个协程，所以 subscribe 返回之后不再访问
// awaiter 自身的任何成员。
template <typename Source>
  requires is_event_source<Source>
class YieldWith {
public:
  explicit YieldWith(Source &source) noexcept : _source{source} {}

public:
  constexpr bool await_ready() const noexcept { return false; }

  template <typename Promise>
  void await_suspend(std::coroutine_handle<Promise> handle) {
    // 协程可能在 subscribe 返回之前就被恢复并结束，
    // 这里持有一份引用，保证取消槽在 subscribe 期间有效
    auto cancel = handle.promise().cancel_data();
    _cancel = cancel.get();
    _source.subscribe(handle, *cancel);
  }

  void await_resume() const { _cancel->clear_io(); }

private:
  Source &_source;
  Cancel *_cancel{nullptr};
};

// 取得当前协程的取消槽，不挂起
class CurrentCancel {
public:
  constexpr bool await_ready() const noexcept { return false; }

  template <typename Promise>
  bool await_suspend(std::coroutine_handle<Promise> handle) {
    _cancel = handle.promise().cancel_data();
    return false;
  }

  auto await_resume() noexcept -> std::shared_ptr<Cancel> {
    return std::move(_cancel);
  }

private:
  std::shared_ptr<Cancel> _cancel{nullptr};
};

template <typename Source>
  requires is_event_source<Source>
[[nodiscard]]
inline auto yield_with(Source &source) {
  return YieldWith<Source>{source};
}

[[nodiscard]]
inline auto current_cancel() {
  return CurrentCancel{};
}

} // namespace selio::coroutine::detail

#endif // SELIO_DETAIL_COROUTINE_YIELD_HPP
