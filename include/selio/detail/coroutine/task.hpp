#ifndef SELIO_DETAIL_COROUTINE_TASK_HPP
#define SELIO_DETAIL_COROUTINE_TASK_HPP
#include "selio/detail/common/util/noncopyable.hpp"
#include "selio/detail/coroutine/cancel.hpp"
#include "fastlog/fastlog.hpp"
#include <coroutine>
#include <exception>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

/*
task 的行为约定：
1. 创建后初始挂起，直到被 co_await 或者被投递到运行时才开始执行。
2. 结束时挂起自己：有调用者就把执行权交还调用者；
   没有调用者(顶层协程)时，如果带着异常结束则报告并终止程序，否则销毁协程帧。
3. co_await 一个 task 时，被等待的 task 继承调用者的取消槽，
   这样整条 co_await 链上的任意一层挂起都能被同一个 CancelHandle 取消。
4. 调用者恢复时从被等待的 task 取走结果，异常在这里重新抛出。
*/

namespace selio {
template <typename T> class task;

namespace detail {

struct base_task_promise {

  // 完成回调：协程结束时调用（用于 block_on 追踪 spawn 出去的子协程）
  using completion_callback_t = void (*)(void *);
  completion_callback_t _on_complete{nullptr};
  void *_on_complete_arg{nullptr};

  struct final_awaiter {
    constexpr bool await_ready() const noexcept { return false; }

    template <typename T>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<T> callee) const noexcept {
      if (callee.promise()._on_complete) {
        callee.promise()._on_complete(callee.promise()._on_complete_arg);
      }

      if (callee.promise()._caller) {
        return callee.promise()._caller;
      }
      if (callee.promise()._exception != nullptr) {
        try {
          std::rethrow_exception(callee.promise()._exception);
        } catch (const std::exception &ex) {
          std::cerr << std::format("catch a exception: {}\n", ex.what());
          std::terminate();
        } catch (...) {
          std::cerr << "catch a unknown exception\n";
          std::terminate();
        }
      }
      // 顶层协程没有人再来取结果，在这里回收协程帧
      callee.destroy();
      return std::noop_coroutine();
    }

    constexpr void await_resume() const noexcept {}
  };

  constexpr std::suspend_always initial_suspend() const noexcept { return {}; }
  constexpr final_awaiter final_suspend() const noexcept { return {}; }

  void unhandled_exception() noexcept {
    _exception = std::current_exception();
  }

  // 取消槽，第一次使用时创建
  auto cancel_data() -> const std::shared_ptr<coroutine::detail::Cancel> & {
    if (_cancel == nullptr) {
      _cancel = std::make_shared<coroutine::detail::Cancel>();
    }
    return _cancel;
  }

  // 被 co_await 时继承调用者的取消槽，已经有取消槽(例如外部拿过 CancelHandle)则保留
  void inherit_cancel(base_task_promise &caller) {
    if (_cancel == nullptr) {
      _cancel = caller.cancel_data();
    }
  }

  std::coroutine_handle<> _caller{nullptr}; // 调用者协程句柄
  std::exception_ptr _exception{nullptr};   // 异常
  std::shared_ptr<coroutine::detail::Cancel> _cancel{nullptr}; // 取消槽
};

template <typename T> class task_promise : public base_task_promise {
public:
  task<T> get_return_object() noexcept;

  template <typename U>
    requires std::is_convertible_v<U &&, T> && std::is_constructible_v<T, U &&>
  void return_value(U &&value) {
    _value.emplace(std::forward<U>(value));
  }

  auto expected() & -> T & {
    if (_exception != nullptr) {
      std::rethrow_exception(_exception);
    }
    return _value.value();
  }

  auto expected() && -> T && {
    if (_exception != nullptr) {
      std::rethrow_exception(_exception);
    }
    return std::move(_value.value());
  }

private:
  std::optional<T> _value{std::nullopt};
};

template <> struct task_promise<void> final : public base_task_promise {
  task<void> get_return_object() noexcept;

  void return_void() {}

  void expected() {
    if (_exception != nullptr) {
      std::rethrow_exception(_exception);
    }
  }
};

} // namespace detail

template <typename T = void> class task : public util::Noncopyable {
public:
  using promise_type = detail::task_promise<T>;

public:
  task() noexcept = default;

  explicit task(std::coroutine_handle<promise_type> handle) : _handle(handle) {}

  ~task() {
    if (_handle) {
      _handle.destroy();
    }
  }

  task(task &&other) noexcept : _handle(std::exchange(other._handle, nullptr)) {}

  task &operator=(task &&other) noexcept {
    if (std::addressof(other) != this) [[likely]] {
      if (_handle) {
        _handle.destroy();
      }
      _handle = std::exchange(other._handle, nullptr);
    }
    return *this;
  }

  // 只支持右值 co_await，结果被取走后协程帧随即销毁
  auto operator co_await() && noexcept {
    struct awaiter : public base_awaiter {
      using base_awaiter::base_awaiter;

      auto await_resume() {
        if (!this->_callee) {
          fastlog::console.error("handle is nullptr");
          std::terminate();
        }

        if constexpr (std::is_same_v<T, void>) {
          this->_callee.promise().expected();
          this->_callee.destroy();
          this->_callee = nullptr;
          return;
        } else {
          T value = std::move(this->_callee.promise()).expected();
          this->_callee.destroy();
          this->_callee = nullptr;
          return value;
        }
      }
    };

    return awaiter{std::exchange(_handle, nullptr)};
  }

public:
  // 拿走协程句柄，task 不再负责销毁
  std::coroutine_handle<promise_type> take() {
    if (_handle == nullptr) {
      throw std::logic_error("handle is nullptr");
    }
    return std::exchange(_handle, nullptr);
  }

  std::coroutine_handle<promise_type> handle() { return _handle; }

  // 在协程开始运行之前拿到它的取消接口
  [[nodiscard]]
  auto cancel_handle() -> CancelHandle {
    if (_handle == nullptr) {
      throw std::logic_error("handle is nullptr");
    }
    return CancelHandle{_handle.promise().cancel_data()};
  }

private:
  struct base_awaiter {
    std::coroutine_handle<promise_type> _callee;

    base_awaiter(std::coroutine_handle<promise_type> callee) noexcept
        : _callee(callee) {}

    constexpr bool await_ready() const noexcept {
      return !_callee || _callee.done();
    }

    template <typename CallerPromise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<CallerPromise> caller) const {
      _callee.promise()._caller = caller;
      if constexpr (std::is_base_of_v<detail::base_task_promise,
                                      CallerPromise>) {
        _callee.promise().inherit_cancel(caller.promise());
      }
      return _callee;
    }
  };

private:
  std::coroutine_handle<promise_type> _handle{nullptr};
};

template <typename T>
inline auto detail::task_promise<T>::get_return_object() noexcept -> task<T> {
  return task<T>{std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline auto detail::task_promise<void>::get_return_object() noexcept
    -> task<void> {
  return task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

} // namespace selio
#endif // SELIO_DETAIL_COROUTINE_TASK_HPP
