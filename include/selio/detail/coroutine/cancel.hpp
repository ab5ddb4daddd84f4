#ifndef SELIO_DETAIL_COROUTINE_CANCEL_HPP
#define SELIO_DETAIL_COROUTINE_CANCEL_HPP

#include "selio/detail/common/error.hpp"
#include "selio/detail/common/util/noncopyable.hpp"
#include "selio/detail/io/selector/io_data.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace selio::coroutine::detail {

// 协程的取消槽
//
// 协程挂起在某个注册记录上时，槽里保存指向该记录的弱引用，
// 外部取消请求借此找到并唤醒挂起的协程，而不需要持有 connect 对象本身。
// 同一条 co_await 链上的协程共享同一个取消槽。
class Cancel : public util::Nonmovable {
public:
  Cancel() = default;

public:
  [[nodiscard]]
  bool is_canceled() const noexcept {
    return _canceled.load(std::memory_order::acquire);
  }

  // 登记当前挂起所在的注册记录
  void set_io(std::weak_ptr<io::detail::IoData> io) {
    std::lock_guard lock{_mutex};
    _io = std::move(io);
  }

  // 协程恢复后清除登记
  void clear_io() {
    std::lock_guard lock{_mutex};
    _io.reset();
  }

  // 特权操作，只能由调度器的取消接口(CancelHandle)和事件源调用
  // 置位取消标志，如果协程正挂起在某个注册记录上，带 Canceled 错误唤醒它
  void cancel() {
    _canceled.store(true, std::memory_order::release);
    std::shared_ptr<io::detail::IoData> io;
    {
      std::lock_guard lock{_mutex};
      io = _io.lock();
    }
    if (io != nullptr) {
      io->wake_with_error(Error::Canceled);
    }
  }

private:
  std::atomic<bool> _canceled{false};
  std::mutex _mutex;
  std::weak_ptr<io::detail::IoData> _io;
};

} // namespace selio::coroutine::detail

namespace selio {

// 调度器对外暴露的取消接口
class CancelHandle {
public:
  CancelHandle() = default;
  explicit CancelHandle(std::shared_ptr<coroutine::detail::Cancel> cancel)
      : _cancel{std::move(cancel)} {}

public:
  // 请求取消，协程在下一个检查点观察到并以 Error::Canceled 返回
  void cancel() const {
    if (_cancel != nullptr) {
      _cancel->cancel();
    }
  }

  [[nodiscard]]
  bool is_canceled() const noexcept {
    return _cancel != nullptr && _cancel->is_canceled();
  }

  [[nodiscard]]
  bool valid() const noexcept {
    return _cancel != nullptr;
  }

private:
  std::shared_ptr<coroutine::detail::Cancel> _cancel{nullptr};
};

} // namespace selio

#endif // SELIO_DETAIL_COROUTINE_CANCEL_HPP
