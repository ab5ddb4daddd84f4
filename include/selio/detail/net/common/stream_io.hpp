#ifndef SELIO_DETAIL_NET_COMMON_STREAM_IO_HPP
#define SELIO_DETAIL_NET_COMMON_STREAM_IO_HPP

#include "selio/detail/common/error.hpp"
#include "selio/detail/coroutine/task.hpp"
#include <cstddef>
#include <span>

namespace selio::net::detail {

template <class T> struct ImplStreamRead {
  // 读取一次，返回 0 表示对端已经关闭写
  auto read(std::span<char> buf) -> task<expected<std::size_t>> {
    auto self = static_cast<T *>(this);
    return self->co_io().read(buf, self->read_timeout());
  }

  // 保证读满 buf
  task<expected<void>> read_exact(std::span<char> buf) {
    while (!buf.empty()) {
      auto res = co_await this->read(buf);
      if (!res) {
        co_return std::unexpected{res.error()};
      }
      if (res.value() == 0) {
        co_return std::unexpected{Error{Error::UnexpectedEOF}};
      }
      buf = buf.subspan(res.value());
    }
    co_return expected<void>{};
  }
};

template <class T> struct ImplStreamWrite {
  auto write(std::span<const char> buf) -> task<expected<std::size_t>> {
    auto self = static_cast<T *>(this);
    return self->co_io().write(buf, self->write_timeout());
  }

  // 保证写完 buf
  task<expected<void>> write_all(std::span<const char> buf) {
    while (!buf.empty()) {
      auto res = co_await this->write(buf);
      if (!res) {
        co_return std::unexpected{res.error()};
      }
      if (res.value() == 0) {
        co_return std::unexpected{Error{Error::WriteZero}};
      }
      buf = buf.subspan(res.value());
    }
    co_return expected<void>{};
  }
};

} // namespace selio::net::detail

#endif // SELIO_DETAIL_NET_COMMON_STREAM_IO_HPP
