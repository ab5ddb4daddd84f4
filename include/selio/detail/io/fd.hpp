#ifndef SELIO_DETAIL_IO_FD_HPP
#define SELIO_DETAIL_IO_FD_HPP

#include "selio/detail/common/error.hpp"
#include "fastlog/fastlog.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace selio::io::detail {

// 独占的文件描述符，析构时同步关闭
class FileDescriptor {
public:
  explicit FileDescriptor(int fd) noexcept : _fd{fd} {}

  ~FileDescriptor() { do_close(); }

  FileDescriptor(FileDescriptor &&other) noexcept
      : _fd{std::exchange(other._fd, -1)} {}

  auto operator=(FileDescriptor &&other) noexcept -> FileDescriptor & {
    if (this != std::addressof(other)) [[likely]] {
      do_close();
      _fd = std::exchange(other._fd, -1);
    }
    return *this;
  }

  FileDescriptor(const FileDescriptor &other) = delete;
  FileDescriptor &operator=(const FileDescriptor &other) = delete;

public:
  [[nodiscard]]
  auto fd() const noexcept -> int {
    return _fd;
  }

  // 交出所有权，调用者负责关闭
  [[nodiscard]]
  auto take_fd() noexcept -> int {
    return std::exchange(_fd, -1);
  }

  [[nodiscard]]
  auto set_nonblocking(bool status) const noexcept -> expected<void> {
    auto flags = ::fcntl(_fd, F_GETFL, 0);
    if (flags == -1) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    if (status) {
      flags |= O_NONBLOCK;
    } else {
      flags &= ~O_NONBLOCK;
    }
    if (::fcntl(_fd, F_SETFL, flags) == -1) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

  // 立即关闭，之后 fd() 返回 -1
  auto close() noexcept -> expected<void> {
    if (_fd < 0) {
      return {};
    }
    if (::close(std::exchange(_fd, -1)) == -1) [[unlikely]] {
      return std::unexpected{make_error(errno)};
    }
    return {};
  }

private:
  void do_close() noexcept {
    if (auto ret = close(); !ret) {
      fastlog::console.error("close fd failed, {}", ret.error());
    }
  }

protected:
  int _fd;
};

} // namespace selio::io::detail

#endif // SELIO_DETAIL_IO_FD_HPP
