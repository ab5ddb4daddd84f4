#ifndef SELIO_DETAIL_COMMON_ERROR_HPP
#define SELIO_DETAIL_COMMON_ERROR_HPP

#include <cstring>
#include <expected>
#include <format>
#include <string_view>

namespace selio {

// 错误类
// 0-999 为系统 errno，1000 起为库自定义错误码
class Error {
public:
  enum ErrorCode {
    EmptySqe = 1000,
    InvalidAddresses,
    UnexpectedEOF,
    WriteZero,
    Canceled,  // 协程被取消
    NoRuntime, // 当前线程不属于任何运行时
  };

public:
  explicit Error(int err_code) : err_code_{err_code} {}

public:
  [[nodiscard]]
  auto value() const noexcept -> int {
    return err_code_;
  }

  [[nodiscard]]
  auto message() const noexcept -> std::string_view {
    switch (err_code_) {
    case EmptySqe:
      return "No sqe is available";
    case InvalidAddresses:
      return "Invalid addresses";
    case UnexpectedEOF:
      return "Read EOF too early";
    case WriteZero:
      return "Write return zero";
    case Canceled:
      return "Coroutine has been canceled";
    case NoRuntime:
      return "No runtime is running on this thread";
    default:
      return strerror(err_code_);
    }
  }

  [[nodiscard]]
  auto is_canceled() const noexcept -> bool {
    return err_code_ == Canceled;
  }

  [[nodiscard]]
  auto is_timeout() const noexcept -> bool {
    return err_code_ == ETIMEDOUT;
  }

  friend auto operator==(const Error &lhs, const Error &rhs) noexcept -> bool {
    return lhs.err_code_ == rhs.err_code_;
  }

private:
  int err_code_;
};

[[nodiscard]]
inline auto make_error(int err) -> Error {
  return Error{err};
}

template <typename T> using expected = std::expected<T, Error>;

} // namespace selio

namespace std {

template <> class formatter<selio::Error> {
public:
  constexpr auto parse(format_parse_context &context) {
    auto it{context.begin()};
    auto end{context.end()};
    if (it == end || *it == '}') {
      return it;
    }
    ++it;
    if (it != end && *it != '}') {
      throw format_error("Invalid format specifier for Error");
    }
    return it;
  }

  auto format(const selio::Error &error, auto &context) const noexcept {
    return format_to(context.out(), "{} (error {})", error.message(),
                     error.value());
  }
};

} // namespace std
#endif // SELIO_DETAIL_COMMON_ERROR_HPP
