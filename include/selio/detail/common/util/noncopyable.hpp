#ifndef SELIO_DETAIL_COMMON_UTIL_NONCOPYABLE_HPP
#define SELIO_DETAIL_COMMON_UTIL_NONCOPYABLE_HPP

namespace selio::util {

// 禁止拷贝，允许移动
class Noncopyable {
public:
  Noncopyable(const Noncopyable &) = delete;
  Noncopyable &operator=(const Noncopyable &) = delete;

protected:
  Noncopyable() = default;
  Noncopyable(Noncopyable &&) noexcept = default;
  Noncopyable &operator=(Noncopyable &&) noexcept = default;
  ~Noncopyable() noexcept = default;
};

// 禁止拷贝和移动，用于地址必须稳定的对象
class Nonmovable {
public:
  Nonmovable(const Nonmovable &) = delete;
  Nonmovable &operator=(const Nonmovable &) = delete;
  Nonmovable(Nonmovable &&) = delete;
  Nonmovable &operator=(Nonmovable &&) = delete;

protected:
  Nonmovable() = default;
  ~Nonmovable() noexcept = default;
};

} // namespace selio::util
#endif // SELIO_DETAIL_COMMON_UTIL_NONCOPYABLE_HPP
