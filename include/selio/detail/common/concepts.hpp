#ifndef SELIO_DETAIL_COMMON_CONCEPTS_HPP
#define SELIO_DETAIL_COMMON_CONCEPTS_HPP
#include <concepts>
#include <coroutine>
#include <string>
#include <sys/socket.h>

namespace selio {

namespace coroutine::detail {
class Cancel;
}

template <typename Addr>
concept is_socket_address = requires(Addr addr, const Addr caddr) {
  { addr.sockaddr() } noexcept -> std::same_as<struct sockaddr *>;
  { caddr.sockaddr() } noexcept -> std::same_as<const struct sockaddr *>;
  { caddr.length() } noexcept -> std::same_as<socklen_t>;
  { caddr.family() } noexcept -> std::same_as<sa_family_t>;
  { caddr.to_string() } -> std::same_as<std::string>;
};

// 事件源：描述挂起的协程在什么条件下被恢复
// subscribe 在协程挂起之前被调用，负责把协程句柄交给会唤醒它的一方
template <typename Source>
concept is_event_source =
    requires(Source source, std::coroutine_handle<> handle,
             coroutine::detail::Cancel &cancel) {
      { source.subscribe(handle, cancel) } -> std::same_as<void>;
    };

} // namespace selio
#endif // SELIO_DETAIL_COMMON_CONCEPTS_HPP
