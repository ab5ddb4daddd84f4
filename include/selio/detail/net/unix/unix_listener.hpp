#ifndef SELIO_DETAIL_NET_UNIX_UNIX_LISTENER_HPP
#define SELIO_DETAIL_NET_UNIX_UNIX_LISTENER_HPP

#include "selio/detail/net/common/base_listener.hpp"
#include "selio/detail/net/unix/unix_stream.hpp"

namespace selio::net::detail {

// 不会删除绑定的路径文件，由调用者负责
class UnixListener
    : public BaseListener<UnixListener, UnixStream, UnixSocketAddr> {
public:
  explicit UnixListener(io::detail::CoIo &&io) : BaseListener{std::move(io)} {}
};

} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_UNIX_UNIX_LISTENER_HPP
