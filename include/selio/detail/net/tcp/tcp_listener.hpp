#ifndef SELIO_DETAIL_NET_TCP_TCP_LISTENER_HPP
#define SELIO_DETAIL_NET_TCP_TCP_LISTENER_HPP

#include "selio/detail/net/common/base_listener.hpp"
#include "selio/detail/net/tcp/tcp_stream.hpp"

namespace selio::net::detail {

class TcpListener : public BaseListener<TcpListener, TcpStream, SocketAddr> {
public:
  explicit TcpListener(io::detail::CoIo &&io) : BaseListener{std::move(io)} {}
};

} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_TCP_TCP_LISTENER_HPP
