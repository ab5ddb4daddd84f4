#ifndef SELIO_DETAIL_NET_TCP_TCP_STREAM_HPP
#define SELIO_DETAIL_NET_TCP_TCP_STREAM_HPP

#include "selio/detail/net/common/address.hpp"
#include "selio/detail/net/common/base_stream.hpp"
#include "selio/detail/net/common/sockopt.hpp"

namespace selio::net::detail {

class TcpStream : public BaseStream<TcpStream, SocketAddr>,
                  public ImplNodelay<TcpStream> {
public:
  explicit TcpStream(io::detail::CoIo &&io) : BaseStream{std::move(io)} {}
};

using TcpStreamConnect = BasicStreamConnect<TcpStream, SocketAddr>;

} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_TCP_TCP_STREAM_HPP
