#ifndef SELIO_DETAIL_NET_UNIX_UNIX_STREAM_HPP
#define SELIO_DETAIL_NET_UNIX_UNIX_STREAM_HPP

#include "selio/detail/net/common/address.hpp"
#include "selio/detail/net/common/base_stream.hpp"

namespace selio::net::detail {

class UnixStream : public BaseStream<UnixStream, UnixSocketAddr> {
public:
  explicit UnixStream(io::detail::CoIo &&io) : BaseStream{std::move(io)} {}
};

using UnixStreamConnect = BasicStreamConnect<UnixStream, UnixSocketAddr>;

} // namespace selio::net::detail
#endif // SELIO_DETAIL_NET_UNIX_UNIX_STREAM_HPP
