#ifndef SELIO_DETAIL_NET_HPP
#define SELIO_DETAIL_NET_HPP
#include "selio/detail/net/common/address.hpp"
#include "selio/detail/net/common/stream_connect.hpp"
#include "selio/detail/net/tcp/tcp_listener.hpp"
#include "selio/detail/net/tcp/tcp_stream.hpp"
#include "selio/detail/net/unix/unix_listener.hpp"
#include "selio/detail/net/unix/unix_stream.hpp"

namespace selio::net {
using SocketAddr = detail::SocketAddr;
using UnixSocketAddr = detail::UnixSocketAddr;
using TcpListener = detail::TcpListener;
using TcpStream = detail::TcpStream;
using TcpStreamConnect = detail::TcpStreamConnect;
using UnixListener = detail::UnixListener;
using UnixStream = detail::UnixStream;
using UnixStreamConnect = detail::UnixStreamConnect;
} // namespace selio::net

#endif // SELIO_DETAIL_NET_HPP
