#ifndef NETCONN_NETCONN_HPP
#define NETCONN_NETCONN_HPP

// Main include header for the netconn library

#include "netconn/channel.hpp"
#include "netconn/conn.hpp"
#include "netconn/dialer.hpp"
#include "netconn/errors.hpp"
#include "netconn/listener.hpp"
#include "netconn/proxy_url.hpp"
#include "netconn/stream.hpp"
#include "netconn/tcp.hpp"
#include "netconn/types.hpp"

#endif  // NETCONN_NETCONN_HPP
