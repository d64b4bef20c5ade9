#pragma once

#include "common/config.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iosfwd>

namespace memkv::client {

// Interactive loop over an already connected socket.
//
// For each non-blank line read from `in`: print the "> " prompt to `out`, send
// the line (newline-terminated), read one length-prefixed response and print
// it as "< <payload>".  End of input prints a newline and finishes.
//
// Returns the process exit code: 0 on end of input, 1 on a socket error or
// server disconnect.
[[nodiscard]] boost::asio::awaitable<int>
repl(boost::asio::ip::tcp::socket& socket, std::istream& in, std::ostream& out);

// Connect to cfg.endpoint and run repl() over stdin / stdout.
// Returns the process exit code.
[[nodiscard]] int run_client(const Config& cfg);

} // namespace memkv::client
