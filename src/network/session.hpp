#pragma once

#include "network/protocol.hpp"
#include "storage/storage_engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <string>
#include <system_error>

namespace memkv::network {

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects, an I/O error occurs, or the storage engine has shut
// down.  It reads newline-delimited request lines, turns each into one
// StorageEngine request, and writes back exactly one length-prefixed response
// per line.
class Session {
public:
    // `max_value_size` bounds the value of a `set`; longer values are
    // answered with an error and never reach the engine.
    Session(boost::asio::ip::tcp::socket socket,
            StorageEngine& engine,
            std::uint64_t max_value_size = kMaxValueSize);

    // Main coroutine.  Returns when the connection is finished.
    boost::asio::awaitable<void> run();

private:
    // Execute a parsed Command against the engine.  `ec` is set when the
    // engine could not take the request.
    [[nodiscard]] boost::asio::awaitable<Response>
    dispatch(const Command& cmd, std::error_code& ec);

    boost::asio::ip::tcp::socket socket_;
    StorageEngine& engine_;
    std::uint64_t  max_value_size_;
};

} // namespace memkv::network
