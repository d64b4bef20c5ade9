#pragma once

#include "network/protocol.hpp"
#include "storage/storage_engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace memkv::network {

// Owns the io_context, the TCP acceptor and the StorageEngine.
//
// Usage:
//   Server srv{"127.0.0.1", 9090};
//   auto ec = srv.run();   // blocks until SIGINT/SIGTERM, stop() or a fatal
//                          // accept error
//
// The constructor resolves `host` (a hostname or a literal address; empty
// means every local interface), binds and listens.  A resolve or bind failure
// throws boost::system::system_error.
class Server {
public:
    // `max_connections` limits how many connections are served at once;
    // 0 means unbounded.  `max_value_size` is the longest value a `set`
    // may carry.
    Server(std::string host,
           std::uint16_t port,
           std::size_t max_connections  = 0,
           std::uint64_t max_value_size = kMaxValueSize);

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Starts the storage engine and the thread pool, begins accepting
    // connections, and installs signal handlers for graceful shutdown
    // (SIGINT / SIGTERM).  Blocks until the server stops.
    //
    // Returns the accept error that brought the server down, or an empty
    // error_code after a requested stop.
    [[nodiscard]] std::error_code run();

    // Sends the shutdown signal to the storage engine, closes the acceptor and
    // stops the io_context, causing run() to return.  Safe to call from any
    // thread.
    void stop();

    // Port actually bound (useful when constructed with port 0).
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    // Number of connections currently being served.
    [[nodiscard]] std::size_t active_connections() const noexcept {
        return active_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] StorageEngine& engine() noexcept { return engine_; }

private:
    // Accept loop coroutine – runs until the acceptor is closed or fails.
    boost::asio::awaitable<void> accept_loop();

    std::string   host_;
    std::uint16_t port_;
    std::size_t   max_connections_;
    std::uint64_t max_value_size_;

    boost::asio::io_context        ioc_;
    StorageEngine                  engine_;
    boost::asio::ip::tcp::acceptor acceptor_;

    std::atomic<std::size_t> active_{0};
    std::error_code          accept_error_;
};

} // namespace memkv::network
