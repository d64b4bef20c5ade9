#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace memkv::network {

Server::Server(std::string host,
               std::uint16_t port,
               std::size_t max_connections,
               std::uint64_t max_value_size)
    : host_(std::move(host)),
      port_(port),
      max_connections_(max_connections),
      max_value_size_(max_value_size),
      ioc_(static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      engine_(ioc_),
      acceptor_(ioc_) {
    // Passive resolution: an empty host yields the wildcard address.
    boost::asio::ip::tcp::resolver resolver{ioc_};
    const auto results = resolver.resolve(
        host_, std::to_string(port_),
        boost::asio::ip::tcp::resolver::passive |
            boost::asio::ip::tcp::resolver::numeric_service);
    const boost::asio::ip::tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    port_ = acceptor_.local_endpoint().port();

    spdlog::info("listening {}:{} ({})", host_, port_,
                 acceptor_.local_endpoint().address().to_string());
}

std::error_code Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    engine_.start();

    // Start the accept loop.
    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);

    // Run the io_context across a thread pool.
    const unsigned int nthreads = std::max(1u, std::thread::hardware_concurrency());
    std::vector<std::thread> pool;
    pool.reserve(nthreads - 1);
    for (unsigned int i = 1; i < nthreads; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined");
    return accept_error_;
}

void Server::stop() {
    engine_.stop();

    boost::system::error_code ec;
    acceptor_.close(ec);
    ioc_.stop();
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::debug("Server: accept loop started");

    constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

    for (;;) {
        auto [ec, socket] = co_await acceptor_.async_accept(use_awaitable);

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                // The server has no purpose without its listening socket.
                spdlog::critical("Server: accept error: {}", ec.message());
                accept_error_ = ec;
                stop();
            }
            break;
        }

        if (max_connections_ != 0 &&
            active_.load(std::memory_order_relaxed) >= max_connections_) {
            boost::system::error_code rec;
            const auto ep = socket.remote_endpoint(rec);
            spdlog::warn("Server: connection limit ({}) reached, rejecting {}",
                         max_connections_,
                         rec ? std::string("<unknown>") : ep.address().to_string());
            socket.close(rec);
            continue;
        }

        // Disable Nagle – send responses immediately.
        boost::system::error_code opt_ec;
        socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

        active_.fetch_add(1, std::memory_order_relaxed);

        // Spawn a detached coroutine for this session.
        auto session_ptr = std::make_shared<Session>(std::move(socket), engine_,
                                                    max_value_size_);
        boost::asio::co_spawn(
            ioc_,
            [this, sp = std::move(session_ptr)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
                active_.fetch_sub(1, std::memory_order_relaxed);
            },
            boost::asio::detached);
    }

    spdlog::debug("Server: accept loop exited");
}

} // namespace memkv::network
