#include "client/client.hpp"
#include "network/framing.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

namespace memkv::client {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

} // anonymous namespace

asio::awaitable<int> repl(tcp::socket& socket, std::istream& in, std::ostream& out) {
    std::string line;
    while (true) {
        out << "> " << std::flush;

        if (!std::getline(in, line)) {
            out << '\n' << std::flush;
            spdlog::info("disconnecting");
            co_return 0;
        }

        if (is_blank(line)) {
            continue;
        }

        const std::string request = line + "\n";

        auto [wec, _] = co_await asio::async_write(
            socket, asio::buffer(request), use_awaitable);

        if (wec) {
            spdlog::error("send error: {}", wec.message());
            co_return 1;
        }

        // Read the 4-byte length prefix, then exactly that many payload bytes.
        std::array<std::uint8_t, network::frame::kHeaderSize> header{};
        auto [hec, hn] = co_await asio::async_read(
            socket, asio::buffer(header), use_awaitable);

        if (hec) {
            if (hec == asio::error::eof) {
                spdlog::error("server disconnected");
            } else {
                spdlog::error("recv header error: {}", hec.message());
            }
            co_return 1;
        }

        std::uint32_t payload_len = 0;
        if (!network::decode_frame_header(header, payload_len)) {
            spdlog::error("invalid response header");
            co_return 1;
        }

        std::string payload(payload_len, '\0');
        if (payload_len > 0) {
            auto [pec, pn] = co_await asio::async_read(
                socket, asio::buffer(payload), use_awaitable);

            if (pec) {
                spdlog::error("recv payload error: {}", pec.message());
                co_return 1;
            }
        }

        out << "< " << payload << '\n' << std::flush;
    }
}

int run_client(const Config& cfg) {
    spdlog::info("connecting to {}", cfg.address);

    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(cfg.endpoint.host,
                                          std::to_string(cfg.endpoint.port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            spdlog::error("failed to connect to {}: {}", cfg.address, ec.message());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        int exit_code = 1;
        asio::co_spawn(
            ioc,
            repl(socket, std::cin, std::cout),
            [&exit_code](std::exception_ptr ep, int rc) {
                if (ep) {
                    std::rethrow_exception(ep);
                }
                exit_code = rc;
            });
        ioc.run();

        return exit_code;

    } catch (const std::exception& ex) {
        spdlog::error("client: exception: {}", ex.what());
        return 1;
    }
}

} // namespace memkv::client
