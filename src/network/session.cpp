#include "network/session.hpp"
#include "network/framing.hpp"
#include "network/protocol.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace memkv::network {

namespace {
constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

constexpr const char* kEngineUnavailable = "storage engine unavailable";
} // namespace

Session::Session(boost::asio::ip::tcp::socket socket,
                 StorageEngine& engine,
                 std::uint64_t max_value_size)
    : socket_(std::move(socket)), engine_(engine), max_value_size_(max_value_size) {}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::info("serving {}", remote);

    std::string buf;
    buf.reserve(256);

    for (;;) {
        // Read one newline-delimited line.
        auto [ec, n] = co_await boost::asio::async_read_until(
            socket_, boost::asio::dynamic_buffer(buf), '\n', use_awaitable);

        if (ec) {
            if (ec == boost::asio::error::eof) {
                spdlog::info("disconnecting {}", remote);
            } else {
                spdlog::warn("disconnecting {} due to error: {}", remote, ec.message());
            }
            break;
        }

        const std::string line = buf.substr(0, n - 1); // strip the '\n'
        buf.erase(0, n);

        spdlog::debug("Session {}: recv '{}'", remote, line);

        auto parse_result = parse_command(line, max_value_size_);

        Response response;
        std::error_code engine_ec;
        if (std::holds_alternative<ErrorResp>(parse_result)) {
            response = std::move(std::get<ErrorResp>(parse_result));
        } else {
            response = co_await dispatch(std::get<Command>(parse_result), engine_ec);
        }

        const std::string payload = format_response(response);
        spdlog::debug("Session {}: send '{}'", remote, payload);

        auto [wec, _] = co_await boost::asio::async_write(
            socket_, boost::asio::buffer(encode_frame(payload)), use_awaitable);

        if (wec) {
            spdlog::warn("disconnecting {} due to failure while sending a message: {}",
                         remote, wec.message());
            break;
        }

        if (engine_ec) {
            spdlog::warn("disconnecting {}: storage engine unavailable ({})",
                         remote, engine_ec.message());
            break;
        }
    }

    boost::system::error_code close_ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, close_ec);
    socket_.close(close_ec);
}

boost::asio::awaitable<Response> Session::dispatch(const Command& cmd,
                                                   std::error_code& ec) {
    co_return co_await std::visit(
        [&](const auto& c) -> boost::asio::awaitable<Response> {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, SetCmd>) {
                ec = co_await engine_.set(c.key, c.value);
                if (ec) {
                    co_return ErrorResp{kEngineUnavailable};
                }
                co_return OkResp{};

            } else if constexpr (std::is_same_v<T, GetCmd>) {
                auto [get_ec, value] = co_await engine_.get(c.key);
                ec = get_ec;
                if (ec) {
                    co_return ErrorResp{kEngineUnavailable};
                }
                if (!value.has_value()) {
                    co_return NotFoundResp{};
                }
                co_return ValueResp{std::move(*value)};

            } else if constexpr (std::is_same_v<T, DelCmd>) {
                ec = co_await engine_.del(c.key);
                if (ec) {
                    co_return ErrorResp{kEngineUnavailable};
                }
                co_return OkResp{};
            }
        },
        cmd);
}

} // namespace memkv::network
