#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <variant>

namespace memkv {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single client request line.  Each command type is
// a plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct SetCmd {
    std::string key;
    std::string value;
};

struct GetCmd {
    std::string key;
};

struct DelCmd {
    std::string key;
};

using Command = std::variant<SetCmd, GetCmd, DelCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

struct OkResp {};
struct NotFoundResp {};

struct ValueResp {
    std::string value;
};

struct ErrorResp {
    std::string message;
};

using Response = std::variant<OkResp, NotFoundResp, ValueResp, ErrorResp>;

// ── Protocol ──────────────────────────────────────────────────────────────────

namespace network {

// Prefix of the payload that answers a successful GET.
inline constexpr std::string_view kFoundPrefix = "found: ";

// Largest value a SET may carry.  The response frame length is a uint32 and a
// GET answers with kFoundPrefix followed by the value, so both must fit.
inline constexpr std::uint64_t kMaxValueSize =
    std::numeric_limits<std::uint32_t>::max() - kFoundPrefix.size();

// Stateless helper: parse one request line (with or without the trailing
// '\n') into a Command.  Surrounding whitespace is ignored.
//
// Returns an ErrorResp on malformed input, an unknown command token, or a SET
// value longer than `max_value_size`, so callers can serialize the error
// straight back to the client.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(
    std::string_view line, std::uint64_t max_value_size = kMaxValueSize);

// Render a Response as its payload text (no framing, no newline).
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string format_response(const Response& response);

} // namespace network
} // namespace memkv
