#include "network/protocol.hpp"

#include <format>
#include <string>
#include <utility>

namespace memkv::network {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

// Split `line` on the first space, returning {head, rest}.
// If there is no space, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    const auto pos = line.find(' ');
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), line.substr(pos + 1)};
}

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line,
                                               std::uint64_t max_value_size) {
    line = trim(line);

    auto [verb, rest] = split_once(line);

    if (verb != "set" && verb != "get" && verb != "del") {
        return ErrorResp{std::format("unknown command '{}'", verb)};
    }

    if (rest.empty()) {
        return ErrorResp{std::format("parse error: '{}' requires an argument", verb)};
    }

    // ── get key ───────────────────────────────────────────────────────────────
    //
    // The key is the whole remainder.
    if (verb == "get") {
        return GetCmd{std::string(rest)};
    }

    // ── del key ───────────────────────────────────────────────────────────────
    if (verb == "del") {
        return DelCmd{std::string(rest)};
    }

    // ── set key value ─────────────────────────────────────────────────────────
    //
    // The value is everything after "set <key> "; it may contain spaces.
    auto [key, value] = split_once(rest);
    if (value.empty()) {
        return ErrorResp{"parse error: 'set' requires a key and a value"};
    }
    if (value.size() > max_value_size) {
        return ErrorResp{std::format(
            "value is too long, max allowed length is {} bytes", max_value_size)};
    }
    return SetCmd{std::string(key), std::string(value)};
}

// ── format_response ───────────────────────────────────────────────────────────

std::string format_response(const Response& response) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, OkResp>) {
                return "ok";
            } else if constexpr (std::is_same_v<T, NotFoundResp>) {
                return "not found";
            } else if constexpr (std::is_same_v<T, ValueResp>) {
                std::string payload;
                payload.reserve(kFoundPrefix.size() + r.value.size());
                payload.append(kFoundPrefix);
                payload.append(r.value);
                return payload;
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                return r.message;
            }
        },
        response);
}

} // namespace memkv::network
