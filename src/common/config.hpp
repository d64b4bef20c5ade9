#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace memkv {

// ── Endpoint ──────────────────────────────────────────────────────────────────
// A parsed "host:port" address.

struct Endpoint {
    std::string   host;
    std::uint16_t port = 0;
};

// ── Config ────────────────────────────────────────────────────────────────────
// Process configuration, built once by parse_config() and handed explicitly to
// the server or client entry point.

struct Config {
    std::string mode;                 // "server" or "client"; validated by main()
    std::string address;              // Raw --address value, "host:port"
    Endpoint    endpoint;             // Parsed form of `address`
    std::string log_level;            // spdlog level string
    std::size_t max_connections = 0;  // Admission limit; 0 = unbounded
};

// ── parse_address ─────────────────────────────────────────────────────────────
// Split "host:port" on the last ':'.  An IPv6 host may be written in brackets
// ("[::1]:9090"); the brackets are stripped.  An empty host (":9090") is kept
// empty and means every local interface when listening.  Port 0 asks the
// server for an ephemeral port.
// Throws std::runtime_error on a missing separator, missing or invalid port.

[[nodiscard]] Endpoint parse_address(std::string_view address);

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a Config.
//
// On success: returns a Config with a parsed endpoint.
// On error  : throws std::runtime_error with a human-readable message
//             (including the help text when --help is given).
//
// The mode string is not validated here: an unknown mode is reported by the
// caller as a diagnostic, not as an argument error.

[[nodiscard]] Config parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate an options_description with the memkv options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace memkv
