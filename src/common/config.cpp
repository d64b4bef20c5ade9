#include "common/config.hpp"

#include <charconv>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace memkv {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Parse an unsigned integer from string_view.
// Returns the value or throws std::runtime_error on failure.
template <typename T>
[[nodiscard]] T parse_uint(std::string_view sv, std::string_view field_name) {
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(
            std::format("Invalid integer for {}: '{}'", field_name, sv));
    }
    return value;
}

} // anonymous namespace

// ── parse_address ─────────────────────────────────────────────────────────────

Endpoint parse_address(std::string_view address) {
    const auto colon = address.rfind(':');
    if (colon == std::string_view::npos) {
        throw std::runtime_error(
            std::format("Malformed address (expected host:port): '{}'", address));
    }

    std::string_view host = address.substr(0, colon);
    const std::string_view port_sv = address.substr(colon + 1);

    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    Endpoint ep;
    ep.host = std::string(host);
    ep.port = parse_uint<std::uint16_t>(port_sv, "address port");
    return ep;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("mode",
            po::value<std::string>()->default_value(""),
            "Either 'server' or 'client'")
        ("address",
            po::value<std::string>()->default_value("127.0.0.1:9090"),
            "host:port to listen on (server mode) or to connect to (client mode)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical")
        ("max-connections",
            po::value<std::size_t>()->default_value(0),
            "Maximum concurrently served connections (0 = unlimited)");
}

// ── parse_config ──────────────────────────────────────────────────────────────

Config parse_config(int argc, char* argv[]) {
    po::options_description desc("memkv options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    Config cfg;
    cfg.mode            = vm["mode"].as<std::string>();
    cfg.address         = vm["address"].as<std::string>();
    cfg.log_level       = vm["log-level"].as<std::string>();
    cfg.max_connections = vm["max-connections"].as<std::size_t>();
    cfg.endpoint        = parse_address(cfg.address);
    return cfg;
}

} // namespace memkv
