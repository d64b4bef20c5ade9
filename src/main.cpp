#include "client/client.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "network/server.hpp"

#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>

namespace {

int run_server(const memkv::Config& cfg) {
    std::error_code ec;
    try {
        memkv::network::Server server{cfg.endpoint.host, cfg.endpoint.port,
                                      cfg.max_connections};
        ec = server.run();
    } catch (const boost::system::system_error& e) {
        spdlog::critical("failed to listen on {}: {}", cfg.address, e.what());
        return 1;
    }

    if (ec) {
        spdlog::critical("server stopped: {}", ec.message());
        return 1;
    }
    spdlog::info("memkv stopped");
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    memkv::Config cfg;
    try {
        cfg = memkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    memkv::init_default_logger(memkv::parse_log_level(cfg.log_level));

    // ── Dispatch on mode ─────────────────────────────────────────────────────
    if (cfg.mode == "server") {
        return run_server(cfg);
    }
    if (cfg.mode == "client") {
        return memkv::client::run_client(cfg);
    }

    spdlog::warn("unknown mode '{}', valid values are: 'server', 'client'", cfg.mode);
    return 0;
}
