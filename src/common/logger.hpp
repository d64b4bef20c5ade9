#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace memkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Install the process-wide default logger ("memkv", colored stdout).
// Call once at program start before any logging.  Calling it again only
// updates the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace memkv
