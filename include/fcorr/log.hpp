#pragma once

#include <optional>
#include <string>

namespace fcorr::log {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

// Accepts trace, debug, info, warn/warning, error/err, off (case-insensitive)
std::optional<Level> parse_level(const std::string& s);

const char* level_to_string(Level level);

/**
 * Route the default spdlog logger to stderr with the fcorr pattern.
 * FCORR_LOG_LEVEL, when set to a valid level, overrides `level`.
 */
void init(Level level = Level::Warn);

void set_level(Level level);

} // namespace fcorr::log
