#include "fcorr/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fcorr::log {

namespace {

spdlog::level::level_enum to_spdlog(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::warn;
    }
}

} // namespace

std::optional<Level> parse_level(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error" || lower == "err") return Level::Error;
    if (lower == "off") return Level::Off;
    return std::nullopt;
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
        default: return "warn";
    }
}

void init(Level level) {
    // stdout carries reports; diagnostics go to stderr
    auto logger = spdlog::get("fcorr");
    if (!logger) logger = spdlog::stderr_color_mt("fcorr");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_default_logger(logger);

    if (const char* env = std::getenv("FCORR_LOG_LEVEL")) {
        if (auto parsed = parse_level(env)) {
            level = *parsed;
        } else {
            spdlog::warn("ignoring invalid FCORR_LOG_LEVEL '{}'", env);
        }
    }
    set_level(level);
}

void set_level(Level level) {
    spdlog::set_level(to_spdlog(level));
}

} // namespace fcorr::log
