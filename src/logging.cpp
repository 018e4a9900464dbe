// =============================================================================
// logging.cpp - spdlog setup for the codec library
// =============================================================================

#include "stableswap/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stableswap {
namespace logging {

namespace {

constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> create() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    log->set_level(spdlog::level::info);
    log->set_pattern(PATTERN);
    spdlog::register_logger(log);
    return log;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create();
    return instance;
}

void init(const std::string& level) {
    auto log = logger();
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
        log->warn("unknown log level '{}', using info", level);
    }
    log->set_level(parsed);
    log->set_pattern(PATTERN);
    log->debug("log level set to '{}'", spdlog::level::to_string_view(parsed));
}

} // namespace logging
} // namespace stableswap
