#ifndef STABLESWAP_LOGGING_HPP
#define STABLESWAP_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace stableswap {
namespace logging {

constexpr const char* LOGGER_NAME = "stableswap";

// Library logger; created on first use with a colour stdout sink at "info".
std::shared_ptr<spdlog::logger> logger();

// Sets the level ("trace", "debug", "info", "warn", "error", "critical",
// "off") and the output pattern. Unknown names fall back to "info".
void init(const std::string& level);

} // namespace logging
} // namespace stableswap

#endif // STABLESWAP_LOGGING_HPP
