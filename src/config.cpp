// =============================================================================
// config.cpp - TOML configuration loading
// =============================================================================

#include "stableswap/config.hpp"
#include "stableswap/error.hpp"
#include "stableswap/layout.hpp"
#include <fstream>
#include <sstream>

namespace stableswap {

// Simple TOML parser (sections, key = value, # comments, quoted strings)
namespace {

// Longest decimal accepted before narrowing; anything longer overflows u64.
constexpr size_t MAX_INTEGER_DIGITS = 30;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drops a trailing "# comment" outside quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

I128 parse_integer(const std::string& key, const std::string& value) {
    size_t pos = 0;
    bool negative = false;
    if (!value.empty() && (value[0] == '-' || value[0] == '+')) {
        negative = value[0] == '-';
        pos = 1;
    }
    if (pos == value.size()) {
        throw ConfigError(key + ": expected an integer, got '" + value + "'");
    }

    I128 result = 0;
    size_t digits = 0;
    for (; pos < value.size(); ++pos) {
        char c = value[pos];
        if (c == '_') continue;  // TOML digit separator
        if (c < '0' || c > '9') {
            throw ConfigError(key + ": expected an integer, got '" + value + "'");
        }
        if (++digits > MAX_INTEGER_DIGITS) {
            throw WidthOverflowError(key + ": '" + value + "' is too large");
        }
        result = result * 10 + (c - '0');
    }
    return negative ? -result : result;
}

uint64_t parse_u64(const std::string& key, const std::string& value) {
    return layout::U64::narrow(parse_integer(key, value), key.c_str());
}

PublicKey parse_key(const std::string& key, const std::string& value) {
    try {
        return PublicKey::from_base58(value);
    } catch (const StructuralError& e) {
        throw ConfigError(key + ": " + e.what());
    }
}

} // anonymous namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        std::string path = current_section + "." + key;

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
        }
        else if (current_section == "programs") {
            if (key == "swap_program_id") config.programs.swap_program_id = parse_key(path, value);
            else if (key == "farm_program_id") config.programs.farm_program_id = parse_key(path, value);
            else if (key == "token_program_id") config.programs.token_program_id = parse_key(path, value);
        }
        else if (current_section == "pool") {
            if (key == "amp_factor") config.pool.amp_factor = parse_u64(path, value);
        }
        else if (current_section == "fees") {
            auto& fees = config.pool.fees;
            if (key == "admin_trade_fee_numerator") fees.admin_trade_fee_numerator = parse_u64(path, value);
            else if (key == "admin_trade_fee_denominator") fees.admin_trade_fee_denominator = parse_u64(path, value);
            else if (key == "admin_withdraw_fee_numerator") fees.admin_withdraw_fee_numerator = parse_u64(path, value);
            else if (key == "admin_withdraw_fee_denominator") fees.admin_withdraw_fee_denominator = parse_u64(path, value);
            else if (key == "trade_fee_numerator") fees.trade_fee_numerator = parse_u64(path, value);
            else if (key == "trade_fee_denominator") fees.trade_fee_denominator = parse_u64(path, value);
            else if (key == "withdraw_fee_numerator") fees.withdraw_fee_numerator = parse_u64(path, value);
            else if (key == "withdraw_fee_denominator") fees.withdraw_fee_denominator = parse_u64(path, value);
        }
        else if (current_section == "rewards") {
            auto& rewards = config.pool.rewards;
            if (key == "trade_reward_numerator") rewards.trade_reward_numerator = parse_u64(path, value);
            else if (key == "trade_reward_denominator") rewards.trade_reward_denominator = parse_u64(path, value);
            else if (key == "trade_reward_cap") rewards.trade_reward_cap = parse_u64(path, value);
        }
        else if (current_section == "farm") {
            if (key == "layout_version") {
                try {
                    config.farm.layout_version = farm_layout_version_from_string(value);
                } catch (const StructuralError& e) {
                    throw ConfigError(path + ": " + e.what());
                }
            }
        }
    }

    return config;
}

void Config::validate() const {
    if (programs.swap_program_id.is_zero()) {
        throw ConfigError("programs.swap_program_id is not set");
    }
    if (!pool.fees.has_valid_denominators()) {
        throw ConfigError("fees: every denominator must be non-zero");
    }
    if (!pool.rewards.has_valid_denominators()) {
        throw ConfigError("rewards: trade_reward_denominator must be non-zero");
    }
}

} // namespace stableswap
