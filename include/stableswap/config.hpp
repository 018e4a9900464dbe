#ifndef STABLESWAP_CONFIG_HPP
#define STABLESWAP_CONFIG_HPP

#include "stableswap/state.hpp"
#include "stableswap/types.hpp"
#include <string>
#include <string_view>

namespace stableswap {

// =============================================================================
// Configuration
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

// Remote program identities, base58 in the file
struct ProgramConfig {
    PublicKey swap_program_id;
    PublicKey farm_program_id;
    PublicKey token_program_id = ids::token_program();
};

// Defaults used when building initialize / set-fees / set-rewards payloads
struct PoolDefaults {
    uint64_t amp_factor = DEFAULT_AMP_FACTOR;
    FeeSchedule fees = DEFAULT_FEES;
    RewardSchedule rewards = DEFAULT_REWARDS;
};

struct FarmConfig {
    FarmLayoutVersion layout_version = FarmLayoutVersion::V1;
};

class Config {
public:
    GeneralConfig general;
    ProgramConfig programs;
    PoolDefaults pool;
    FarmConfig farm;

    Config() = default;

    // Load from a TOML file. Throws ConfigError when unreadable.
    static Config from_file(std::string_view path);

    // Load from TOML text. Malformed values throw ConfigError; integers that
    // do not fit their field throw WidthOverflowError.
    static Config from_toml(std::string_view content);

    // Throws ConfigError when the swap program is unset or a fee or reward
    // denominator is zero.
    void validate() const;

    // Builder methods
    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_swap_program(const PublicKey& id) {
        programs.swap_program_id = id;
        return *this;
    }

    Config& with_farm_program(const PublicKey& id) {
        programs.farm_program_id = id;
        return *this;
    }

    Config& with_token_program(const PublicKey& id) {
        programs.token_program_id = id;
        return *this;
    }

    Config& with_amp_factor(uint64_t amp) {
        pool.amp_factor = amp;
        return *this;
    }

    Config& with_fees(const FeeSchedule& fees) {
        pool.fees = fees;
        return *this;
    }

    Config& with_rewards(const RewardSchedule& rewards) {
        pool.rewards = rewards;
        return *this;
    }

    Config& with_farm_layout(FarmLayoutVersion version) {
        farm.layout_version = version;
        return *this;
    }
};

} // namespace stableswap

#endif // STABLESWAP_CONFIG_HPP
