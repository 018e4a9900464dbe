#ifndef STABLESWAP_STATE_HPP
#define STABLESWAP_STATE_HPP

#include "stableswap/types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stableswap {

// =============================================================================
// Fee and Reward Schedules
// =============================================================================

// Numerator/denominator pairs. Denominators must be non-zero before the
// remote program divides by them; numerator <= denominator is a convention
// only and is not enforced here.
struct FeeSchedule {
    uint64_t admin_trade_fee_numerator = 0;
    uint64_t admin_trade_fee_denominator = 0;
    uint64_t admin_withdraw_fee_numerator = 0;
    uint64_t admin_withdraw_fee_denominator = 0;
    uint64_t trade_fee_numerator = 0;
    uint64_t trade_fee_denominator = 0;
    uint64_t withdraw_fee_numerator = 0;
    uint64_t withdraw_fee_denominator = 0;

    // True when every denominator is non-zero
    bool has_valid_denominators() const;

    bool operator==(const FeeSchedule& other) const;
    bool operator!=(const FeeSchedule& other) const { return !(*this == other); }
};

struct RewardSchedule {
    uint64_t trade_reward_numerator = 0;
    uint64_t trade_reward_denominator = 0;
    uint64_t trade_reward_cap = 0;

    bool has_valid_denominators() const { return trade_reward_denominator != 0; }

    bool operator==(const RewardSchedule& other) const;
    bool operator!=(const RewardSchedule& other) const { return !(*this == other); }
};

constexpr uint64_t DEFAULT_FEE_NUMERATOR = 0;
constexpr uint64_t DEFAULT_FEE_DENOMINATOR = 1000;

constexpr FeeSchedule DEFAULT_FEES{
    DEFAULT_FEE_NUMERATOR, DEFAULT_FEE_DENOMINATOR,  // admin trade
    DEFAULT_FEE_NUMERATOR, DEFAULT_FEE_DENOMINATOR,  // admin withdraw
    1, 4,                                            // trade
    DEFAULT_FEE_NUMERATOR, DEFAULT_FEE_DENOMINATOR,  // withdraw
};

constexpr RewardSchedule DEFAULT_REWARDS{1, 1000, 100};

constexpr uint64_t DEFAULT_AMP_FACTOR = 100;
constexpr uint64_t TWAP_OPEN = 1;

// =============================================================================
// Oracle Snapshot (written by the remote program, decoded here)
// =============================================================================

struct OracleSnapshot {
    uint32_t period = 0;
    PublicKey token0;
    PublicKey token1;
    U256 price0_cumulative;
    U256 price1_cumulative;
    uint64_t block_timestamp = 0;
    U256 price0_average;
    U256 price1_average;

    bool operator==(const OracleSnapshot& other) const;
    bool operator!=(const OracleSnapshot& other) const { return !(*this == other); }
};

// =============================================================================
// Pool Configuration (singleton "config info" account)
// =============================================================================

struct PoolConfig {
    uint8_t is_initialized = 0;
    uint8_t is_paused = 0;
    uint64_t amp_factor = 0;
    int64_t future_admin_deadline = 0;
    PublicKey future_admin_key;
    PublicKey admin_key;
    PublicKey reward_mint;
    FeeSchedule fees;
    RewardSchedule rewards;

    bool initialized() const { return is_initialized != 0; }
    bool paused() const { return is_paused != 0; }

    bool operator==(const PoolConfig& other) const;
    bool operator!=(const PoolConfig& other) const { return !(*this == other); }
};

// =============================================================================
// Pool State (per-pool "stable swap" account)
// =============================================================================

struct PoolState {
    uint8_t is_initialized = 0;
    uint8_t is_paused = 0;
    uint8_t nonce = 0;
    uint64_t initial_amp_factor = 0;
    uint64_t target_amp_factor = 0;
    int64_t start_ramp_ts = 0;
    int64_t stop_ramp_ts = 0;

    PublicKey token_account_a;
    PublicKey token_account_b;
    PublicKey reward_token_account;
    PublicKey pool_mint;
    PublicKey mint_a;
    PublicKey mint_b;
    PublicKey reward_mint;
    PublicKey admin_fee_account_a;
    PublicKey admin_fee_account_b;

    FeeSchedule fees;
    OracleSnapshot oracle;
    RewardSchedule rewards;

    // Curve parameters: slope, mid price, market state
    FixedU64 k;
    FixedU64 l;
    uint8_t r = 0;

    FixedU64 base_target;
    FixedU64 quote_target;
    FixedU64 base_reserve;
    FixedU64 quote_reserve;

    uint64_t is_open_twap = 0;
    uint64_t block_timestamp = 0;

    FixedU64 base_price_cumulative;
    FixedU64 receive_amount;
    FixedU64 base_balance;
    FixedU64 quote_balance;

    bool initialized() const { return is_initialized != 0; }
    bool paused() const { return is_paused != 0; }
    bool twap_open() const { return is_open_twap == TWAP_OPEN; }

    bool operator==(const PoolState& other) const;
    bool operator!=(const PoolState& other) const { return !(*this == other); }
};

// =============================================================================
// Liquidity Provider (per-user position book)
// =============================================================================

constexpr size_t MAX_LIQUIDITY_POSITIONS = 10;
constexpr int64_t MIN_CLAIM_PERIOD = 2592000;  // 30 days, seconds

struct LiquidityPosition {
    PublicKey pool;
    uint64_t liquidity_amount = 0;
    uint64_t rewards_owed = 0;
    uint64_t rewards_estimated = 0;
    uint64_t cumulative_interest = 0;
    int64_t last_update_ts = 0;
    int64_t next_claim_ts = 0;

    bool operator==(const LiquidityPosition& other) const;
    bool operator!=(const LiquidityPosition& other) const { return !(*this == other); }
};

// All MAX_LIQUIDITY_POSITIONS slots are stored; only the first positions_len
// are live. Slots past that are whatever bytes the account holds.
struct LiquidityProvider {
    uint8_t is_initialized = 0;
    PublicKey owner;
    uint8_t positions_len = 0;
    std::array<LiquidityPosition, MAX_LIQUIDITY_POSITIONS> positions{};

    bool initialized() const { return is_initialized != 0; }

    // Copies of the live slots. Throws StructuralError if positions_len
    // exceeds MAX_LIQUIDITY_POSITIONS.
    std::vector<LiquidityPosition> active_positions() const;

    // Live position for pool, or nullptr
    const LiquidityPosition* find_position(const PublicKey& pool) const;

    bool operator==(const LiquidityProvider& other) const;
    bool operator!=(const LiquidityProvider& other) const { return !(*this == other); }
};

// =============================================================================
// Farm State (two candidate shapes; the caller names the version)
// =============================================================================

enum class FarmLayoutVersion : uint8_t {
    V1 = 1,  // swap-shaped: amp factors, ramp, paired token accounts
    V2 = 2,  // pool-shaped: farm base, pool token account, reward mint
};

std::string to_string(FarmLayoutVersion version);

// Accepts "v1" / "v2" (case-insensitive). Throws StructuralError otherwise.
FarmLayoutVersion farm_layout_version_from_string(std::string_view text);

struct FarmStateV1 {
    uint8_t is_initialized = 0;
    uint8_t is_paused = 0;
    uint8_t nonce = 0;
    uint64_t initial_amp_factor = 0;
    uint64_t target_amp_factor = 0;
    int64_t start_ramp_ts = 0;
    int64_t stop_ramp_ts = 0;
    int64_t future_admin_deadline = 0;
    PublicKey future_admin_account;
    PublicKey admin_account;
    PublicKey token_account_a;
    PublicKey token_account_b;
    PublicKey token_pool;
    PublicKey mint_a;
    PublicKey mint_b;
    PublicKey admin_fee_account_a;
    PublicKey admin_fee_account_b;
    FeeSchedule fees;

    bool operator==(const FarmStateV1& other) const;
    bool operator!=(const FarmStateV1& other) const { return !(*this == other); }
};

struct FarmStateV2 {
    uint8_t is_initialized = 0;
    uint8_t is_paused = 0;
    uint8_t nonce = 0;
    PublicKey farm_base;
    PublicKey admin_account;
    PublicKey admin_fee_account_pool;
    PublicKey token_account_pool;
    PublicKey reward_mint;
    PublicKey pool_mint;
    FeeSchedule fees;

    bool operator==(const FarmStateV2& other) const;
    bool operator!=(const FarmStateV2& other) const { return !(*this == other); }
};

using FarmState = std::variant<FarmStateV1, FarmStateV2>;

FarmLayoutVersion version_of(const FarmState& state);
bool is_initialized(const FarmState& state);
const FeeSchedule& fees_of(const FarmState& state);
const PublicKey& admin_of(const FarmState& state);

} // namespace stableswap

#endif // STABLESWAP_STATE_HPP
