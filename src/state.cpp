// =============================================================================
// state.cpp - Account state value semantics
// =============================================================================

#include "stableswap/state.hpp"
#include "stableswap/error.hpp"
#include <algorithm>
#include <cctype>

namespace stableswap {

// =============================================================================
// Schedules
// =============================================================================

bool FeeSchedule::has_valid_denominators() const {
    return admin_trade_fee_denominator != 0 &&
           admin_withdraw_fee_denominator != 0 &&
           trade_fee_denominator != 0 &&
           withdraw_fee_denominator != 0;
}

bool FeeSchedule::operator==(const FeeSchedule& o) const {
    return admin_trade_fee_numerator == o.admin_trade_fee_numerator &&
           admin_trade_fee_denominator == o.admin_trade_fee_denominator &&
           admin_withdraw_fee_numerator == o.admin_withdraw_fee_numerator &&
           admin_withdraw_fee_denominator == o.admin_withdraw_fee_denominator &&
           trade_fee_numerator == o.trade_fee_numerator &&
           trade_fee_denominator == o.trade_fee_denominator &&
           withdraw_fee_numerator == o.withdraw_fee_numerator &&
           withdraw_fee_denominator == o.withdraw_fee_denominator;
}

bool RewardSchedule::operator==(const RewardSchedule& o) const {
    return trade_reward_numerator == o.trade_reward_numerator &&
           trade_reward_denominator == o.trade_reward_denominator &&
           trade_reward_cap == o.trade_reward_cap;
}

bool OracleSnapshot::operator==(const OracleSnapshot& o) const {
    return period == o.period &&
           token0 == o.token0 &&
           token1 == o.token1 &&
           price0_cumulative == o.price0_cumulative &&
           price1_cumulative == o.price1_cumulative &&
           block_timestamp == o.block_timestamp &&
           price0_average == o.price0_average &&
           price1_average == o.price1_average;
}

// =============================================================================
// Pool Accounts
// =============================================================================

bool PoolConfig::operator==(const PoolConfig& o) const {
    return is_initialized == o.is_initialized &&
           is_paused == o.is_paused &&
           amp_factor == o.amp_factor &&
           future_admin_deadline == o.future_admin_deadline &&
           future_admin_key == o.future_admin_key &&
           admin_key == o.admin_key &&
           reward_mint == o.reward_mint &&
           fees == o.fees &&
           rewards == o.rewards;
}

bool PoolState::operator==(const PoolState& o) const {
    return is_initialized == o.is_initialized &&
           is_paused == o.is_paused &&
           nonce == o.nonce &&
           initial_amp_factor == o.initial_amp_factor &&
           target_amp_factor == o.target_amp_factor &&
           start_ramp_ts == o.start_ramp_ts &&
           stop_ramp_ts == o.stop_ramp_ts &&
           token_account_a == o.token_account_a &&
           token_account_b == o.token_account_b &&
           reward_token_account == o.reward_token_account &&
           pool_mint == o.pool_mint &&
           mint_a == o.mint_a &&
           mint_b == o.mint_b &&
           reward_mint == o.reward_mint &&
           admin_fee_account_a == o.admin_fee_account_a &&
           admin_fee_account_b == o.admin_fee_account_b &&
           fees == o.fees &&
           oracle == o.oracle &&
           rewards == o.rewards &&
           k == o.k &&
           l == o.l &&
           r == o.r &&
           base_target == o.base_target &&
           quote_target == o.quote_target &&
           base_reserve == o.base_reserve &&
           quote_reserve == o.quote_reserve &&
           is_open_twap == o.is_open_twap &&
           block_timestamp == o.block_timestamp &&
           base_price_cumulative == o.base_price_cumulative &&
           receive_amount == o.receive_amount &&
           base_balance == o.base_balance &&
           quote_balance == o.quote_balance;
}

// =============================================================================
// Liquidity Provider
// =============================================================================

bool LiquidityPosition::operator==(const LiquidityPosition& o) const {
    return pool == o.pool &&
           liquidity_amount == o.liquidity_amount &&
           rewards_owed == o.rewards_owed &&
           rewards_estimated == o.rewards_estimated &&
           cumulative_interest == o.cumulative_interest &&
           last_update_ts == o.last_update_ts &&
           next_claim_ts == o.next_claim_ts;
}

std::vector<LiquidityPosition> LiquidityProvider::active_positions() const {
    if (positions_len > MAX_LIQUIDITY_POSITIONS) {
        throw StructuralError("liquidity provider: " + std::to_string(positions_len) +
                              " positions exceeds the maximum of " +
                              std::to_string(MAX_LIQUIDITY_POSITIONS));
    }
    return std::vector<LiquidityPosition>(positions.begin(),
                                          positions.begin() + positions_len);
}

const LiquidityPosition* LiquidityProvider::find_position(const PublicKey& pool) const {
    size_t live = std::min<size_t>(positions_len, MAX_LIQUIDITY_POSITIONS);
    auto end = positions.begin() + live;
    auto it = std::find_if(positions.begin(), end,
                           [&](const LiquidityPosition& p) { return p.pool == pool; });
    return it == end ? nullptr : &*it;
}

bool LiquidityProvider::operator==(const LiquidityProvider& o) const {
    return is_initialized == o.is_initialized &&
           owner == o.owner &&
           positions_len == o.positions_len &&
           positions == o.positions;
}

// =============================================================================
// Farm Accounts
// =============================================================================

std::string to_string(FarmLayoutVersion version) {
    switch (version) {
        case FarmLayoutVersion::V1: return "v1";
        case FarmLayoutVersion::V2: return "v2";
    }
    return "unknown";
}

FarmLayoutVersion farm_layout_version_from_string(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "v1" || lower == "1") return FarmLayoutVersion::V1;
    if (lower == "v2" || lower == "2") return FarmLayoutVersion::V2;
    throw StructuralError("unknown farm layout version '" + std::string(text) + "'");
}

bool FarmStateV1::operator==(const FarmStateV1& o) const {
    return is_initialized == o.is_initialized &&
           is_paused == o.is_paused &&
           nonce == o.nonce &&
           initial_amp_factor == o.initial_amp_factor &&
           target_amp_factor == o.target_amp_factor &&
           start_ramp_ts == o.start_ramp_ts &&
           stop_ramp_ts == o.stop_ramp_ts &&
           future_admin_deadline == o.future_admin_deadline &&
           future_admin_account == o.future_admin_account &&
           admin_account == o.admin_account &&
           token_account_a == o.token_account_a &&
           token_account_b == o.token_account_b &&
           token_pool == o.token_pool &&
           mint_a == o.mint_a &&
           mint_b == o.mint_b &&
           admin_fee_account_a == o.admin_fee_account_a &&
           admin_fee_account_b == o.admin_fee_account_b &&
           fees == o.fees;
}

bool FarmStateV2::operator==(const FarmStateV2& o) const {
    return is_initialized == o.is_initialized &&
           is_paused == o.is_paused &&
           nonce == o.nonce &&
           farm_base == o.farm_base &&
           admin_account == o.admin_account &&
           admin_fee_account_pool == o.admin_fee_account_pool &&
           token_account_pool == o.token_account_pool &&
           reward_mint == o.reward_mint &&
           pool_mint == o.pool_mint &&
           fees == o.fees;
}

FarmLayoutVersion version_of(const FarmState& state) {
    return std::holds_alternative<FarmStateV1>(state) ? FarmLayoutVersion::V1
                                                      : FarmLayoutVersion::V2;
}

bool is_initialized(const FarmState& state) {
    return std::visit([](const auto& s) { return s.is_initialized != 0; }, state);
}

const FeeSchedule& fees_of(const FarmState& state) {
    return std::visit([](const auto& s) -> const FeeSchedule& { return s.fees; }, state);
}

const PublicKey& admin_of(const FarmState& state) {
    return std::visit([](const auto& s) -> const PublicKey& { return s.admin_account; }, state);
}

} // namespace stableswap
