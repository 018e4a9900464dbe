// =============================================================================
// json.cpp - JSON rendering of keys, state and instructions
// =============================================================================

#include "stableswap/json.hpp"
#include <nlohmann/json.hpp>

namespace stableswap {

using json = nlohmann::json;

// =============================================================================
// Primitives
// =============================================================================

void to_json(json& j, const PublicKey& key) {
    j = key.to_base58();
}

void from_json(const json& j, PublicKey& key) {
    key = PublicKey::from_base58(j.get<std::string>());
}

void to_json(json& j, const U256& value) {
    j = value.to_string();
}

void from_json(const json& j, U256& value) {
    value = U256::from_string(j.get<std::string>());
}

void to_json(json& j, const FixedU64& value) {
    j = json{{"inner", value.inner}, {"base_point", value.base_point}};
}

void to_json(json& j, const FixedU256& value) {
    j = json{{"inner", value.inner}, {"base_point", value.base_point}};
}

// =============================================================================
// Schedules
// =============================================================================

void to_json(json& j, const FeeSchedule& f) {
    j = json{
        {"admin_trade_fee_numerator", f.admin_trade_fee_numerator},
        {"admin_trade_fee_denominator", f.admin_trade_fee_denominator},
        {"admin_withdraw_fee_numerator", f.admin_withdraw_fee_numerator},
        {"admin_withdraw_fee_denominator", f.admin_withdraw_fee_denominator},
        {"trade_fee_numerator", f.trade_fee_numerator},
        {"trade_fee_denominator", f.trade_fee_denominator},
        {"withdraw_fee_numerator", f.withdraw_fee_numerator},
        {"withdraw_fee_denominator", f.withdraw_fee_denominator},
    };
}

void from_json(const json& j, FeeSchedule& f) {
    j.at("admin_trade_fee_numerator").get_to(f.admin_trade_fee_numerator);
    j.at("admin_trade_fee_denominator").get_to(f.admin_trade_fee_denominator);
    j.at("admin_withdraw_fee_numerator").get_to(f.admin_withdraw_fee_numerator);
    j.at("admin_withdraw_fee_denominator").get_to(f.admin_withdraw_fee_denominator);
    j.at("trade_fee_numerator").get_to(f.trade_fee_numerator);
    j.at("trade_fee_denominator").get_to(f.trade_fee_denominator);
    j.at("withdraw_fee_numerator").get_to(f.withdraw_fee_numerator);
    j.at("withdraw_fee_denominator").get_to(f.withdraw_fee_denominator);
}

void to_json(json& j, const RewardSchedule& r) {
    j = json{
        {"trade_reward_numerator", r.trade_reward_numerator},
        {"trade_reward_denominator", r.trade_reward_denominator},
        {"trade_reward_cap", r.trade_reward_cap},
    };
}

void from_json(const json& j, RewardSchedule& r) {
    j.at("trade_reward_numerator").get_to(r.trade_reward_numerator);
    j.at("trade_reward_denominator").get_to(r.trade_reward_denominator);
    j.at("trade_reward_cap").get_to(r.trade_reward_cap);
}

// =============================================================================
// Account State
// =============================================================================

void to_json(json& j, const OracleSnapshot& o) {
    j = json{
        {"period", o.period},
        {"token0", o.token0},
        {"token1", o.token1},
        {"price0_cumulative", o.price0_cumulative},
        {"price1_cumulative", o.price1_cumulative},
        {"block_timestamp", o.block_timestamp},
        {"price0_average", o.price0_average},
        {"price1_average", o.price1_average},
    };
}

void to_json(json& j, const PoolConfig& c) {
    j = json{
        {"is_initialized", c.initialized()},
        {"is_paused", c.paused()},
        {"amp_factor", c.amp_factor},
        {"future_admin_deadline", c.future_admin_deadline},
        {"future_admin_key", c.future_admin_key},
        {"admin_key", c.admin_key},
        {"reward_mint", c.reward_mint},
        {"fees", c.fees},
        {"rewards", c.rewards},
    };
}

void to_json(json& j, const PoolState& s) {
    j = json{
        {"is_initialized", s.initialized()},
        {"is_paused", s.paused()},
        {"nonce", s.nonce},
        {"initial_amp_factor", s.initial_amp_factor},
        {"target_amp_factor", s.target_amp_factor},
        {"start_ramp_ts", s.start_ramp_ts},
        {"stop_ramp_ts", s.stop_ramp_ts},
        {"token_account_a", s.token_account_a},
        {"token_account_b", s.token_account_b},
        {"reward_token_account", s.reward_token_account},
        {"pool_mint", s.pool_mint},
        {"mint_a", s.mint_a},
        {"mint_b", s.mint_b},
        {"reward_mint", s.reward_mint},
        {"admin_fee_account_a", s.admin_fee_account_a},
        {"admin_fee_account_b", s.admin_fee_account_b},
        {"fees", s.fees},
        {"oracle", s.oracle},
        {"rewards", s.rewards},
        {"k", s.k},
        {"l", s.l},
        {"r", s.r},
        {"base_target", s.base_target},
        {"quote_target", s.quote_target},
        {"base_reserve", s.base_reserve},
        {"quote_reserve", s.quote_reserve},
        {"is_open_twap", s.is_open_twap},
        {"block_timestamp", s.block_timestamp},
        {"base_price_cumulative", s.base_price_cumulative},
        {"receive_amount", s.receive_amount},
        {"base_balance", s.base_balance},
        {"quote_balance", s.quote_balance},
    };
}

void to_json(json& j, const FarmStateV1& s) {
    j = json{
        {"is_initialized", s.is_initialized != 0},
        {"is_paused", s.is_paused != 0},
        {"nonce", s.nonce},
        {"initial_amp_factor", s.initial_amp_factor},
        {"target_amp_factor", s.target_amp_factor},
        {"start_ramp_ts", s.start_ramp_ts},
        {"stop_ramp_ts", s.stop_ramp_ts},
        {"future_admin_deadline", s.future_admin_deadline},
        {"future_admin_account", s.future_admin_account},
        {"admin_account", s.admin_account},
        {"token_account_a", s.token_account_a},
        {"token_account_b", s.token_account_b},
        {"token_pool", s.token_pool},
        {"mint_a", s.mint_a},
        {"mint_b", s.mint_b},
        {"admin_fee_account_a", s.admin_fee_account_a},
        {"admin_fee_account_b", s.admin_fee_account_b},
        {"fees", s.fees},
    };
}

void to_json(json& j, const FarmStateV2& s) {
    j = json{
        {"is_initialized", s.is_initialized != 0},
        {"is_paused", s.is_paused != 0},
        {"nonce", s.nonce},
        {"farm_base", s.farm_base},
        {"admin_account", s.admin_account},
        {"admin_fee_account_pool", s.admin_fee_account_pool},
        {"token_account_pool", s.token_account_pool},
        {"reward_mint", s.reward_mint},
        {"pool_mint", s.pool_mint},
        {"fees", s.fees},
    };
}

void to_json(json& j, const LiquidityPosition& p) {
    j = json{
        {"pool", p.pool},
        {"liquidity_amount", p.liquidity_amount},
        {"rewards_owed", p.rewards_owed},
        {"rewards_estimated", p.rewards_estimated},
        {"cumulative_interest", p.cumulative_interest},
        {"last_update_ts", p.last_update_ts},
        {"next_claim_ts", p.next_claim_ts},
    };
}

void to_json(json& j, const LiquidityProvider& p) {
    j = json{
        {"is_initialized", p.is_initialized != 0},
        {"owner", p.owner},
        {"positions", p.active_positions()},
    };
}

json farm_state_to_json(const FarmState& state) {
    json j = std::visit([](const auto& s) { return json(s); }, state);
    j["version"] = to_string(version_of(state));
    return j;
}

// =============================================================================
// Instructions
// =============================================================================

void to_json(json& j, const AccountMeta& m) {
    j = json{
        {"pubkey", m.pubkey},
        {"is_signer", m.is_signer},
        {"is_writable", m.is_writable},
    };
}

void from_json(const json& j, AccountMeta& m) {
    j.at("pubkey").get_to(m.pubkey);
    j.at("is_signer").get_to(m.is_signer);
    j.at("is_writable").get_to(m.is_writable);
}

void to_json(json& j, const Instruction& ix) {
    j = json{
        {"program_id", ix.program_id},
        {"accounts", ix.accounts},
        {"data", ix.data},
    };
}

void from_json(const json& j, Instruction& ix) {
    j.at("program_id").get_to(ix.program_id);
    j.at("accounts").get_to(ix.accounts);
    j.at("data").get_to(ix.data);
}

} // namespace stableswap
