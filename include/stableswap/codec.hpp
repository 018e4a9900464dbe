#ifndef STABLESWAP_CODEC_HPP
#define STABLESWAP_CODEC_HPP

#include "stableswap/layout.hpp"
#include "stableswap/state.hpp"

namespace stableswap {

// =============================================================================
// Account State Layouts
// =============================================================================
//
// Field order below is the wire order the remote program reads. Reordering
// a Field line changes the wire format.

using layout::Field;
using layout::StructLayout;

using FeeScheduleLayout = StructLayout<FeeSchedule,
    Field<&FeeSchedule::admin_trade_fee_numerator, layout::U64>,
    Field<&FeeSchedule::admin_trade_fee_denominator, layout::U64>,
    Field<&FeeSchedule::admin_withdraw_fee_numerator, layout::U64>,
    Field<&FeeSchedule::admin_withdraw_fee_denominator, layout::U64>,
    Field<&FeeSchedule::trade_fee_numerator, layout::U64>,
    Field<&FeeSchedule::trade_fee_denominator, layout::U64>,
    Field<&FeeSchedule::withdraw_fee_numerator, layout::U64>,
    Field<&FeeSchedule::withdraw_fee_denominator, layout::U64>>;

using RewardScheduleLayout = StructLayout<RewardSchedule,
    Field<&RewardSchedule::trade_reward_numerator, layout::U64>,
    Field<&RewardSchedule::trade_reward_denominator, layout::U64>,
    Field<&RewardSchedule::trade_reward_cap, layout::U64>>;

using OracleSnapshotLayout = StructLayout<OracleSnapshot,
    Field<&OracleSnapshot::period, layout::U32>,
    Field<&OracleSnapshot::token0, layout::PublicKeyLayout>,
    Field<&OracleSnapshot::token1, layout::PublicKeyLayout>,
    Field<&OracleSnapshot::price0_cumulative, layout::U256Layout>,
    Field<&OracleSnapshot::price1_cumulative, layout::U256Layout>,
    Field<&OracleSnapshot::block_timestamp, layout::U64>,
    Field<&OracleSnapshot::price0_average, layout::U256Layout>,
    Field<&OracleSnapshot::price1_average, layout::U256Layout>>;

using PoolConfigLayout = StructLayout<PoolConfig,
    Field<&PoolConfig::is_initialized, layout::U8>,
    Field<&PoolConfig::is_paused, layout::U8>,
    Field<&PoolConfig::amp_factor, layout::U64>,
    Field<&PoolConfig::future_admin_deadline, layout::I64>,
    Field<&PoolConfig::future_admin_key, layout::PublicKeyLayout>,
    Field<&PoolConfig::admin_key, layout::PublicKeyLayout>,
    Field<&PoolConfig::reward_mint, layout::PublicKeyLayout>,
    Field<&PoolConfig::fees, FeeScheduleLayout>,
    Field<&PoolConfig::rewards, RewardScheduleLayout>>;

using PoolStateLayout = StructLayout<PoolState,
    Field<&PoolState::is_initialized, layout::U8>,
    Field<&PoolState::is_paused, layout::U8>,
    Field<&PoolState::nonce, layout::U8>,
    Field<&PoolState::initial_amp_factor, layout::U64>,
    Field<&PoolState::target_amp_factor, layout::U64>,
    Field<&PoolState::start_ramp_ts, layout::I64>,
    Field<&PoolState::stop_ramp_ts, layout::I64>,
    Field<&PoolState::token_account_a, layout::PublicKeyLayout>,
    Field<&PoolState::token_account_b, layout::PublicKeyLayout>,
    Field<&PoolState::reward_token_account, layout::PublicKeyLayout>,
    Field<&PoolState::pool_mint, layout::PublicKeyLayout>,
    Field<&PoolState::mint_a, layout::PublicKeyLayout>,
    Field<&PoolState::mint_b, layout::PublicKeyLayout>,
    Field<&PoolState::reward_mint, layout::PublicKeyLayout>,
    Field<&PoolState::admin_fee_account_a, layout::PublicKeyLayout>,
    Field<&PoolState::admin_fee_account_b, layout::PublicKeyLayout>,
    Field<&PoolState::fees, FeeScheduleLayout>,
    Field<&PoolState::oracle, OracleSnapshotLayout>,
    Field<&PoolState::rewards, RewardScheduleLayout>,
    Field<&PoolState::k, layout::FixedU64Layout>,
    Field<&PoolState::l, layout::FixedU64Layout>,
    Field<&PoolState::r, layout::U8>,
    Field<&PoolState::base_target, layout::FixedU64Layout>,
    Field<&PoolState::quote_target, layout::FixedU64Layout>,
    Field<&PoolState::base_reserve, layout::FixedU64Layout>,
    Field<&PoolState::quote_reserve, layout::FixedU64Layout>,
    Field<&PoolState::is_open_twap, layout::U64>,
    Field<&PoolState::block_timestamp, layout::U64>,
    Field<&PoolState::base_price_cumulative, layout::FixedU64Layout>,
    Field<&PoolState::receive_amount, layout::FixedU64Layout>,
    Field<&PoolState::base_balance, layout::FixedU64Layout>,
    Field<&PoolState::quote_balance, layout::FixedU64Layout>>;

using FarmStateV1Layout = StructLayout<FarmStateV1,
    Field<&FarmStateV1::is_initialized, layout::U8>,
    Field<&FarmStateV1::is_paused, layout::U8>,
    Field<&FarmStateV1::nonce, layout::U8>,
    Field<&FarmStateV1::initial_amp_factor, layout::U64>,
    Field<&FarmStateV1::target_amp_factor, layout::U64>,
    Field<&FarmStateV1::start_ramp_ts, layout::I64>,
    Field<&FarmStateV1::stop_ramp_ts, layout::I64>,
    Field<&FarmStateV1::future_admin_deadline, layout::I64>,
    Field<&FarmStateV1::future_admin_account, layout::PublicKeyLayout>,
    Field<&FarmStateV1::admin_account, layout::PublicKeyLayout>,
    Field<&FarmStateV1::token_account_a, layout::PublicKeyLayout>,
    Field<&FarmStateV1::token_account_b, layout::PublicKeyLayout>,
    Field<&FarmStateV1::token_pool, layout::PublicKeyLayout>,
    Field<&FarmStateV1::mint_a, layout::PublicKeyLayout>,
    Field<&FarmStateV1::mint_b, layout::PublicKeyLayout>,
    Field<&FarmStateV1::admin_fee_account_a, layout::PublicKeyLayout>,
    Field<&FarmStateV1::admin_fee_account_b, layout::PublicKeyLayout>,
    Field<&FarmStateV1::fees, FeeScheduleLayout>>;

using FarmStateV2Layout = StructLayout<FarmStateV2,
    Field<&FarmStateV2::is_initialized, layout::U8>,
    Field<&FarmStateV2::is_paused, layout::U8>,
    Field<&FarmStateV2::nonce, layout::U8>,
    Field<&FarmStateV2::farm_base, layout::PublicKeyLayout>,
    Field<&FarmStateV2::admin_account, layout::PublicKeyLayout>,
    Field<&FarmStateV2::admin_fee_account_pool, layout::PublicKeyLayout>,
    Field<&FarmStateV2::token_account_pool, layout::PublicKeyLayout>,
    Field<&FarmStateV2::reward_mint, layout::PublicKeyLayout>,
    Field<&FarmStateV2::pool_mint, layout::PublicKeyLayout>,
    Field<&FarmStateV2::fees, FeeScheduleLayout>>;

using LiquidityPositionLayout = StructLayout<LiquidityPosition,
    Field<&LiquidityPosition::pool, layout::PublicKeyLayout>,
    Field<&LiquidityPosition::liquidity_amount, layout::U64>,
    Field<&LiquidityPosition::rewards_owed, layout::U64>,
    Field<&LiquidityPosition::rewards_estimated, layout::U64>,
    Field<&LiquidityPosition::cumulative_interest, layout::U64>,
    Field<&LiquidityPosition::last_update_ts, layout::I64>,
    Field<&LiquidityPosition::next_claim_ts, layout::I64>>;

using LiquidityProviderLayout = StructLayout<LiquidityProvider,
    Field<&LiquidityProvider::is_initialized, layout::U8>,
    Field<&LiquidityProvider::owner, layout::PublicKeyLayout>,
    Field<&LiquidityProvider::positions_len, layout::U8>,
    Field<&LiquidityProvider::positions,
          layout::Array<LiquidityPositionLayout, MAX_LIQUIDITY_POSITIONS>>>;

static_assert(FeeScheduleLayout::span == 64);
static_assert(RewardScheduleLayout::span == 24);
static_assert(OracleSnapshotLayout::span == 204);
static_assert(PoolConfigLayout::span == 202);
static_assert(PoolStateLayout::span == 792);
static_assert(FarmStateV1Layout::span == 395);
static_assert(FarmStateV2Layout::span == 259);
static_assert(LiquidityPositionLayout::span == 80);
static_assert(LiquidityProviderLayout::span == 834);

// =============================================================================
// Farm State Codec
// =============================================================================

size_t farm_state_span(FarmLayoutVersion version);

// Throws StructuralError when data is shorter than the version's span.
FarmState decode_farm_state(const Bytes& data, FarmLayoutVersion version);

// Always throws UnsupportedOperationError: the farm layout is not settled,
// so nothing is written in either candidate shape.
Bytes encode_farm_state(const FarmState& state);

} // namespace stableswap

#endif // STABLESWAP_CODEC_HPP
