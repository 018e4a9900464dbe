// StableSwap - Account State Layout Tests

#include <catch2/catch_test_macros.hpp>
#include <stableswap/codec.hpp>
#include <stableswap/error.hpp>
#include "test_helpers.hpp"

using namespace stableswap;

namespace {

FeeSchedule sample_fees() {
    FeeSchedule f;
    f.admin_trade_fee_numerator = 1;
    f.admin_trade_fee_denominator = 2;
    f.admin_withdraw_fee_numerator = 3;
    f.admin_withdraw_fee_denominator = 4;
    f.trade_fee_numerator = 5;
    f.trade_fee_denominator = 6;
    f.withdraw_fee_numerator = 7;
    f.withdraw_fee_denominator = 8;
    return f;
}

OracleSnapshot sample_oracle() {
    OracleSnapshot o;
    o.period = 3600;
    o.token0 = test::key(10);
    o.token1 = test::key(11);
    o.price0_cumulative = U256::from_string("340282366920938463463374607431768211456");
    o.price1_cumulative = U256::from_u64(99);
    o.block_timestamp = 1632000000;
    o.price0_average = U256::from_u64(1);
    o.price1_average = U256::from_string("1000000000000000000000");
    return o;
}

PoolConfig sample_config() {
    PoolConfig c;
    c.is_initialized = 1;
    c.is_paused = 0;
    c.amp_factor = 100;
    c.future_admin_deadline = -42;
    c.future_admin_key = test::key(1);
    c.admin_key = test::key(2);
    c.reward_mint = test::key(3);
    c.fees = sample_fees();
    c.rewards = RewardSchedule{9, 10, 11};
    return c;
}

PoolState sample_state() {
    PoolState s;
    s.is_initialized = 1;
    s.is_paused = 1;
    s.nonce = 254;
    s.initial_amp_factor = 100;
    s.target_amp_factor = 200;
    s.start_ramp_ts = -1;
    s.stop_ramp_ts = 1700000000;
    s.token_account_a = test::key(20);
    s.token_account_b = test::key(21);
    s.reward_token_account = test::key(22);
    s.pool_mint = test::key(23);
    s.mint_a = test::key(24);
    s.mint_b = test::key(25);
    s.reward_mint = test::key(26);
    s.admin_fee_account_a = test::key(27);
    s.admin_fee_account_b = test::key(28);
    s.fees = sample_fees();
    s.oracle = sample_oracle();
    s.rewards = DEFAULT_REWARDS;
    s.k = {500000000000000000ULL, 18};
    s.l = {1000000, 6};
    s.r = 2;
    s.base_target = {1, 0};
    s.quote_target = {2, 0};
    s.base_reserve = {3, 0};
    s.quote_reserve = {4, 0};
    s.is_open_twap = TWAP_OPEN;
    s.block_timestamp = 1632000001;
    s.base_price_cumulative = {5, 1};
    s.receive_amount = {6, 2};
    s.base_balance = {7, 3};
    s.quote_balance = {UINT64_MAX, 4};
    return s;
}

} // anonymous namespace

TEST_CASE("Composite spans are flat sums with no padding", "[state]") {
    REQUIRE(FeeScheduleLayout::span == 64);
    REQUIRE(RewardScheduleLayout::span == 24);
    REQUIRE(OracleSnapshotLayout::span == 4 + 32 + 32 + 32 + 32 + 8 + 32 + 32);
    REQUIRE(PoolConfigLayout::span == 1 + 1 + 8 + 8 + 32 * 3 + 64 + 24);
    REQUIRE(PoolStateLayout::span == 792);
    REQUIRE(FarmStateV1Layout::span == 395);
    REQUIRE(FarmStateV2Layout::span == 259);
    REQUIRE(LiquidityPositionLayout::span == 32 + 8 * 6);
    REQUIRE(LiquidityProviderLayout::span == 1 + 32 + 1 + 80 * MAX_LIQUIDITY_POSITIONS);

    REQUIRE(layout::pack<FeeScheduleLayout>(sample_fees()).size() == FeeScheduleLayout::span);
    REQUIRE(layout::pack<OracleSnapshotLayout>(sample_oracle()).size() == OracleSnapshotLayout::span);
    REQUIRE(layout::pack<PoolConfigLayout>(sample_config()).size() == PoolConfigLayout::span);
    REQUIRE(layout::pack<PoolStateLayout>(sample_state()).size() == PoolStateLayout::span);
}

TEST_CASE("Fee schedule wire order", "[state][fees]") {
    FeeSchedule fees;
    fees.admin_trade_fee_numerator = 0;
    fees.admin_trade_fee_denominator = 1000;
    fees.trade_fee_numerator = 1;
    fees.trade_fee_denominator = 4;
    fees.admin_withdraw_fee_numerator = 0;
    fees.admin_withdraw_fee_denominator = 1000;
    fees.withdraw_fee_numerator = 0;
    fees.withdraw_fee_denominator = 1000;

    Bytes out = layout::pack<FeeScheduleLayout>(fees);

    REQUIRE(out.size() == 64);
    REQUIRE(Bytes(out.begin() + 32, out.begin() + 40) == test::le64(1));
    REQUIRE(Bytes(out.begin() + 40, out.begin() + 48) == test::le64(4));
    REQUIRE(test::read_u64(out, 0) == 0);
    REQUIRE(test::read_u64(out, 8) == 1000);
    REQUIRE(test::read_u64(out, 16) == 0);
    REQUIRE(test::read_u64(out, 24) == 1000);
    REQUIRE(test::read_u64(out, 56) == 1000);

    SECTION("Matches the default schedule") {
        REQUIRE(fees == DEFAULT_FEES);
        REQUIRE(out == layout::pack<FeeScheduleLayout>(DEFAULT_FEES));
    }
}

TEST_CASE("Schedule denominators", "[state][fees]") {
    REQUIRE(DEFAULT_FEES.has_valid_denominators());
    REQUIRE(DEFAULT_REWARDS.has_valid_denominators());

    FeeSchedule fees = DEFAULT_FEES;
    fees.withdraw_fee_denominator = 0;
    REQUIRE_FALSE(fees.has_valid_denominators());

    REQUIRE_FALSE(RewardSchedule{1, 0, 100}.has_valid_denominators());
}

TEST_CASE("Pool config layout", "[state][config]") {
    PoolConfig config = sample_config();
    Bytes out = layout::pack<PoolConfigLayout>(config);

    SECTION("Field offsets") {
        REQUIRE(out[0] == 1);
        REQUIRE(out[1] == 0);
        REQUIRE(test::read_u64(out, 2) == 100);
        REQUIRE(static_cast<int64_t>(test::read_u64(out, 10)) == -42);
        REQUIRE(out[18] == 1);   // future admin key, first byte
        REQUIRE(out[50] == 2);   // admin key
        REQUIRE(out[82] == 3);   // reward mint
        REQUIRE(test::read_u64(out, 114) == 1);  // fees begin
        REQUIRE(test::read_u64(out, 178) == 9);  // rewards begin
        REQUIRE(test::read_u64(out, 194) == 11);
    }

    SECTION("Round trip") {
        REQUIRE(layout::unpack<PoolConfigLayout>(out) == config);
    }

    SECTION("Trailing bytes are ignored") {
        Bytes longer = out;
        longer.resize(out.size() + 50, 0xAB);
        REQUIRE(layout::unpack<PoolConfigLayout>(longer) == config);
    }

    SECTION("One byte short is a structural error") {
        Bytes shorter(out.begin(), out.end() - 1);
        REQUIRE_THROWS_AS(layout::unpack<PoolConfigLayout>(shorter), StructuralError);
    }
}

TEST_CASE("Pool state layout", "[state][pool]") {
    PoolState state = sample_state();
    Bytes out = layout::pack<PoolStateLayout>(state);

    SECTION("Embedded structs sit at their flat offsets") {
        REQUIRE(out[2] == 254);                          // nonce
        REQUIRE(static_cast<int64_t>(test::read_u64(out, 19)) == -1);  // start ramp
        REQUIRE(out[35] == 20);                          // token account A
        REQUIRE(out[291] == 28);                         // admin fee account B
        REQUIRE(test::read_u64(out, 323) == 1);          // fees
        REQUIRE(out[387] == 0x10);                       // oracle period 3600 = 0x0E10
        REQUIRE(out[388] == 0x0E);
        REQUIRE(out[391] == 10);                         // oracle token0
        REQUIRE(test::read_u64(out, 591) == 1);          // rewards numerator
        REQUIRE(test::read_u64(out, 615) == 500000000000000000ULL);  // k.inner
        REQUIRE(test::read_u64(out, 623) == 18);         // k.base_point
        REQUIRE(out[647] == 2);                          // r
        REQUIRE(test::read_u64(out, 712) == TWAP_OPEN);
        REQUIRE(test::read_u64(out, 776) == UINT64_MAX); // quote balance inner
        REQUIRE(test::read_u64(out, 784) == 4);
    }

    SECTION("Round trip") {
        PoolState decoded = layout::unpack<PoolStateLayout>(out);
        REQUIRE(decoded == state);
        REQUIRE(decoded.oracle == sample_oracle());
        REQUIRE(decoded.paused());
        REQUIRE(decoded.twap_open());
    }

    SECTION("Short buffer") {
        REQUIRE_THROWS_AS(layout::unpack<PoolStateLayout>(Bytes(791, 0)), StructuralError);
    }
}

TEST_CASE("Oracle snapshot wide values survive decoding", "[state][oracle]") {
    OracleSnapshot oracle = sample_oracle();
    OracleSnapshot decoded = layout::unpack<OracleSnapshotLayout>(
        layout::pack<OracleSnapshotLayout>(oracle));

    REQUIRE(decoded == oracle);
    REQUIRE(decoded.price0_cumulative.to_string() == "340282366920938463463374607431768211456");
    REQUIRE(decoded.price1_average.to_string() == "1000000000000000000000");
}

TEST_CASE("Farm state is a versioned variant", "[state][farm]") {
    SECTION("V1 swap-shaped decode") {
        FarmStateV1 v1;
        v1.is_initialized = 1;
        v1.nonce = 7;
        v1.future_admin_deadline = 86400;
        v1.admin_account = test::key(40);
        v1.token_pool = test::key(41);
        v1.fees = DEFAULT_FEES;

        Bytes raw = layout::pack<FarmStateV1Layout>(v1);
        REQUIRE(raw.size() == 395);

        FarmState decoded = decode_farm_state(raw, FarmLayoutVersion::V1);
        REQUIRE(version_of(decoded) == FarmLayoutVersion::V1);
        REQUIRE(std::get<FarmStateV1>(decoded) == v1);
        REQUIRE(is_initialized(decoded));
        REQUIRE(admin_of(decoded) == test::key(40));
        REQUIRE(fees_of(decoded) == DEFAULT_FEES);
    }

    SECTION("V2 pool-shaped decode") {
        FarmStateV2 v2;
        v2.is_initialized = 1;
        v2.farm_base = test::key(50);
        v2.admin_account = test::key(51);
        v2.pool_mint = test::key(55);
        v2.fees = sample_fees();

        Bytes raw = layout::pack<FarmStateV2Layout>(v2);
        REQUIRE(raw.size() == 259);
        REQUIRE(raw[3] == 50);

        FarmState decoded = decode_farm_state(raw, FarmLayoutVersion::V2);
        REQUIRE(version_of(decoded) == FarmLayoutVersion::V2);
        REQUIRE(std::get<FarmStateV2>(decoded) == v2);
        REQUIRE(fees_of(decoded) == sample_fees());
    }

    SECTION("The caller's version decides the shape") {
        Bytes raw(300, 0);
        REQUIRE_NOTHROW(decode_farm_state(raw, FarmLayoutVersion::V2));
        REQUIRE_THROWS_AS(decode_farm_state(raw, FarmLayoutVersion::V1), StructuralError);
        REQUIRE(farm_state_span(FarmLayoutVersion::V1) == 395);
        REQUIRE(farm_state_span(FarmLayoutVersion::V2) == 259);
    }

    SECTION("Encoding is refused for either version") {
        REQUIRE_THROWS_AS(encode_farm_state(FarmState{FarmStateV1{}}), UnsupportedOperationError);
        REQUIRE_THROWS_AS(encode_farm_state(FarmState{FarmStateV2{}}), UnsupportedOperationError);
    }

    SECTION("Version names") {
        REQUIRE(to_string(FarmLayoutVersion::V1) == "v1");
        REQUIRE(farm_layout_version_from_string("V2") == FarmLayoutVersion::V2);
        REQUIRE_THROWS_AS(farm_layout_version_from_string("v3"), StructuralError);
    }
}

TEST_CASE("Liquidity provider layout", "[state][liquidity]") {
    LiquidityProvider provider;
    provider.is_initialized = 1;
    provider.owner = test::key(90);
    provider.positions_len = 2;
    provider.positions[0].pool = test::key(91);
    provider.positions[0].liquidity_amount = 1000;
    provider.positions[0].rewards_owed = 7;
    provider.positions[0].last_update_ts = 1700000000;
    provider.positions[0].next_claim_ts = 1700000000 + MIN_CLAIM_PERIOD;
    provider.positions[1].pool = test::key(92);
    provider.positions[1].cumulative_interest = UINT64_MAX;
    provider.positions[1].last_update_ts = -1;

    Bytes raw = layout::pack<LiquidityProviderLayout>(provider);
    REQUIRE(raw.size() == 834);

    SECTION("Header then fixed position slots") {
        REQUIRE(raw[0] == 1);
        REQUIRE(raw[1] == 90);
        REQUIRE(raw[33] == 2);
        REQUIRE(raw[34] == 91);
        REQUIRE(test::read_u64(raw, 34 + 32) == 1000);
        REQUIRE(test::read_u64(raw, 34 + 40) == 7);
        REQUIRE(test::read_u64(raw, 34 + 64) == 1700000000);
        REQUIRE(test::read_u64(raw, 34 + 72) ==
                static_cast<uint64_t>(1700000000 + MIN_CLAIM_PERIOD));

        size_t second = 34 + 80;
        REQUIRE(raw[second] == 92);
        REQUIRE(test::read_u64(raw, second + 56) == UINT64_MAX);
        REQUIRE(Bytes(raw.begin() + second + 64, raw.begin() + second + 72) == Bytes(8, 0xFF));

        // Unused slots are zero filled
        REQUIRE(Bytes(raw.begin() + 34 + 160, raw.end()) == Bytes(80 * 8, 0));
    }

    SECTION("Decode restores every slot") {
        LiquidityProvider decoded = layout::unpack<LiquidityProviderLayout>(raw);
        REQUIRE(decoded == provider);
        REQUIRE(decoded.positions[1].last_update_ts == -1);

        std::vector<LiquidityPosition> live = decoded.active_positions();
        REQUIRE(live.size() == 2);
        REQUIRE(live[1].pool == test::key(92));
    }

    SECTION("Stale bytes past positions_len survive decoding") {
        raw[33] = 1;
        LiquidityProvider decoded = layout::unpack<LiquidityProviderLayout>(raw);
        REQUIRE(decoded.active_positions().size() == 1);
        REQUIRE(decoded.positions[1].pool == test::key(92));
        REQUIRE(decoded.find_position(test::key(92)) == nullptr);
        REQUIRE(layout::pack<LiquidityProviderLayout>(decoded) == raw);
    }

    SECTION("Out of range position count") {
        provider.positions_len = static_cast<uint8_t>(MAX_LIQUIDITY_POSITIONS + 1);
        REQUIRE_THROWS_AS(provider.active_positions(), StructuralError);
    }

    SECTION("Truncated account") {
        Bytes shorter(raw.begin(), raw.begin() + 833);
        REQUIRE_THROWS_AS(layout::unpack<LiquidityProviderLayout>(shorter), StructuralError);
    }
}
