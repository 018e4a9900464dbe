// StableSwap - Admin Instruction Tests

#include <catch2/catch_test_macros.hpp>
#include <stableswap/admin.hpp>
#include <stableswap/codec.hpp>
#include <stableswap/error.hpp>
#include "test_helpers.hpp"

#include <set>

using namespace stableswap;
using namespace stableswap::instructions;

namespace {

const PublicKey PROGRAM = test::key(200);

AdminAccounts admin_accounts() {
    return AdminAccounts{test::key(1), test::key(2), test::key(3)};
}

void require_signed_triple(const Instruction& ix) {
    REQUIRE(ix.accounts.size() >= 3);
    REQUIRE(ix.accounts[0] == AccountMeta::readonly(test::key(1), true));
    REQUIRE(ix.accounts[1].pubkey == test::key(2));
    REQUIRE(ix.accounts[1].is_signer);
    REQUIRE(ix.accounts[2] == AccountMeta::readonly(test::key(3), true));
}

// Config and pool signers lead; the admin is fourth behind the pool authority
void require_signed_triple_prefix(const Instruction& ix) {
    REQUIRE(ix.accounts[0] == AccountMeta::readonly(test::key(1), true));
    REQUIRE(ix.accounts[1] == AccountMeta::readonly(test::key(2), true));
}

} // anonymous namespace

TEST_CASE("Initialize config", "[admin]") {
    InitializeConfigParams params;
    params.amp_factor = 250;
    Instruction ix = initialize_config(PROGRAM, test::key(1), test::key(3), params);

    REQUIRE(ix.data.size() == 1 + 8 + 64 + 24);
    REQUIRE(ix.data[0] == 100);
    REQUIRE(test::read_u64(ix.data, 1) == 250);
    REQUIRE(Bytes(ix.data.begin() + 9, ix.data.begin() + 73) ==
            layout::pack<FeeScheduleLayout>(DEFAULT_FEES));
    REQUIRE(test::read_u64(ix.data, 73) == DEFAULT_REWARDS.trade_reward_numerator);
    REQUIRE(test::read_u64(ix.data, 89) == DEFAULT_REWARDS.trade_reward_cap);

    REQUIRE(ix.accounts.size() == 2);
    REQUIRE(ix.accounts[0] == AccountMeta::writable(test::key(1), true));
    REQUIRE(ix.accounts[1] == AccountMeta::readonly(test::key(3), true));
}

TEST_CASE("Ramp amplification", "[admin]") {
    Instruction ix = ramp_a(PROGRAM, admin_accounts(), RampAParams{500, 1700000000});

    REQUIRE(ix.data.size() == 17);
    REQUIRE(ix.data[0] == 101);
    REQUIRE(test::read_u64(ix.data, 1) == 500);
    REQUIRE(test::read_u64(ix.data, 9) == 1700000000);

    require_signed_triple(ix);
    REQUIRE(ix.accounts[1].is_writable);
    REQUIRE(ix.accounts.size() == 4);
    REQUIRE(ix.accounts[3] == AccountMeta::readonly(ids::sysvar_clock()));

    SECTION("Stop timestamp is signed") {
        Instruction past = ramp_a(PROGRAM, admin_accounts(), RampAParams{500, -1});
        REQUIRE(Bytes(past.data.begin() + 9, past.data.end()) == Bytes(8, 0xFF));
    }

    SECTION("Stop timestamp must fit i64") {
        I128 too_late = static_cast<I128>(INT64_MAX) + 1;
        REQUIRE_THROWS_AS(ramp_a(PROGRAM, admin_accounts(), RampAParams{500, too_late}),
                          WidthOverflowError);
    }
}

TEST_CASE("Flag-only admin instructions", "[admin]") {
    SECTION("Stop ramp carries the clock") {
        Instruction ix = stop_ramp_a(PROGRAM, admin_accounts());
        REQUIRE(ix.data == Bytes{102});
        require_signed_triple(ix);
        REQUIRE(ix.accounts.size() == 4);
        REQUIRE(ix.accounts[3].pubkey == ids::sysvar_clock());
    }

    SECTION("Pause and unpause") {
        Instruction p = pause(PROGRAM, admin_accounts());
        Instruction u = unpause(PROGRAM, admin_accounts());
        REQUIRE(p.data == Bytes{103});
        REQUIRE(u.data == Bytes{104});
        REQUIRE(p.accounts == u.accounts);
        REQUIRE(p.accounts.size() == 3);
        REQUIRE(p.signer_count() == 3);
    }

    SECTION("Set fee account") {
        Instruction ix = set_fee_account(PROGRAM, admin_accounts(), test::key(4), test::key(5));
        REQUIRE(ix.data == Bytes{105});
        REQUIRE(ix.accounts.size() == 6);
        require_signed_triple_prefix(ix);
        REQUIRE(ix.accounts[2] == AccountMeta::readonly(test::key(4)));
        REQUIRE(ix.accounts[3] == AccountMeta::readonly(test::key(3), true));
        REQUIRE(ix.accounts[4] == AccountMeta::readonly(test::key(5)));
        REQUIRE(ix.accounts[5] == AccountMeta::readonly(ids::token_program()));
        REQUIRE(ix.signer_count() == 3);

        Instruction custom = set_fee_account(PROGRAM, admin_accounts(), test::key(4),
                                             test::key(5), test::key(6));
        REQUIRE(custom.accounts.size() == 6);
        REQUIRE(custom.accounts[5] == AccountMeta::readonly(test::key(6)));
    }

    SECTION("Admin transfer has no pool account") {
        Instruction apply = apply_new_admin(PROGRAM, test::key(1), test::key(3));
        REQUIRE(apply.data == Bytes{106});
        REQUIRE(apply.accounts.size() == 3);
        REQUIRE(apply.accounts[2].pubkey == ids::sysvar_clock());

        Instruction commit = commit_new_admin(PROGRAM, test::key(1), test::key(3), test::key(9));
        REQUIRE(commit.data == Bytes{107});
        REQUIRE(commit.accounts.size() == 4);
        REQUIRE(commit.accounts[2] == AccountMeta::readonly(test::key(9)));
        REQUIRE(commit.signer_count() == 2);
    }
}

TEST_CASE("Schedule updates", "[admin]") {
    SECTION("New fees, config unsigned") {
        FeeSchedule fees = DEFAULT_FEES;
        fees.trade_fee_numerator = 3;
        Instruction ix = set_new_fees(PROGRAM, admin_accounts(), fees);

        REQUIRE(ix.data.size() == 65);
        REQUIRE(ix.data[0] == 108);
        REQUIRE(test::read_u64(ix.data, 33) == 3);
        REQUIRE(ix.accounts.size() == 3);
        REQUIRE_FALSE(ix.accounts[0].is_signer);
        REQUIRE(ix.signer_count() == 2);
    }

    SECTION("New rewards") {
        Instruction ix = set_new_rewards(PROGRAM, admin_accounts(), RewardSchedule{2, 500, 7});
        REQUIRE(ix.data.size() == 25);
        REQUIRE(ix.data[0] == 109);
        REQUIRE(test::read_u64(ix.data, 1) == 2);
        REQUIRE(test::read_u64(ix.data, 9) == 500);
        REQUIRE(test::read_u64(ix.data, 17) == 7);
        require_signed_triple(ix);
    }
}

TEST_CASE("Admin tags never collide with swap tags", "[admin][tags]") {
    std::set<uint8_t> tags;
    for (uint8_t t = 0; t <= 7; ++t) tags.insert(t);

    std::vector<Instruction> admin{
        initialize_config(PROGRAM, test::key(1), test::key(3), {}),
        ramp_a(PROGRAM, admin_accounts(), RampAParams{1, 1}),
        stop_ramp_a(PROGRAM, admin_accounts()),
        pause(PROGRAM, admin_accounts()),
        unpause(PROGRAM, admin_accounts()),
        set_fee_account(PROGRAM, admin_accounts(), test::key(4), test::key(5)),
        apply_new_admin(PROGRAM, test::key(1), test::key(3)),
        commit_new_admin(PROGRAM, test::key(1), test::key(3), test::key(9)),
        set_new_fees(PROGRAM, admin_accounts(), DEFAULT_FEES),
        set_new_rewards(PROGRAM, admin_accounts(), DEFAULT_REWARDS),
    };

    for (const auto& ix : admin) {
        REQUIRE(tags.insert(ix.tag()).second);
        REQUIRE(classify(ix.data) == InstructionFamily::Admin);
    }
    REQUIRE(tags.size() == 18);
    REQUIRE(to_string(AdminTag::SetNewRewards) == "set_new_rewards");
}
