// =============================================================================
// farm.cpp - Liquidity-farming instruction encoders
// =============================================================================

#include "stableswap/farm.hpp"
#include "stableswap/codec.hpp"

namespace stableswap {
namespace farm {

using layout::U8;
using layout::U64;

namespace {

inline uint8_t tag_of(FarmTag tag) { return static_cast<uint8_t>(tag); }

std::vector<AccountMeta> withdraw_accounts(const WithdrawAccounts& a) {
    return {
        AccountMeta::writable(a.farm_base),
        AccountMeta::writable(a.farm),
        AccountMeta::readonly(a.authority),
        AccountMeta::readonly(a.admin_fee_account_reward),
        AccountMeta::readonly(a.user_pool_account),
        AccountMeta::readonly(a.user_farming),
        AccountMeta::readonly(a.pool_mint),
        AccountMeta::writable(a.reward_mint),
        AccountMeta::writable(a.reward_token_account),
        AccountMeta::readonly(a.token_program),
        AccountMeta::readonly(ids::sysvar_clock()),
    };
}

} // anonymous namespace

Instruction initialize(const PublicKey& program_id,
                       const InitializeFarmAccounts& a,
                       const InitializeFarmParams& p) {
    uint8_t nonce = U8::narrow(p.nonce, "nonce");
    Bytes data = make_payload<U8, FeeScheduleLayout>(tag_of(FarmTag::Initialize), nonce, p.fees);

    std::vector<AccountMeta> accounts{
        AccountMeta::writable(a.farm_base),
        AccountMeta::writable(a.farm),
        AccountMeta::readonly(a.authority),
        AccountMeta::readonly(a.admin),
        AccountMeta::readonly(a.admin_fee_account_pool),
        AccountMeta::readonly(a.pool_mint),
        AccountMeta::readonly(a.token_account_pool),
        AccountMeta::writable(a.reward_mint),
        AccountMeta::writable(a.reward_token_account),
        AccountMeta::readonly(a.token_program),
    };

    return make_instruction(to_string(FarmTag::Initialize), program_id,
                            std::move(accounts), std::move(data));
}

Instruction enable_user(const PublicKey& program_id, const EnableUserAccounts& a) {
    std::vector<AccountMeta> accounts{
        AccountMeta::writable(a.farm),
        AccountMeta::readonly(a.authority),
        AccountMeta::readonly(a.user_farming),
        AccountMeta::readonly(a.owner),
    };

    return make_instruction(to_string(FarmTag::EnableUser), program_id,
                            std::move(accounts), make_payload<>(tag_of(FarmTag::EnableUser)));
}

Instruction deposit(const PublicKey& program_id,
                    const DepositAccounts& a,
                    I128 pool_token_amount) {
    uint64_t amount = U64::narrow(pool_token_amount, "pool_token_amount");
    Bytes data = make_payload<U64>(tag_of(FarmTag::Deposit), amount);

    std::vector<AccountMeta> accounts{
        AccountMeta::writable(a.farm_base),
        AccountMeta::writable(a.farm),
        AccountMeta::readonly(a.authority),
        AccountMeta::readonly(a.admin_fee_account_reward),
        AccountMeta::readonly(a.source_pool),
        AccountMeta::readonly(a.user_farming),
        AccountMeta::readonly(a.farm_pool),
        AccountMeta::writable(a.reward_mint),
        AccountMeta::readonly(a.reward_destination),
        AccountMeta::readonly(a.token_program),
        AccountMeta::readonly(ids::sysvar_clock()),
    };

    return make_instruction(to_string(FarmTag::Deposit), program_id,
                            std::move(accounts), std::move(data));
}

Instruction withdraw(const PublicKey& program_id,
                     const WithdrawAccounts& a,
                     I128 pool_token_amount) {
    uint64_t amount = U64::narrow(pool_token_amount, "pool_token_amount");
    Bytes data = make_payload<U64>(tag_of(FarmTag::Withdraw), amount);

    return make_instruction(to_string(FarmTag::Withdraw), program_id,
                            withdraw_accounts(a), std::move(data));
}

Instruction emergency_withdraw(const PublicKey& program_id, const WithdrawAccounts& a) {
    return make_instruction(to_string(FarmTag::EmergencyWithdraw), program_id,
                            withdraw_accounts(a),
                            make_payload<>(tag_of(FarmTag::EmergencyWithdraw)));
}

Instruction print_pending_reward(const PublicKey& program_id,
                                 const PrintPendingRewardAccounts& a,
                                 const InitializeFarmParams& p) {
    uint8_t nonce = U8::narrow(p.nonce, "nonce");
    Bytes data = make_payload<U8, FeeScheduleLayout>(tag_of(FarmTag::PrintPendingReward),
                                                     nonce, p.fees);

    std::vector<AccountMeta> accounts{
        AccountMeta::writable(a.farm),
        AccountMeta::readonly(a.authority),
        AccountMeta::readonly(a.admin),
        AccountMeta::readonly(a.admin_fee_account_pool),
        AccountMeta::readonly(a.pool_mint),
        AccountMeta::readonly(a.token_account_pool),
        AccountMeta::writable(a.reward_mint),
        AccountMeta::writable(a.reward_token_account),
        AccountMeta::readonly(a.token_program),
    };

    return make_instruction(to_string(FarmTag::PrintPendingReward), program_id,
                            std::move(accounts), std::move(data));
}

} // namespace farm
} // namespace stableswap
