// =============================================================================
// swap.cpp - Swap-family instruction encoders
// =============================================================================

#include "stableswap/swap.hpp"
#include "stableswap/codec.hpp"

namespace stableswap {
namespace instructions {

using layout::U8;
using layout::U64;

namespace {

inline uint8_t tag_of(SwapTag tag) { return static_cast<uint8_t>(tag); }

} // anonymous namespace

Instruction initialize_pool(const PublicKey& program_id,
                            const InitializePoolAccounts& a,
                            const InitializePoolParams& p) {
    uint8_t nonce = U8::narrow(p.nonce, "nonce");
    uint64_t amp_factor = U64::narrow(p.amp_factor, "amp_factor");
    uint64_t k = U64::narrow(p.k, "k");
    uint64_t i = U64::narrow(p.i, "i");
    uint64_t is_open_twap = U64::narrow(p.is_open_twap, "is_open_twap");

    Bytes data = make_payload<U8, U64, FeeScheduleLayout, U64, U64, U64>(
        tag_of(SwapTag::Initialize), nonce, amp_factor, p.fees, k, i, is_open_twap);

    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.swap, true),
        AccountMeta::readonly(a.authority),
        AccountMeta::readonly(a.admin),
        AccountMeta::readonly(a.admin_fee_a),
        AccountMeta::readonly(a.admin_fee_b),
        AccountMeta::readonly(a.mint_a),
        AccountMeta::readonly(a.token_a),
        AccountMeta::readonly(a.mint_b),
        AccountMeta::readonly(a.token_b),
        AccountMeta::writable(a.pool_mint),
        AccountMeta::writable(a.pool_destination),
        AccountMeta::readonly(a.reward_mint),
        AccountMeta::readonly(a.reward_token_account),
        AccountMeta::readonly(a.token_program),
    };

    return make_instruction(to_string(SwapTag::Initialize), program_id,
                            std::move(accounts), std::move(data));
}

Instruction swap(const PublicKey& program_id,
                 const SwapAccounts& a,
                 const SwapParams& p) {
    uint64_t amount_in = U64::narrow(p.amount_in, "amount_in");
    uint64_t minimum_amount_out = U64::narrow(p.minimum_amount_out, "minimum_amount_out");

    Bytes data = make_payload<U64, U64>(tag_of(SwapTag::Swap), amount_in, minimum_amount_out);

    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.swap),
        AccountMeta::readonly(a.authority),
        AccountMeta::writable(a.user_source),
        AccountMeta::writable(a.pool_source),
        AccountMeta::writable(a.pool_destination),
        AccountMeta::writable(a.user_destination),
        AccountMeta::writable(a.admin_fee_destination),
        AccountMeta::readonly(a.token_program),
        AccountMeta::readonly(ids::sysvar_clock()),
    };

    return make_instruction(to_string(SwapTag::Swap), program_id,
                            std::move(accounts), std::move(data));
}

Instruction deposit(const PublicKey& program_id,
                    const DepositAccounts& a,
                    const DepositParams& p) {
    uint64_t amount_a = U64::narrow(p.token_amount_a, "token_amount_a");
    uint64_t amount_b = U64::narrow(p.token_amount_b, "token_amount_b");
    uint64_t min_mint = U64::narrow(p.minimum_pool_token_amount, "minimum_pool_token_amount");

    Bytes data = make_payload<U64, U64, U64>(tag_of(SwapTag::Deposit),
                                             amount_a, amount_b, min_mint);

    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.swap),
        AccountMeta::readonly(a.authority),
        AccountMeta::writable(a.source_a),
        AccountMeta::writable(a.source_b),
        AccountMeta::writable(a.into_a),
        AccountMeta::writable(a.into_b),
        AccountMeta::writable(a.pool_mint),
        AccountMeta::writable(a.pool_destination),
        AccountMeta::readonly(a.token_program),
        AccountMeta::readonly(ids::sysvar_clock()),
    };

    return make_instruction(to_string(SwapTag::Deposit), program_id,
                            std::move(accounts), std::move(data));
}

Instruction withdraw(const PublicKey& program_id,
                     const WithdrawAccounts& a,
                     const WithdrawParams& p) {
    uint64_t pool_amount = U64::narrow(p.pool_token_amount, "pool_token_amount");
    uint64_t min_a = U64::narrow(p.minimum_token_a, "minimum_token_a");
    uint64_t min_b = U64::narrow(p.minimum_token_b, "minimum_token_b");

    Bytes data = make_payload<U64, U64, U64>(tag_of(SwapTag::Withdraw),
                                             pool_amount, min_a, min_b);

    // No clock sysvar for withdraw
    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.swap),
        AccountMeta::readonly(a.authority),
        AccountMeta::writable(a.pool_mint),
        AccountMeta::writable(a.source_pool),
        AccountMeta::writable(a.from_a),
        AccountMeta::writable(a.from_b),
        AccountMeta::writable(a.user_a),
        AccountMeta::writable(a.user_b),
        AccountMeta::writable(a.admin_fee_a),
        AccountMeta::writable(a.admin_fee_b),
        AccountMeta::readonly(a.token_program),
    };

    return make_instruction(to_string(SwapTag::Withdraw), program_id,
                            std::move(accounts), std::move(data));
}

Instruction withdraw_one(const PublicKey& program_id,
                         const WithdrawOneAccounts& a,
                         const WithdrawOneParams& p) {
    uint64_t pool_amount = U64::narrow(p.pool_token_amount, "pool_token_amount");
    uint64_t min_amount = U64::narrow(p.minimum_token_amount, "minimum_token_amount");

    Bytes data = make_payload<U64, U64>(tag_of(SwapTag::WithdrawOne), pool_amount, min_amount);

    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.swap),
        AccountMeta::readonly(a.authority),
        AccountMeta::writable(a.pool_mint),
        AccountMeta::writable(a.source_pool),
        AccountMeta::writable(a.base),
        AccountMeta::writable(a.quote),
        AccountMeta::writable(a.user_destination),
        AccountMeta::writable(a.admin_fee_destination),
        AccountMeta::readonly(a.token_program),
        AccountMeta::readonly(ids::sysvar_clock()),
    };

    return make_instruction(to_string(SwapTag::WithdrawOne), program_id,
                            std::move(accounts), std::move(data));
}

Instruction initialize_liquidity_provider(const PublicKey& program_id,
                                          const PublicKey& liquidity_provider,
                                          const PublicKey& owner) {
    std::vector<AccountMeta> accounts{
        AccountMeta::writable(liquidity_provider),
        AccountMeta::readonly(owner, true),
    };

    return make_instruction(to_string(SwapTag::InitializeLiquidityProvider), program_id,
                            std::move(accounts),
                            make_payload<>(tag_of(SwapTag::InitializeLiquidityProvider)));
}

Instruction claim_liquidity_rewards(const PublicKey& program_id,
                                    const ClaimLiquidityRewardsAccounts& a) {
    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.config),
        AccountMeta::readonly(a.swap),
        AccountMeta::readonly(a.authority),
        AccountMeta::writable(a.liquidity_provider),
        AccountMeta::readonly(a.owner, true),
        AccountMeta::writable(a.claim_destination),
        AccountMeta::writable(a.claim_mint),
        AccountMeta::readonly(a.token_program),
    };

    return make_instruction(to_string(SwapTag::ClaimLiquidityRewards), program_id,
                            std::move(accounts),
                            make_payload<>(tag_of(SwapTag::ClaimLiquidityRewards)));
}

Instruction refresh_liquidity_obligation(const PublicKey& program_id,
                                         const PublicKey& swap,
                                         const std::vector<PublicKey>& liquidity_providers) {
    std::vector<AccountMeta> accounts;
    accounts.reserve(2 + liquidity_providers.size());
    accounts.push_back(AccountMeta::readonly(swap));
    accounts.push_back(AccountMeta::readonly(ids::sysvar_clock()));
    for (const auto& provider : liquidity_providers) {
        accounts.push_back(AccountMeta::writable(provider));
    }

    return make_instruction(to_string(SwapTag::RefreshLiquidityObligation), program_id,
                            std::move(accounts),
                            make_payload<>(tag_of(SwapTag::RefreshLiquidityObligation)));
}

} // namespace instructions
} // namespace stableswap
