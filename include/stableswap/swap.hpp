#ifndef STABLESWAP_SWAP_HPP
#define STABLESWAP_SWAP_HPP

#include "stableswap/instruction.hpp"
#include "stableswap/state.hpp"
#include <vector>

namespace stableswap {
namespace instructions {

// =============================================================================
// Swap Family (tags 0-7)
// =============================================================================
//
// Numeric arguments are wide (I128) and narrowed per field; a negative or
// too-wide value throws WidthOverflowError before any bytes are produced.

// --- Initialize pool (tag 0) ---------------------------------------------------

struct InitializePoolAccounts {
    PublicKey swap;                   // signer
    PublicKey authority;
    PublicKey admin;
    PublicKey admin_fee_a;
    PublicKey admin_fee_b;
    PublicKey mint_a;
    PublicKey token_a;
    PublicKey mint_b;
    PublicKey token_b;
    PublicKey pool_mint;              // writable
    PublicKey pool_destination;       // writable
    PublicKey reward_mint;
    PublicKey reward_token_account;
    PublicKey token_program = ids::token_program();
};

struct InitializePoolParams {
    I128 nonce = 0;
    I128 amp_factor = DEFAULT_AMP_FACTOR;
    FeeSchedule fees = DEFAULT_FEES;
    I128 k = 0;                       // curve slope
    I128 i = 0;                       // mid price
    I128 is_open_twap = TWAP_OPEN;
};

Instruction initialize_pool(const PublicKey& program_id,
                            const InitializePoolAccounts& accounts,
                            const InitializePoolParams& params);

// --- Swap (tag 1) --------------------------------------------------------------

struct SwapAccounts {
    PublicKey swap;
    PublicKey authority;
    PublicKey user_source;
    PublicKey pool_source;
    PublicKey pool_destination;
    PublicKey user_destination;
    PublicKey admin_fee_destination;
    PublicKey token_program = ids::token_program();
};

struct SwapParams {
    I128 amount_in = 0;
    I128 minimum_amount_out = 0;
};

Instruction swap(const PublicKey& program_id,
                 const SwapAccounts& accounts,
                 const SwapParams& params);

// --- Deposit (tag 2) -----------------------------------------------------------

struct DepositAccounts {
    PublicKey swap;
    PublicKey authority;
    PublicKey source_a;
    PublicKey source_b;
    PublicKey into_a;
    PublicKey into_b;
    PublicKey pool_mint;
    PublicKey pool_destination;
    PublicKey token_program = ids::token_program();
};

struct DepositParams {
    I128 token_amount_a = 0;
    I128 token_amount_b = 0;
    I128 minimum_pool_token_amount = 0;
};

Instruction deposit(const PublicKey& program_id,
                    const DepositAccounts& accounts,
                    const DepositParams& params);

// --- Withdraw (tag 3) ----------------------------------------------------------

struct WithdrawAccounts {
    PublicKey swap;
    PublicKey authority;
    PublicKey pool_mint;
    PublicKey source_pool;
    PublicKey from_a;
    PublicKey from_b;
    PublicKey user_a;
    PublicKey user_b;
    PublicKey admin_fee_a;
    PublicKey admin_fee_b;
    PublicKey token_program = ids::token_program();
};

struct WithdrawParams {
    I128 pool_token_amount = 0;
    I128 minimum_token_a = 0;
    I128 minimum_token_b = 0;
};

Instruction withdraw(const PublicKey& program_id,
                     const WithdrawAccounts& accounts,
                     const WithdrawParams& params);

// --- Withdraw single asset (tag 4) ---------------------------------------------

struct WithdrawOneAccounts {
    PublicKey swap;
    PublicKey authority;
    PublicKey pool_mint;
    PublicKey source_pool;
    PublicKey base;
    PublicKey quote;
    PublicKey user_destination;
    PublicKey admin_fee_destination;
    PublicKey token_program = ids::token_program();
};

struct WithdrawOneParams {
    I128 pool_token_amount = 0;
    I128 minimum_token_amount = 0;
};

Instruction withdraw_one(const PublicKey& program_id,
                         const WithdrawOneAccounts& accounts,
                         const WithdrawOneParams& params);

// --- Liquidity provider accounts (tags 5-7) ------------------------------------

Instruction initialize_liquidity_provider(const PublicKey& program_id,
                                          const PublicKey& liquidity_provider,
                                          const PublicKey& owner);

struct ClaimLiquidityRewardsAccounts {
    PublicKey config;
    PublicKey swap;
    PublicKey authority;              // market authority, derived from config
    PublicKey liquidity_provider;
    PublicKey owner;                  // signer
    PublicKey claim_destination;
    PublicKey claim_mint;
    PublicKey token_program = ids::token_program();
};

Instruction claim_liquidity_rewards(const PublicKey& program_id,
                                    const ClaimLiquidityRewardsAccounts& accounts);

// Liquidity providers are appended after swap and clock, writable, in order.
Instruction refresh_liquidity_obligation(const PublicKey& program_id,
                                         const PublicKey& swap,
                                         const std::vector<PublicKey>& liquidity_providers);

} // namespace instructions
} // namespace stableswap

#endif // STABLESWAP_SWAP_HPP
