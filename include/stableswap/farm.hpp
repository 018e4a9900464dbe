#ifndef STABLESWAP_FARM_HPP
#define STABLESWAP_FARM_HPP

#include "stableswap/instruction.hpp"
#include "stableswap/state.hpp"

namespace stableswap {
namespace farm {

// =============================================================================
// Liquidity-Farming Program
// =============================================================================
//
// Tags live in the farm program's own namespace (FarmTag) and may repeat
// values used by the swap program.

// --- Initialize farm (tag 108) -------------------------------------------------

struct InitializeFarmAccounts {
    PublicKey farm_base;              // writable
    PublicKey farm;                   // writable
    PublicKey authority;
    PublicKey admin;
    PublicKey admin_fee_account_pool;
    PublicKey pool_mint;
    PublicKey token_account_pool;
    PublicKey reward_mint;            // writable
    PublicKey reward_token_account;   // writable
    PublicKey token_program = ids::token_program();
};

struct InitializeFarmParams {
    I128 nonce = 0;
    FeeSchedule fees = DEFAULT_FEES;
};

Instruction initialize(const PublicKey& program_id,
                       const InitializeFarmAccounts& accounts,
                       const InitializeFarmParams& params);

// --- Enable user (tag 30) ------------------------------------------------------

struct EnableUserAccounts {
    PublicKey farm;                   // writable
    PublicKey authority;
    PublicKey user_farming;
    PublicKey owner;
};

Instruction enable_user(const PublicKey& program_id, const EnableUserAccounts& accounts);

// --- Deposit (tag 31) ----------------------------------------------------------

struct DepositAccounts {
    PublicKey farm_base;              // writable
    PublicKey farm;                   // writable
    PublicKey authority;
    PublicKey admin_fee_account_reward;
    PublicKey source_pool;
    PublicKey user_farming;
    PublicKey farm_pool;
    PublicKey reward_mint;            // writable
    PublicKey reward_destination;
    PublicKey token_program = ids::token_program();
};

Instruction deposit(const PublicKey& program_id,
                    const DepositAccounts& accounts,
                    I128 pool_token_amount);

// --- Withdraw (tag 32) and emergency withdraw (tag 33) -------------------------

struct WithdrawAccounts {
    PublicKey farm_base;              // writable
    PublicKey farm;                   // writable
    PublicKey authority;
    PublicKey admin_fee_account_reward;
    PublicKey user_pool_account;
    PublicKey user_farming;
    PublicKey pool_mint;
    PublicKey reward_mint;            // writable
    PublicKey reward_token_account;   // writable
    PublicKey token_program = ids::token_program();
};

Instruction withdraw(const PublicKey& program_id,
                     const WithdrawAccounts& accounts,
                     I128 pool_token_amount);

Instruction emergency_withdraw(const PublicKey& program_id, const WithdrawAccounts& accounts);

// --- Print pending reward (tag 34) ---------------------------------------------

struct PrintPendingRewardAccounts {
    PublicKey farm;                   // writable
    PublicKey authority;
    PublicKey admin;
    PublicKey admin_fee_account_pool;
    PublicKey pool_mint;
    PublicKey token_account_pool;
    PublicKey reward_mint;            // writable
    PublicKey reward_token_account;   // writable
    PublicKey token_program = ids::token_program();
};

Instruction print_pending_reward(const PublicKey& program_id,
                                 const PrintPendingRewardAccounts& accounts,
                                 const InitializeFarmParams& params);

} // namespace farm
} // namespace stableswap

#endif // STABLESWAP_FARM_HPP
