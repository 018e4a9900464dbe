#ifndef STABLESWAP_ADMIN_HPP
#define STABLESWAP_ADMIN_HPP

#include "stableswap/instruction.hpp"
#include "stableswap/state.hpp"

namespace stableswap {
namespace instructions {

// =============================================================================
// Admin Family (tags 100-109)
// =============================================================================
//
// Every admin instruction is signed by the config account and the admin.
// Most also carry the pool ("swap") account they act on.

struct AdminAccounts {
    PublicKey config;
    PublicKey swap;
    PublicKey admin;
};

// Tag 100. Config account is created writable.
struct InitializeConfigParams {
    I128 amp_factor = DEFAULT_AMP_FACTOR;
    FeeSchedule fees = DEFAULT_FEES;
    RewardSchedule rewards = DEFAULT_REWARDS;
};

Instruction initialize_config(const PublicKey& program_id,
                              const PublicKey& config,
                              const PublicKey& admin,
                              const InitializeConfigParams& params);

// Tag 101. Ramp the amplification factor to target_amp by stop_ramp_ts.
struct RampAParams {
    I128 target_amp = 0;
    I128 stop_ramp_ts = 0;
};

Instruction ramp_a(const PublicKey& program_id,
                   const AdminAccounts& accounts,
                   const RampAParams& params);

// Tag 102
Instruction stop_ramp_a(const PublicKey& program_id, const AdminAccounts& accounts);

// Tag 103
Instruction pause(const PublicKey& program_id, const AdminAccounts& accounts);

// Tag 104
Instruction unpause(const PublicKey& program_id, const AdminAccounts& accounts);

// Tag 105. authority is the pool's derived authority; the token program
// is used to read the new fee account's mint and owner.
Instruction set_fee_account(const PublicKey& program_id,
                            const AdminAccounts& accounts,
                            const PublicKey& authority,
                            const PublicKey& new_fee_account,
                            const PublicKey& token_program = ids::token_program());

// Tag 106. No pool account.
Instruction apply_new_admin(const PublicKey& program_id,
                            const PublicKey& config,
                            const PublicKey& admin);

// Tag 107. No pool account.
Instruction commit_new_admin(const PublicKey& program_id,
                             const PublicKey& config,
                             const PublicKey& admin,
                             const PublicKey& new_admin);

// Tag 108. Config is passed unsigned.
Instruction set_new_fees(const PublicKey& program_id,
                         const AdminAccounts& accounts,
                         const FeeSchedule& fees);

// Tag 109
Instruction set_new_rewards(const PublicKey& program_id,
                            const AdminAccounts& accounts,
                            const RewardSchedule& rewards);

} // namespace instructions
} // namespace stableswap

#endif // STABLESWAP_ADMIN_HPP
