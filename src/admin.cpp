// =============================================================================
// admin.cpp - Admin-family instruction encoders
// =============================================================================

#include "stableswap/admin.hpp"
#include "stableswap/codec.hpp"

namespace stableswap {
namespace instructions {

using layout::I64;
using layout::U64;

namespace {

inline uint8_t tag_of(AdminTag tag) { return static_cast<uint8_t>(tag); }

// config (signer), swap (signer), admin (signer)
std::vector<AccountMeta> signed_triple(const AdminAccounts& a) {
    return {
        AccountMeta::readonly(a.config, true),
        AccountMeta::readonly(a.swap, true),
        AccountMeta::readonly(a.admin, true),
    };
}

Instruction flag_only(AdminTag tag, const PublicKey& program_id,
                      std::vector<AccountMeta> accounts) {
    return make_instruction(to_string(tag), program_id, std::move(accounts),
                            make_payload<>(tag_of(tag)));
}

} // anonymous namespace

Instruction initialize_config(const PublicKey& program_id,
                              const PublicKey& config,
                              const PublicKey& admin,
                              const InitializeConfigParams& p) {
    uint64_t amp_factor = U64::narrow(p.amp_factor, "amp_factor");

    Bytes data = make_payload<U64, FeeScheduleLayout, RewardScheduleLayout>(
        tag_of(AdminTag::InitializeConfig), amp_factor, p.fees, p.rewards);

    std::vector<AccountMeta> accounts{
        AccountMeta::writable(config, true),
        AccountMeta::readonly(admin, true),
    };

    return make_instruction(to_string(AdminTag::InitializeConfig), program_id,
                            std::move(accounts), std::move(data));
}

Instruction ramp_a(const PublicKey& program_id,
                   const AdminAccounts& a,
                   const RampAParams& p) {
    uint64_t target_amp = U64::narrow(p.target_amp, "target_amp");
    int64_t stop_ramp_ts = I64::narrow(p.stop_ramp_ts, "stop_ramp_ts");

    Bytes data = make_payload<U64, I64>(tag_of(AdminTag::RampA), target_amp, stop_ramp_ts);

    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.config, true),
        AccountMeta::writable(a.swap, true),
        AccountMeta::readonly(a.admin, true),
        AccountMeta::readonly(ids::sysvar_clock()),
    };

    return make_instruction(to_string(AdminTag::RampA), program_id,
                            std::move(accounts), std::move(data));
}

Instruction stop_ramp_a(const PublicKey& program_id, const AdminAccounts& a) {
    auto accounts = signed_triple(a);
    accounts.push_back(AccountMeta::readonly(ids::sysvar_clock()));
    return flag_only(AdminTag::StopRampA, program_id, std::move(accounts));
}

Instruction pause(const PublicKey& program_id, const AdminAccounts& a) {
    return flag_only(AdminTag::Pause, program_id, signed_triple(a));
}

Instruction unpause(const PublicKey& program_id, const AdminAccounts& a) {
    return flag_only(AdminTag::Unpause, program_id, signed_triple(a));
}

Instruction set_fee_account(const PublicKey& program_id,
                            const AdminAccounts& a,
                            const PublicKey& authority,
                            const PublicKey& new_fee_account,
                            const PublicKey& token_program) {
    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.config, true),
        AccountMeta::readonly(a.swap, true),
        AccountMeta::readonly(authority),
        AccountMeta::readonly(a.admin, true),
        AccountMeta::readonly(new_fee_account),
        AccountMeta::readonly(token_program),
    };
    return flag_only(AdminTag::SetFeeAccount, program_id, std::move(accounts));
}

Instruction apply_new_admin(const PublicKey& program_id,
                            const PublicKey& config,
                            const PublicKey& admin) {
    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(config, true),
        AccountMeta::readonly(admin, true),
        AccountMeta::readonly(ids::sysvar_clock()),
    };
    return flag_only(AdminTag::ApplyNewAdmin, program_id, std::move(accounts));
}

Instruction commit_new_admin(const PublicKey& program_id,
                             const PublicKey& config,
                             const PublicKey& admin,
                             const PublicKey& new_admin) {
    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(config, true),
        AccountMeta::readonly(admin, true),
        AccountMeta::readonly(new_admin),
        AccountMeta::readonly(ids::sysvar_clock()),
    };
    return flag_only(AdminTag::CommitNewAdmin, program_id, std::move(accounts));
}

Instruction set_new_fees(const PublicKey& program_id,
                         const AdminAccounts& a,
                         const FeeSchedule& fees) {
    Bytes data = make_payload<FeeScheduleLayout>(tag_of(AdminTag::SetNewFees), fees);

    std::vector<AccountMeta> accounts{
        AccountMeta::readonly(a.config),
        AccountMeta::readonly(a.swap, true),
        AccountMeta::readonly(a.admin, true),
    };

    return make_instruction(to_string(AdminTag::SetNewFees), program_id,
                            std::move(accounts), std::move(data));
}

Instruction set_new_rewards(const PublicKey& program_id,
                            const AdminAccounts& a,
                            const RewardSchedule& rewards) {
    Bytes data = make_payload<RewardScheduleLayout>(tag_of(AdminTag::SetNewRewards), rewards);

    return make_instruction(to_string(AdminTag::SetNewRewards), program_id,
                            signed_triple(a), std::move(data));
}

} // namespace instructions
} // namespace stableswap
