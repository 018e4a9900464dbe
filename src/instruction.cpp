// =============================================================================
// instruction.cpp - Instruction record, tag names and payload classification
// =============================================================================

#include "stableswap/instruction.hpp"
#include "stableswap/error.hpp"
#include "stableswap/logging.hpp"
#include <string>

namespace stableswap {

uint8_t Instruction::tag() const {
    if (data.empty()) {
        throw StructuralError("instruction payload is empty");
    }
    return data[0];
}

size_t Instruction::signer_count() const {
    size_t count = 0;
    for (const auto& meta : accounts) {
        if (meta.is_signer) ++count;
    }
    return count;
}

// =============================================================================
// Tag Names
// =============================================================================

std::string to_string(SwapTag tag) {
    switch (tag) {
        case SwapTag::Initialize: return "initialize";
        case SwapTag::Swap: return "swap";
        case SwapTag::Deposit: return "deposit";
        case SwapTag::Withdraw: return "withdraw";
        case SwapTag::WithdrawOne: return "withdraw_one";
        case SwapTag::InitializeLiquidityProvider: return "initialize_liquidity_provider";
        case SwapTag::ClaimLiquidityRewards: return "claim_liquidity_rewards";
        case SwapTag::RefreshLiquidityObligation: return "refresh_liquidity_obligation";
    }
    return "unknown";
}

std::string to_string(AdminTag tag) {
    switch (tag) {
        case AdminTag::InitializeConfig: return "initialize_config";
        case AdminTag::RampA: return "ramp_a";
        case AdminTag::StopRampA: return "stop_ramp_a";
        case AdminTag::Pause: return "pause";
        case AdminTag::Unpause: return "unpause";
        case AdminTag::SetFeeAccount: return "set_fee_account";
        case AdminTag::ApplyNewAdmin: return "apply_new_admin";
        case AdminTag::CommitNewAdmin: return "commit_new_admin";
        case AdminTag::SetNewFees: return "set_new_fees";
        case AdminTag::SetNewRewards: return "set_new_rewards";
    }
    return "unknown";
}

std::string to_string(FarmTag tag) {
    switch (tag) {
        case FarmTag::EnableUser: return "farm_enable_user";
        case FarmTag::Deposit: return "farm_deposit";
        case FarmTag::Withdraw: return "farm_withdraw";
        case FarmTag::EmergencyWithdraw: return "farm_emergency_withdraw";
        case FarmTag::PrintPendingReward: return "farm_print_pending_reward";
        case FarmTag::Initialize: return "farm_initialize";
    }
    return "unknown";
}

std::string to_string(InstructionFamily family) {
    switch (family) {
        case InstructionFamily::Swap: return "swap";
        case InstructionFamily::Admin: return "admin";
    }
    return "unknown";
}

std::optional<InstructionFamily> classify(const Bytes& payload) {
    if (payload.empty()) {
        throw StructuralError("cannot classify an empty payload");
    }
    uint8_t tag = payload[0];
    if (tag >= static_cast<uint8_t>(AdminTag::InitializeConfig) &&
        tag <= static_cast<uint8_t>(AdminTag::SetNewRewards)) {
        return InstructionFamily::Admin;
    }
    if (tag <= static_cast<uint8_t>(SwapTag::RefreshLiquidityObligation)) {
        return InstructionFamily::Swap;
    }
    return std::nullopt;
}

Instruction make_instruction(const std::string& name,
                             const PublicKey& program_id,
                             std::vector<AccountMeta> accounts,
                             Bytes data) {
    std::string tag = data.empty() ? "none" : std::to_string(data[0]);
    logging::logger()->debug("encoded {}: tag={} payload={} bytes accounts={}",
                             name, tag, data.size(), accounts.size());
    return Instruction(program_id, std::move(accounts), std::move(data));
}

} // namespace stableswap
