#ifndef STABLESWAP_INSTRUCTION_HPP
#define STABLESWAP_INSTRUCTION_HPP

#include "stableswap/layout.hpp"
#include "stableswap/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stableswap {

// =============================================================================
// Account References
// =============================================================================

struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    AccountMeta() = default;
    AccountMeta(const PublicKey& key, bool signer, bool writable)
        : pubkey(key), is_signer(signer), is_writable(writable) {}

    static AccountMeta readonly(const PublicKey& key, bool signer = false) {
        return AccountMeta(key, signer, false);
    }

    static AccountMeta writable(const PublicKey& key, bool signer = false) {
        return AccountMeta(key, signer, true);
    }

    bool operator==(const AccountMeta& other) const {
        return pubkey == other.pubkey && is_signer == other.is_signer &&
               is_writable == other.is_writable;
    }
    bool operator!=(const AccountMeta& other) const { return !(*this == other); }
};

// =============================================================================
// Instruction - submittable unit handed to the transaction collaborator
// =============================================================================

struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;  // positional; order is part of the contract
    Bytes data;                         // tag byte followed by the argument payload

    Instruction() = default;
    Instruction(const PublicKey& program, std::vector<AccountMeta> accts, Bytes payload)
        : program_id(program), accounts(std::move(accts)), data(std::move(payload)) {}

    // Leading tag byte. Throws StructuralError on an empty payload.
    uint8_t tag() const;

    size_t signer_count() const;

    bool operator==(const Instruction& other) const {
        return program_id == other.program_id && accounts == other.accounts &&
               data == other.data;
    }
    bool operator!=(const Instruction& other) const { return !(*this == other); }
};

// =============================================================================
// Tags
// =============================================================================

// Swap program, swap family (0-7)
enum class SwapTag : uint8_t {
    Initialize = 0,
    Swap = 1,
    Deposit = 2,
    Withdraw = 3,
    WithdrawOne = 4,
    InitializeLiquidityProvider = 5,
    ClaimLiquidityRewards = 6,
    RefreshLiquidityObligation = 7,
};

// Swap program, admin family (100-109)
enum class AdminTag : uint8_t {
    InitializeConfig = 100,
    RampA = 101,
    StopRampA = 102,
    Pause = 103,
    Unpause = 104,
    SetFeeAccount = 105,
    ApplyNewAdmin = 106,
    CommitNewAdmin = 107,
    SetNewFees = 108,
    SetNewRewards = 109,
};

// Farm program (separate tag namespace)
enum class FarmTag : uint8_t {
    EnableUser = 30,
    Deposit = 31,
    Withdraw = 32,
    EmergencyWithdraw = 33,
    PrintPendingReward = 34,
    Initialize = 108,
};

std::string to_string(SwapTag tag);
std::string to_string(AdminTag tag);
std::string to_string(FarmTag tag);

enum class InstructionFamily : uint8_t {
    Swap,
    Admin,
};

std::string to_string(InstructionFamily family);

// Family of a swap-program payload by its leading tag, or nullopt for a tag
// outside both ranges. Throws StructuralError on an empty payload.
std::optional<InstructionFamily> classify(const Bytes& payload);

// =============================================================================
// Payload Construction
// =============================================================================

// Tag byte followed by each value in its layout. The buffer is sized from
// the layouts' static spans, so exactly that many bytes are written.
template <typename... Ls>
Bytes make_payload(uint8_t tag, const typename Ls::value_type&... values) {
    Bytes data(1 + (Ls::span + ... + size_t{0}));
    data[0] = tag;
    size_t offset = 1;
    ((offset += Ls::encode(values, data.data() + offset)), ...);
    return data;
}

// Wraps program, accounts and payload, and logs the result at debug level.
Instruction make_instruction(const std::string& name,
                             const PublicKey& program_id,
                             std::vector<AccountMeta> accounts,
                             Bytes data);

} // namespace stableswap

#endif // STABLESWAP_INSTRUCTION_HPP
