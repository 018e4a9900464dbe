#ifndef STABLESWAP_LOADER_HPP
#define STABLESWAP_LOADER_HPP

#include "stableswap/instruction.hpp"
#include "stableswap/state.hpp"
#include <string>
#include <vector>

namespace stableswap {

// =============================================================================
// External Boundary
// =============================================================================

// Account as returned by the RPC collaborator: recorded owner plus raw bytes.
struct RawAccount {
    PublicKey owner;
    Bytes data;
};

// Fetches raw account bytes. Implemented outside this library.
class AccountSource {
public:
    virtual ~AccountSource() = default;

    virtual RawAccount fetch_account(const PublicKey& address) = 0;
};

// Builds, signs and submits a transaction around an instruction and returns
// a confirmation identifier. Implemented outside this library.
class InstructionSubmitter {
public:
    virtual ~InstructionSubmitter() = default;

    virtual std::string submit(const Instruction& instruction,
                               const std::vector<PublicKey>& signers) = 0;
};

// =============================================================================
// State Loaders
// =============================================================================
//
// Each loader decodes (StructuralError if short), then checks the recorded
// owner against expected_program (OwnershipError), then the initialization
// flag (UninitializedError). The struct is returned only if all pass.

PoolConfig load_pool_config(const RawAccount& account, const PublicKey& expected_program);

PoolState load_pool_state(const RawAccount& account, const PublicKey& expected_program);

FarmState load_farm_state(const RawAccount& account,
                          const PublicKey& expected_program,
                          FarmLayoutVersion version);

// Also throws StructuralError when positions_len exceeds
// MAX_LIQUIDITY_POSITIONS, after the owner and initialization checks.
LiquidityProvider load_liquidity_provider(const RawAccount& account,
                                          const PublicKey& expected_program);

// Fetch-and-load against one AccountSource. Holds no state between calls.
class StateLoader {
public:
    StateLoader(AccountSource& source,
                const PublicKey& swap_program,
                const PublicKey& farm_program);

    // Non-copyable
    StateLoader(const StateLoader&) = delete;
    StateLoader& operator=(const StateLoader&) = delete;

    PoolConfig pool_config(const PublicKey& address);
    PoolState pool_state(const PublicKey& address);
    FarmState farm_state(const PublicKey& address, FarmLayoutVersion version);
    LiquidityProvider liquidity_provider(const PublicKey& address);

    const PublicKey& swap_program() const { return swap_program_; }
    const PublicKey& farm_program() const { return farm_program_; }

private:
    AccountSource& source_;
    PublicKey swap_program_;
    PublicKey farm_program_;
};

} // namespace stableswap

#endif // STABLESWAP_LOADER_HPP
