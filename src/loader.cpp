// =============================================================================
// loader.cpp - Owner- and initialization-checked state loading
// =============================================================================

#include "stableswap/loader.hpp"
#include "stableswap/codec.hpp"
#include "stableswap/error.hpp"
#include "stableswap/logging.hpp"

namespace stableswap {

namespace {

void check_owner(const RawAccount& account, const PublicKey& expected_program,
                 const char* what) {
    if (account.owner != expected_program) {
        logging::logger()->warn("{}: owner {} is not program {}", what,
                                account.owner.to_base58(), expected_program.to_base58());
        throw OwnershipError(std::string(what) + ": account owned by " +
                             account.owner.to_base58() + ", expected " +
                             expected_program.to_base58());
    }
}

void check_initialized(bool initialized, const char* what) {
    if (!initialized) {
        logging::logger()->warn("{}: account is not initialized", what);
        throw UninitializedError(std::string(what) + ": account is not initialized");
    }
}

} // anonymous namespace

PoolConfig load_pool_config(const RawAccount& account, const PublicKey& expected_program) {
    PoolConfig config = layout::decode<PoolConfigLayout>(account.data);
    check_owner(account, expected_program, "pool config");
    check_initialized(config.initialized(), "pool config");
    return config;
}

PoolState load_pool_state(const RawAccount& account, const PublicKey& expected_program) {
    PoolState state = layout::decode<PoolStateLayout>(account.data);
    check_owner(account, expected_program, "pool state");
    check_initialized(state.initialized(), "pool state");
    return state;
}

FarmState load_farm_state(const RawAccount& account,
                          const PublicKey& expected_program,
                          FarmLayoutVersion version) {
    FarmState state = decode_farm_state(account.data, version);
    check_owner(account, expected_program, "farm state");
    check_initialized(is_initialized(state), "farm state");
    return state;
}

LiquidityProvider load_liquidity_provider(const RawAccount& account,
                                          const PublicKey& expected_program) {
    LiquidityProvider provider = layout::decode<LiquidityProviderLayout>(account.data);
    check_owner(account, expected_program, "liquidity provider");
    check_initialized(provider.initialized(), "liquidity provider");
    if (provider.positions_len > MAX_LIQUIDITY_POSITIONS) {
        logging::logger()->warn("liquidity provider: positions_len {} out of range",
                                provider.positions_len);
        throw StructuralError("liquidity provider: " +
                              std::to_string(provider.positions_len) +
                              " positions exceeds the maximum of " +
                              std::to_string(MAX_LIQUIDITY_POSITIONS));
    }
    return provider;
}

// =============================================================================
// StateLoader
// =============================================================================

StateLoader::StateLoader(AccountSource& source,
                         const PublicKey& swap_program,
                         const PublicKey& farm_program)
    : source_(source)
    , swap_program_(swap_program)
    , farm_program_(farm_program) {}

PoolConfig StateLoader::pool_config(const PublicKey& address) {
    logging::logger()->debug("loading pool config {}", address.to_base58());
    return load_pool_config(source_.fetch_account(address), swap_program_);
}

PoolState StateLoader::pool_state(const PublicKey& address) {
    logging::logger()->debug("loading pool state {}", address.to_base58());
    return load_pool_state(source_.fetch_account(address), swap_program_);
}

FarmState StateLoader::farm_state(const PublicKey& address, FarmLayoutVersion version) {
    logging::logger()->debug("loading farm state {} ({})", address.to_base58(),
                             to_string(version));
    return load_farm_state(source_.fetch_account(address), farm_program_, version);
}

LiquidityProvider StateLoader::liquidity_provider(const PublicKey& address) {
    logging::logger()->debug("loading liquidity provider {}", address.to_base58());
    return load_liquidity_provider(source_.fetch_account(address), swap_program_);
}

} // namespace stableswap
