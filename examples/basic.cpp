// StableSwap - Basic Usage Example

#include <stableswap/admin.hpp>
#include <stableswap/config.hpp>
#include <stableswap/error.hpp>
#include <stableswap/json.hpp>
#include <stableswap/loader.hpp>
#include <stableswap/logging.hpp>
#include <stableswap/swap.hpp>

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using namespace stableswap;

// Prints instead of signing and sending; returns a running counter as the
// confirmation identifier.
class PrintingSubmitter : public InstructionSubmitter {
public:
    std::string submit(const Instruction& instruction,
                       const std::vector<PublicKey>& signers) override {
        nlohmann::json j = instruction;
        j["signers"] = signers;
        std::cout << j.dump(2) << "\n";
        return "dry-run-" + std::to_string(++submitted_);
    }

private:
    int submitted_ = 0;
};

int main(int argc, char* argv[]) {
    std::string config_path = "examples/stableswap.toml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "  --config PATH  TOML config (default: examples/stableswap.toml)\n"
                      << "  --help         Show this help\n";
            return 0;
        }
    }

    Config config;
    try {
        config = Config::from_file(config_path);
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 1;
    } catch (const CodecError& e) {
        std::cerr << "[Config] " << to_string(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }

    logging::init(config.general.log_level);
    auto log = logging::logger();
    log->info("swap program {}", config.programs.swap_program_id.to_base58());

    PrintingSubmitter submitter;

    // Placeholder accounts; a real client derives these from on-chain state
    PublicKey user;
    user.bytes.fill(7);
    PublicKey config_account;
    config_account.bytes.fill(3);

    try {
        instructions::SwapAccounts accounts;
        accounts.swap = PublicKey::from_base58("4wBqpZM9xaSheZzJSMawUKKwhdpChKbZ5eu5ky4Vigw");
        accounts.user_source = user;
        accounts.user_destination = user;
        accounts.token_program = config.programs.token_program_id;

        Instruction ix = instructions::swap(config.programs.swap_program_id, accounts,
                                            instructions::SwapParams{100000, 0});
        std::string id = submitter.submit(ix, {user});
        log->info("submitted swap: {}", id);

        instructions::AdminAccounts admin{config_account, accounts.swap, user};
        Instruction fees = instructions::set_new_fees(config.programs.swap_program_id,
                                                      admin, config.pool.fees);
        id = submitter.submit(fees, {user});
        log->info("submitted set_new_fees: {}", id);
    } catch (const CodecError& e) {
        log->error("{}: {}", to_string(e.kind()), e.what());
        return 1;
    }

    return 0;
}
