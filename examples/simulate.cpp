// synx - Simulation Example
// Runs a deposit / mint / price crash / liquidation cycle against SimHost

#include <synx/logger.hpp>
#include <synx/math.hpp>
#include <synx/synx.hpp>
#include <iostream>

using namespace synx;

namespace {

void print_position(const SX& sx, const Identity& account) {
    auto pos = sx.get_position(account);
    if (!pos) {
        std::cout << "  " << account.str() << ": no position\n";
        return;
    }
    std::cout << "  " << account.str()
              << ": collateral " << math::to_string(pos->collateral_deposited)
              << ", debt " << math::to_string(pos->synthetic_minted)
              << ", health "
              << (pos->position_health.is_unbounded()
                      ? std::string("unbounded")
                      : math::to_string(*pos->position_health.value()) + "%")
              << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    try {
        if (argc > 1) {
            config = Config::from_file(argv[1]);
        } else {
            config.with_admin("admin").set_log_level("info");
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    auto level = parse_log_level(config.general.log_level).value_or(LogLevel::INFO);
    Logger::Initialize(config.general.log_file.value_or(""), level, config.general.audit_events);

    SimHost host;
    host.credit("alice", 1000);
    host.credit("keeper", 0);

    try {
        SX sx(host, config);
        const Identity admin = config.admin;

        // Admin registers an oracle, oracle publishes 1.0
        host.set_caller(admin);
        sx.register_oracle("oracle-1");
        host.set_caller("oracle-1");
        sx.submit_price(1, PRICE_ONE, 95);

        // Alice deposits and mints after the cooldown
        host.set_caller("alice");
        sx.deposit(200);
        host.advance_blocks(config.protocol.cooldown_blocks);
        std::cout << "Headroom before mint: " << math::to_string(sx.max_mintable("alice")) << "\n";
        Amount net = sx.mint(sx.max_mintable("alice"));
        std::cout << "Minted (net of fee): " << math::to_string(net) << "\n";
        print_position(sx, "alice");

        // Price drops to 0.7
        host.advance_blocks(1);
        host.set_caller("oracle-1");
        sx.submit_price(1, 70000000, 95);

        for (const auto& account : sx.liquidatable_accounts()) {
            auto pos = sx.get_position(account);
            Amount cover = pos->synthetic_minted / 2;

            host.set_caller("keeper");
            uint64_t id = sx.liquidate(account, cover);
            auto record = sx.get_liquidation(id);
            std::cout << "Liquidation #" << id << " of " << account.str()
                      << ": debt " << math::to_string(record->debt_covered)
                      << ", seized " << math::to_string(record->collateral_seized)
                      << ", reward " << math::to_string(record->reward) << "\n";
        }
        print_position(sx, "alice");

        ReconciliationReport r = sx.reconcile();
        std::cout << "\nReconciliation:\n"
                  << "  total_collateral " << math::to_string(r.total_collateral)
                  << " vs positions " << math::to_string(r.position_collateral)
                  << " (drift " << math::to_string(r.collateral_drift) << ")\n"
                  << "  total_supply " << math::to_string(r.total_synthetic_supply)
                  << " vs positions " << math::to_string(r.position_debt) << "\n";

        auto stats = sx.get_stats();
        std::cout << "\nStats: " << stats.positions << " positions, "
                  << stats.submissions << " submissions, "
                  << stats.liquidations << " liquidations, "
                  << "keeper balance " << math::to_string(host.balance("keeper")) << "\n";

        std::cout << "\nSnapshot: " << sx.snapshot().to_json() << "\n";
    } catch (const SXError& e) {
        std::cerr << "Protocol error: " << e.what() << "\n";
        Logger::Shutdown();
        return 2;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        Logger::Shutdown();
        return 1;
    }

    Logger::Shutdown();
    return 0;
}
