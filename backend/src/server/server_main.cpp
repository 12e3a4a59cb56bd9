#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "config/market_config.hpp"
#include "dispute/dispute_service.hpp"
#include "escrow/escrow_engine.hpp"
#include "ledger/wallet_ledger.hpp"
#include "payment/mock_payment.hpp"
#include "scheduler/auto_release_scheduler.hpp"
#include "store/pg_store.hpp"
#include "util/clock.hpp"

namespace {
std::unique_ptr<IMarketStore> open_store(const MarketConfig& cfg) {
    if (cfg.database_url.empty()) {
        std::cout << "[setup] No database configured; using in-memory store." << std::endl;
        return make_memory_store();
    }
    auto store = make_pg_store(cfg.database_url, static_cast<std::size_t>(cfg.pool_size), cfg.schema_path);
    std::cout << "[setup] Database connected (pool=" << cfg.pool_size << ")" << std::endl;
    return store;
}

// The fee collector must exist before the first checkout credits it.
bool ensure_fee_collector(WalletLedger& ledger, const std::string& id) {
    if (id.empty()) return true;
    auto r = ledger.register_user(id, UserRole::ADMIN);
    if (!is_error(r)) {
        std::cout << "[setup] Registered fee collector " << id << std::endl;
        return true;
    }
    if (error_of(r).code == MarketErrorCode::UserAlreadyExists) {
        return true;
    }
    std::cerr << "[setup] Cannot register fee collector: " << describe(error_of(r)) << std::endl;
    return false;
}
}

// Usage: escrow_marketd [config.json]
int main(int argc, char** argv) {
    load_env_file();

    MarketConfig cfg;
    std::unique_ptr<IMarketStore> store;
    try {
        cfg = load_market_config(argc > 1 ? std::optional<std::string>(argv[1]) : std::nullopt);
        store = open_store(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[setup] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    SystemClock clock;
    MockPaymentProcessor payments;
    std::cout << "[setup] Payment processor running in MOCK MODE - no real payments" << std::endl;

    WalletLedger ledger{*store, clock, &payments, cfg.seller_bonds};
    EscrowEngine escrow{*store, ledger, clock};
    DisputeService disputes{*store, escrow, clock,
                            DisputeService::Options{cfg.dispute_window_days, cfg.warning_window_days}};

    if (!ensure_fee_collector(ledger, cfg.fee_collector_id)) {
        return EXIT_FAILURE;
    }

    AutoReleaseScheduler scheduler{escrow, AutoReleaseScheduler::Options{
        std::chrono::duration_cast<std::chrono::milliseconds>(cfg.auto_release_interval)}};
    scheduler.start();

    auto open = disputes.list_open();
    if (!is_error(open)) {
        for (const auto& d : std::get<std::vector<Dispute>>(open)) {
            if (disputes.should_auto_resolve(d)) {
                std::cout << "[disputes] " << d.id << " is past its deadline and awaits an adjudicator" << std::endl;
            }
        }
    }

    boost::asio::io_context ioc{1};
    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::cout << "[setup] Caught signal " << signo << ", shutting down" << std::endl;
        scheduler.stop();
        ioc.stop();
    });

    std::cout << "escrow_marketd started (hold=" << cfg.escrow_hold_days << "d, dispute window="
              << cfg.dispute_window_days << "d, fee=" << cfg.fee_percent << "%)" << std::endl;
    ioc.run();

    std::cout << "escrow_marketd stopped; auto-released " << scheduler.total_released()
              << " escrow(s) this run" << std::endl;
    return EXIT_SUCCESS;
}
