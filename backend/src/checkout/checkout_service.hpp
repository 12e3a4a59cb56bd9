#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "escrow/escrow_engine.hpp"
#include "ledger/wallet_ledger.hpp"
#include "market/errors.hpp"
#include "market/types.hpp"
#include "store/market_store.hpp"
#include "util/clock.hpp"

enum class PaymentMethod { WALLET, TOKEN };

inline const char* to_cstr(PaymentMethod m) { return m == PaymentMethod::WALLET ? "wallet" : "token"; }

struct Payment {
    PaymentMethod method{PaymentMethod::WALLET};
    std::string token;  // TOKEN only

    static Payment wallet() { return Payment{PaymentMethod::WALLET, {}}; }
    static Payment with_token(std::string t) { return Payment{PaymentMethod::TOKEN, std::move(t)}; }
};

// A price-locked session and the prices it snapshotted.
struct CheckoutQuote {
    CheckoutSession session;
    std::vector<CheckoutItem> items;

    Sats amount_due() const { return session.total_amount + session.fee_amount; }
};

struct CheckoutReceipt {
    CheckoutSession session;
    std::vector<Order> orders;    // one per seller
    std::vector<Escrow> escrows;  // escrows[i] backs orders[i]
};

class CheckoutService {
public:
    struct Options {
        int fee_percent{1};
        int price_lock_hours{3};
        int escrow_hold_days{10};
        std::string fee_collector_id;  // empty: fees are debited and not credited anywhere
    };

    // Token payments go through the ledger's payment processor.
    CheckoutService(IMarketStore& store, WalletLedger& ledger, EscrowEngine& escrow,
                    const IClock& clock, Options opts)
        : store_(store), ledger_(ledger), escrow_(escrow), clock_(clock), opts_(std::move(opts)) {}

    MarketResult<CartItem> add_to_cart(const std::string& user_id, const std::string& listing_id);
    // false if the item was not in this user's cart.
    MarketResult<bool> remove_from_cart(const std::string& user_id, const std::string& item_id);
    MarketResult<std::vector<CartItem>> cart(const std::string& user_id);

    // Returns the user's live pending session unchanged, or snapshots the cart into a new one.
    MarketResult<CheckoutQuote> start(const std::string& user_id);

    // Pays for a live session and fans it out into one escrow and order per seller.
    MarketResult<CheckoutReceipt> complete(const std::string& session_id, const Payment& payment);

    // Orders a completed session produced; empty while it is still pending.
    MarketResult<std::vector<Order>> orders(const std::string& session_id);

    // Zero once the lock has lapsed.
    std::chrono::seconds time_remaining(const CheckoutSession& s) const;

private:
    // Loads a pending, unexpired session. A pending session found past its
    // deadline is marked expired before PriceLockExpired is returned.
    MarketResult<CheckoutSession> live_session(const std::string& session_id);

    IMarketStore& store_;
    WalletLedger& ledger_;
    EscrowEngine& escrow_;
    const IClock& clock_;
    Options opts_;
};
