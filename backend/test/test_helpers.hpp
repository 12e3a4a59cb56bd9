#pragma once
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "checkout/checkout_service.hpp"
#include "dispute/dispute_service.hpp"
#include "escrow/escrow_engine.hpp"
#include "ledger/wallet_ledger.hpp"
#include "orders/order_service.hpp"
#include "payment/mock_payment.hpp"
#include "store/market_store.hpp"
#include "util/clock.hpp"
#include "util/ids.hpp"

template <typename T>
T expect_ok(MarketResult<T> r, const char* what) {
    if (is_error(r)) {
        std::cerr << "FAIL " << what << ": " << describe(error_of(r)) << std::endl;
        std::abort();
    }
    return std::get<T>(std::move(r));
}

template <typename T>
MarketError expect_err(MarketResult<T> r, MarketErrorCode code, const char* what) {
    if (!is_error(r)) {
        std::cerr << "FAIL " << what << ": expected " << to_cstr(code) << ", got a value" << std::endl;
        std::abort();
    }
    const MarketError& e = error_of(r);
    if (e.code != code) {
        std::cerr << "FAIL " << what << ": expected " << to_cstr(code) << ", got " << describe(e) << std::endl;
        std::abort();
    }
    return e;
}

// Pass-through store that can make commits fail. Used to check that nothing
// leaks out of a transaction whose commit throws.
class FaultyStore final : public IMarketStore {
public:
    explicit FaultyStore(IMarketStore& inner) : inner_(inner) {}

    std::unique_ptr<IMarketTxn> begin() override { return std::make_unique<Txn>(*this, inner_.begin()); }

    // Lets `skip` commits through, then makes the next one throw.
    void fail_next_commit(int skip = 0) {
        std::scoped_lock lk(m_);
        commits_until_failure_ = skip;
    }
    // Commits of transactions that locked this escrow throw until cleared.
    void poison_escrow(const std::string& id) {
        std::scoped_lock lk(m_);
        poisoned_.insert(id);
    }
    void clear_poison() {
        std::scoped_lock lk(m_);
        poisoned_.clear();
    }
    // Every lock_user call, in order.
    std::vector<std::string> locked_users() {
        std::scoped_lock lk(m_);
        return locked_users_;
    }
    void clear_locked_users() {
        std::scoped_lock lk(m_);
        locked_users_.clear();
    }

private:
    class Txn final : public IMarketTxn {
    public:
        Txn(FaultyStore& owner, std::unique_ptr<IMarketTxn> inner) : owner_(owner), inner_(std::move(inner)) {}

        std::optional<User> lock_user(const std::string& id) override {
            {
                std::scoped_lock lk(owner_.m_);
                owner_.locked_users_.push_back(id);
            }
            return inner_->lock_user(id);
        }
        std::optional<Escrow> lock_escrow(const std::string& id) override {
            escrows_.push_back(id);
            return inner_->lock_escrow(id);
        }
        void commit() override {
            {
                std::scoped_lock lk(owner_.m_);
                if (owner_.commits_until_failure_ == 0) {
                    owner_.commits_until_failure_ = -1;
                    throw std::runtime_error("injected commit failure");
                }
                if (owner_.commits_until_failure_ > 0) --owner_.commits_until_failure_;
                for (const auto& id : escrows_) {
                    if (owner_.poisoned_.count(id)) {
                        throw std::runtime_error("injected commit failure for escrow " + id);
                    }
                }
            }
            inner_->commit();
        }

        bool insert_user(const User& u) override { return inner_->insert_user(u); }
        std::optional<User> get_user(const std::string& id) override { return inner_->get_user(id); }
        void set_balance(const std::string& user_id, Sats balance) override {
            inner_->set_balance(user_id, balance);
        }
        void set_role(const std::string& user_id, UserRole role) override { inner_->set_role(user_id, role); }
        void append_transaction(const WalletTransaction& tx) override { inner_->append_transaction(tx); }
        std::vector<WalletTransaction> list_transactions(const std::string& user_id, std::size_t limit) override {
            return inner_->list_transactions(user_id, limit);
        }
        std::vector<WalletTransaction> transactions_for_reference(const std::string& reference_id) override {
            return inner_->transactions_for_reference(reference_id);
        }
        void insert_seller_bond(const SellerBond& b) override { inner_->insert_seller_bond(b); }
        std::vector<SellerBond> list_seller_bonds(const std::string& user_id) override {
            return inner_->list_seller_bonds(user_id);
        }
        void insert_escrow(const Escrow& e) override { inner_->insert_escrow(e); }
        std::optional<Escrow> get_escrow(const std::string& id) override { return inner_->get_escrow(id); }
        void update_escrow(const Escrow& e) override { inner_->update_escrow(e); }
        std::vector<Escrow> due_escrows(Timestamp now) override { return inner_->due_escrows(now); }
        void insert_order(const Order& o) override { inner_->insert_order(o); }
        void insert_order_item(const OrderItem& item) override { inner_->insert_order_item(item); }
        std::optional<Order> get_order(const std::string& id) override { return inner_->get_order(id); }
        std::optional<Order> lock_order(const std::string& id) override { return inner_->lock_order(id); }
        std::optional<Order> lock_order_for_escrow(const std::string& escrow_id) override {
            return inner_->lock_order_for_escrow(escrow_id);
        }
        void update_order(const Order& o) override { inner_->update_order(o); }
        std::vector<OrderItem> list_order_items(const std::string& order_id) override {
            return inner_->list_order_items(order_id);
        }
        std::vector<Order> orders_for_checkout(const std::string& checkout_id) override {
            return inner_->orders_for_checkout(checkout_id);
        }
        void insert_dispute(const Dispute& d) override { inner_->insert_dispute(d); }
        std::optional<Dispute> get_dispute(const std::string& id) override { return inner_->get_dispute(id); }
        std::optional<Dispute> lock_dispute(const std::string& id) override { return inner_->lock_dispute(id); }
        std::optional<Dispute> dispute_for_order(const std::string& order_id) override {
            return inner_->dispute_for_order(order_id);
        }
        void update_dispute(const Dispute& d) override { inner_->update_dispute(d); }
        std::vector<Dispute> list_open_disputes() override { return inner_->list_open_disputes(); }
        void insert_evidence(const DisputeEvidence& ev) override { inner_->insert_evidence(ev); }
        std::vector<DisputeEvidence> list_evidence(const std::string& dispute_id) override {
            return inner_->list_evidence(dispute_id);
        }
        void insert_listing(const Listing& l) override { inner_->insert_listing(l); }
        std::optional<Listing> get_listing(const std::string& id) override { return inner_->get_listing(id); }
        std::vector<CartItem> list_cart(const std::string& user_id) override {
            return inner_->list_cart(user_id);
        }
        void insert_cart_item(const CartItem& item) override { inner_->insert_cart_item(item); }
        bool delete_cart_item(const std::string& user_id, const std::string& item_id) override {
            return inner_->delete_cart_item(user_id, item_id);
        }
        void clear_cart(const std::string& user_id) override { inner_->clear_cart(user_id); }
        void insert_checkout(const CheckoutSession& s) override { inner_->insert_checkout(s); }
        std::optional<CheckoutSession> get_checkout(const std::string& id) override {
            return inner_->get_checkout(id);
        }
        std::optional<CheckoutSession> lock_checkout(const std::string& id) override {
            return inner_->lock_checkout(id);
        }
        std::optional<CheckoutSession> pending_checkout_for_user(const std::string& user_id, Timestamp now) override {
            return inner_->pending_checkout_for_user(user_id, now);
        }
        void update_checkout(const CheckoutSession& s) override { inner_->update_checkout(s); }
        void insert_checkout_item(const CheckoutItem& item) override { inner_->insert_checkout_item(item); }
        std::vector<CheckoutItem> list_checkout_items(const std::string& checkout_id) override {
            return inner_->list_checkout_items(checkout_id);
        }

    private:
        FaultyStore& owner_;
        std::unique_ptr<IMarketTxn> inner_;
        std::vector<std::string> escrows_;
    };

    IMarketStore& inner_;
    std::mutex m_;
    int commits_until_failure_{-1};
    std::set<std::string> poisoned_;
    std::vector<std::string> locked_users_;
};

// Every service wired to one in-memory store and a manual clock. Services see
// the store through `faults`, which passes everything through until told otherwise.
struct MarketFixture {
    ManualClock clock;
    std::unique_ptr<IMarketStore> backing{make_memory_store()};
    FaultyStore faults{*backing};
    IMarketStore* store{&faults};
    MockPaymentProcessor payments;
    WalletLedger ledger{*store, clock, &payments};
    EscrowEngine escrow{*store, ledger, clock};
    DisputeService disputes{*store, escrow, clock};
    CheckoutService checkout;
    OrderService orders{*store, escrow, clock};

    explicit MarketFixture(CheckoutService::Options opts = {})
        : checkout(*store, ledger, escrow, clock, std::move(opts)) {}

    void add_user(const std::string& id, UserRole role = UserRole::BUYER, Sats balance = 0) {
        expect_ok(ledger.register_user(id, role), "register_user");
        if (balance > 0) {
            expect_ok(ledger.deposit(id, balance), "deposit");
        }
    }

    Sats balance(const std::string& id) { return expect_ok(ledger.balance(id), "balance"); }

    Listing add_listing(const std::string& seller_id, Sats price,
                        std::optional<std::int64_t> stock = std::nullopt) {
        Listing l;
        l.id = new_id("lst");
        l.seller_id = seller_id;
        l.title = "item " + l.id;
        l.price = price;
        l.stock = stock;
        l.expires_at = clock.now() + days(30);
        auto txn = store->begin();
        txn->insert_listing(l);
        txn->commit();
        return l;
    }

    // Creates an escrow plus the order that points at it, as checkout would.
    Order add_order(const std::string& buyer, const std::string& seller, Sats amount, int hold_days = 10) {
        Escrow e = expect_ok(escrow.create_escrow(buyer, seller, amount, hold_days), "create_escrow");
        Order o;
        o.id = new_id("ord");
        o.checkout_id = "chk-test";
        o.buyer_id = buyer;
        o.seller_id = seller;
        o.escrow_id = e.id;
        o.created_at = clock.now();
        auto txn = store->begin();
        txn->insert_order(o);
        txn->commit();
        return o;
    }

    Escrow escrow_of(const std::string& id) { return expect_ok(escrow.get(id), "escrow.get"); }
    Order order_of(const std::string& id) { return expect_ok(orders.get(id), "orders.get"); }
};
