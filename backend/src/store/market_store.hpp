#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "market/dispute.hpp"
#include "market/types.hpp"

// One atomic unit of work against the record store.
//
// lock_* reads take the row lock (SELECT ... FOR UPDATE in PostgreSQL) and hold
// it until the transaction ends. Callers that lock several rows lock the escrow
// before the order and the order before its dispute; several users are locked in
// id order. Destroying a transaction without commit() rolls it back.
// Every method may throw on storage failure.
class IMarketTxn {
public:
    virtual ~IMarketTxn() = default;

    // Users / wallet
    // Returns false if the id is taken.
    virtual bool insert_user(const User& u) = 0;
    virtual std::optional<User> get_user(const std::string& id) = 0;
    virtual std::optional<User> lock_user(const std::string& id) = 0;
    virtual void set_balance(const std::string& user_id, Sats balance) = 0;
    virtual void set_role(const std::string& user_id, UserRole role) = 0;
    virtual void append_transaction(const WalletTransaction& tx) = 0;
    // Newest first; limit 0 means all.
    virtual std::vector<WalletTransaction> list_transactions(const std::string& user_id,
                                                             std::size_t limit) = 0;
    // Oldest first.
    virtual std::vector<WalletTransaction> transactions_for_reference(const std::string& reference_id) = 0;

    // Seller bonds. Throws if the user already holds a bond for the category.
    virtual void insert_seller_bond(const SellerBond& b) = 0;
    virtual std::vector<SellerBond> list_seller_bonds(const std::string& user_id) = 0;

    // Escrows
    virtual void insert_escrow(const Escrow& e) = 0;
    virtual std::optional<Escrow> get_escrow(const std::string& id) = 0;
    virtual std::optional<Escrow> lock_escrow(const std::string& id) = 0;
    // Persists status and resolved_at.
    virtual void update_escrow(const Escrow& e) = 0;
    // Held escrows with auto_release_at <= now, oldest deadline first.
    virtual std::vector<Escrow> due_escrows(Timestamp now) = 0;

    // Orders
    virtual void insert_order(const Order& o) = 0;
    virtual void insert_order_item(const OrderItem& item) = 0;
    virtual std::optional<Order> get_order(const std::string& id) = 0;
    virtual std::optional<Order> lock_order(const std::string& id) = 0;
    virtual std::optional<Order> lock_order_for_escrow(const std::string& escrow_id) = 0;
    // Persists status, tracking_info, shipped_at and completed_at.
    virtual void update_order(const Order& o) = 0;
    virtual std::vector<OrderItem> list_order_items(const std::string& order_id) = 0;
    virtual std::vector<Order> orders_for_checkout(const std::string& checkout_id) = 0;

    // Disputes
    virtual void insert_dispute(const Dispute& d) = 0;
    virtual std::optional<Dispute> get_dispute(const std::string& id) = 0;
    virtual std::optional<Dispute> lock_dispute(const std::string& id) = 0;
    virtual std::optional<Dispute> dispute_for_order(const std::string& order_id) = 0;
    // Persists status, resolution fields and warning_sent_at.
    virtual void update_dispute(const Dispute& d) = 0;
    virtual std::vector<Dispute> list_open_disputes() = 0;
    virtual void insert_evidence(const DisputeEvidence& ev) = 0;
    // Oldest first.
    virtual std::vector<DisputeEvidence> list_evidence(const std::string& dispute_id) = 0;

    // Listings / cart
    virtual void insert_listing(const Listing& l) = 0;
    virtual std::optional<Listing> get_listing(const std::string& id) = 0;
    // Oldest first.
    virtual std::vector<CartItem> list_cart(const std::string& user_id) = 0;
    virtual void insert_cart_item(const CartItem& item) = 0;
    // Returns false if the item is not in this user's cart.
    virtual bool delete_cart_item(const std::string& user_id, const std::string& item_id) = 0;
    virtual void clear_cart(const std::string& user_id) = 0;

    // Checkout
    virtual void insert_checkout(const CheckoutSession& s) = 0;
    virtual std::optional<CheckoutSession> get_checkout(const std::string& id) = 0;
    virtual std::optional<CheckoutSession> lock_checkout(const std::string& id) = 0;
    // Most recent pending session with expires_at > now.
    virtual std::optional<CheckoutSession> pending_checkout_for_user(const std::string& user_id,
                                                                     Timestamp now) = 0;
    // Persists status and paid_at.
    virtual void update_checkout(const CheckoutSession& s) = 0;
    virtual void insert_checkout_item(const CheckoutItem& item) = 0;
    virtual std::vector<CheckoutItem> list_checkout_items(const std::string& checkout_id) = 0;

    virtual void commit() = 0;
};

class IMarketStore {
public:
    virtual ~IMarketStore() = default;
    virtual std::unique_ptr<IMarketTxn> begin() = 0;
};

std::unique_ptr<IMarketStore> make_memory_store();
