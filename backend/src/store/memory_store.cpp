#include "store/market_store.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace
{
    struct State
    {
        std::map<std::string, User> users;
        std::vector<WalletTransaction> transactions; // append order
        std::map<std::string, Escrow> escrows;
        std::map<std::string, Order> orders;
        std::vector<OrderItem> order_items;
        std::map<std::string, Dispute> disputes;
        std::vector<DisputeEvidence> evidence;
        std::map<std::string, Listing> listings;
        std::vector<CartItem> cart;
        std::map<std::string, CheckoutSession> checkouts;
        std::vector<CheckoutItem> checkout_items;
        std::vector<SellerBond> bonds;
    };

    template <typename T>
    std::optional<T> find_in(const std::map<std::string, T> &m, const std::string &id)
    {
        auto it = m.find(id);
        if (it == m.end())
            return std::nullopt;
        return it->second;
    }

    template <typename T>
    T &must_find(std::map<std::string, T> &m, const std::string &id, const char *what)
    {
        auto it = m.find(id);
        if (it == m.end())
            throw std::runtime_error(std::string("memory store: no ") + what + " '" + id + "'");
        return it->second;
    }

    template <typename T>
    void insert_unique(std::map<std::string, T> &m, const T &v, const char *what)
    {
        if (!m.emplace(v.id, v).second)
            throw std::runtime_error(std::string("memory store: duplicate ") + what + " '" + v.id + "'");
    }
}

// The whole store is guarded by one mutex. A transaction owns it from begin()
// until destruction and mutates a private copy, which commit() swaps in.
// Read-only transactions never copy.
class MemoryStore final : public IMarketStore
{
public:
    std::unique_ptr<IMarketTxn> begin() override;

private:
    friend class MemoryTxn;
    std::mutex mtx_;
    State state_;
};

class MemoryTxn final : public IMarketTxn
{
public:
    explicit MemoryTxn(MemoryStore &store)
        : store_(store), lk_(store.mtx_) {}

    bool insert_user(const User &u) override
    {
        return w().users.emplace(u.id, u).second;
    }
    std::optional<User> get_user(const std::string &id) override { return find_in(r().users, id); }
    std::optional<User> lock_user(const std::string &id) override { return find_in(r().users, id); }
    void set_balance(const std::string &user_id, Sats balance) override
    {
        must_find(w().users, user_id, "user").wallet_balance = balance;
    }
    void append_transaction(const WalletTransaction &tx) override
    {
        w().transactions.push_back(tx);
    }
    std::vector<WalletTransaction> list_transactions(const std::string &user_id,
                                                     std::size_t limit) override
    {
        std::vector<WalletTransaction> out;
        for (auto it = r().transactions.rbegin(); it != r().transactions.rend(); ++it)
        {
            if (it->user_id != user_id)
                continue;
            out.push_back(*it);
            if (limit != 0 && out.size() >= limit)
                break;
        }
        return out;
    }
    std::vector<WalletTransaction> transactions_for_reference(const std::string &reference_id) override
    {
        std::vector<WalletTransaction> out;
        for (const auto &tx : r().transactions)
        {
            if (tx.reference_id && *tx.reference_id == reference_id)
                out.push_back(tx);
        }
        return out;
    }

    void insert_escrow(const Escrow &e) override { insert_unique(w().escrows, e, "escrow"); }
    std::optional<Escrow> get_escrow(const std::string &id) override { return find_in(r().escrows, id); }
    std::optional<Escrow> lock_escrow(const std::string &id) override { return find_in(r().escrows, id); }
    void update_escrow(const Escrow &e) override
    {
        auto &cur = must_find(w().escrows, e.id, "escrow");
        cur.status = e.status;
        cur.resolved_at = e.resolved_at;
    }
    std::vector<Escrow> due_escrows(Timestamp now) override
    {
        std::vector<Escrow> out;
        for (const auto &[id, e] : r().escrows)
        {
            if (e.status == EscrowStatus::HELD && e.auto_release_at <= now)
                out.push_back(e);
        }
        std::stable_sort(out.begin(), out.end(), [](const Escrow &a, const Escrow &b)
                         { return a.auto_release_at < b.auto_release_at; });
        return out;
    }

    void insert_order(const Order &o) override { insert_unique(w().orders, o, "order"); }
    void insert_order_item(const OrderItem &item) override { w().order_items.push_back(item); }
    std::optional<Order> get_order(const std::string &id) override { return find_in(r().orders, id); }
    std::optional<Order> lock_order(const std::string &id) override { return find_in(r().orders, id); }
    std::optional<Order> lock_order_for_escrow(const std::string &escrow_id) override
    {
        for (const auto &[id, o] : r().orders)
        {
            if (o.escrow_id == escrow_id)
                return o;
        }
        return std::nullopt;
    }
    void update_order(const Order &o) override
    {
        auto &cur = must_find(w().orders, o.id, "order");
        cur.status = o.status;
        cur.tracking_info = o.tracking_info;
        cur.shipped_at = o.shipped_at;
        cur.completed_at = o.completed_at;
    }
    std::vector<OrderItem> list_order_items(const std::string &order_id) override
    {
        std::vector<OrderItem> out;
        for (const auto &item : r().order_items)
        {
            if (item.order_id == order_id)
                out.push_back(item);
        }
        return out;
    }
    std::vector<Order> orders_for_checkout(const std::string &checkout_id) override
    {
        std::vector<Order> out;
        for (const auto &[id, o] : r().orders)
        {
            if (o.checkout_id == checkout_id)
                out.push_back(o);
        }
        return out;
    }

    void insert_dispute(const Dispute &d) override
    {
        for (const auto &[id, existing] : w().disputes)
        {
            if (existing.order_id == d.order_id)
                throw std::runtime_error("memory store: order '" + d.order_id + "' already has a dispute");
        }
        insert_unique(w().disputes, d, "dispute");
    }
    std::optional<Dispute> get_dispute(const std::string &id) override { return find_in(r().disputes, id); }
    std::optional<Dispute> lock_dispute(const std::string &id) override { return find_in(r().disputes, id); }
    std::optional<Dispute> dispute_for_order(const std::string &order_id) override
    {
        for (const auto &[id, d] : r().disputes)
        {
            if (d.order_id == order_id)
                return d;
        }
        return std::nullopt;
    }
    void update_dispute(const Dispute &d) override
    {
        auto &cur = must_find(w().disputes, d.id, "dispute");
        cur.status = d.status;
        cur.resolution = d.resolution;
        cur.resolution_notes = d.resolution_notes;
        cur.resolved_by = d.resolved_by;
        cur.resolved_at = d.resolved_at;
        cur.warning_sent_at = d.warning_sent_at;
    }
    std::vector<Dispute> list_open_disputes() override
    {
        std::vector<Dispute> out;
        for (const auto &[id, d] : r().disputes)
        {
            if (d.is_open())
                out.push_back(d);
        }
        std::stable_sort(out.begin(), out.end(), [](const Dispute &a, const Dispute &b)
                         { return a.created_at < b.created_at; });
        return out;
    }
    void insert_evidence(const DisputeEvidence &ev) override { w().evidence.push_back(ev); }
    std::vector<DisputeEvidence> list_evidence(const std::string &dispute_id) override
    {
        std::vector<DisputeEvidence> out;
        for (const auto &ev : r().evidence)
        {
            if (ev.dispute_id == dispute_id)
                out.push_back(ev);
        }
        return out;
    }

    void insert_listing(const Listing &l) override { insert_unique(w().listings, l, "listing"); }
    std::optional<Listing> get_listing(const std::string &id) override { return find_in(r().listings, id); }
    std::vector<CartItem> list_cart(const std::string &user_id) override
    {
        std::vector<CartItem> out;
        for (const auto &item : r().cart)
        {
            if (item.user_id == user_id)
                out.push_back(item);
        }
        return out;
    }
    void insert_cart_item(const CartItem &item) override
    {
        for (const auto &existing : w().cart)
        {
            if (existing.user_id == item.user_id && existing.listing_id == item.listing_id)
                throw std::runtime_error("memory store: listing '" + item.listing_id + "' already in cart");
        }
        w().cart.push_back(item);
    }
    bool delete_cart_item(const std::string &user_id, const std::string &item_id) override
    {
        auto it = std::find_if(w().cart.begin(), w().cart.end(), [&](const CartItem &c)
                               { return c.id == item_id && c.user_id == user_id; });
        if (it == w().cart.end())
            return false;
        w().cart.erase(it);
        return true;
    }
    void clear_cart(const std::string &user_id) override
    {
        w().cart.erase(std::remove_if(w().cart.begin(), w().cart.end(), [&](const CartItem &c)
                                        { return c.user_id == user_id; }),
                         w().cart.end());
    }

    void set_role(const std::string &user_id, UserRole role) override
    {
        must_find(w().users, user_id, "user").role = role;
    }
    void insert_seller_bond(const SellerBond &b) override
    {
        for (const auto &existing : w().bonds)
        {
            if (existing.user_id == b.user_id && existing.category == b.category)
                throw std::runtime_error("memory store: duplicate bond for '" + b.user_id + "'");
        }
        w().bonds.push_back(b);
    }
    std::vector<SellerBond> list_seller_bonds(const std::string &user_id) override
    {
        std::vector<SellerBond> out;
        for (const auto &b : r().bonds)
        {
            if (b.user_id == user_id)
                out.push_back(b);
        }
        return out;
    }

    void insert_checkout(const CheckoutSession &s) override { insert_unique(w().checkouts, s, "checkout"); }
    std::optional<CheckoutSession> get_checkout(const std::string &id) override { return find_in(r().checkouts, id); }
    std::optional<CheckoutSession> lock_checkout(const std::string &id) override { return find_in(r().checkouts, id); }
    std::optional<CheckoutSession> pending_checkout_for_user(const std::string &user_id,
                                                             Timestamp now) override
    {
        std::optional<CheckoutSession> best;
        for (const auto &[id, s] : r().checkouts)
        {
            if (s.user_id != user_id || s.status != CheckoutStatus::PENDING || s.expires_at <= now)
                continue;
            if (!best || s.created_at > best->created_at)
                best = s;
        }
        return best;
    }
    void update_checkout(const CheckoutSession &s) override
    {
        auto &cur = must_find(w().checkouts, s.id, "checkout");
        cur.status = s.status;
        cur.paid_at = s.paid_at;
    }
    void insert_checkout_item(const CheckoutItem &item) override { w().checkout_items.push_back(item); }
    std::vector<CheckoutItem> list_checkout_items(const std::string &checkout_id) override
    {
        std::vector<CheckoutItem> out;
        for (const auto &item : r().checkout_items)
        {
            if (item.checkout_id == checkout_id)
                out.push_back(item);
        }
        return out;
    }

    void commit() override
    {
        if (committed_)
            throw std::logic_error("memory store: transaction already committed");
        if (work_)
            store_.state_ = std::move(*work_);
        committed_ = true;
    }

private:
    // Reads go to the committed state until the first write, which copies it.
    // The copy includes the whole transaction log, so writes cost O(history).
    const State &r() const { return work_ ? *work_ : store_.state_; }
    State &w()
    {
        if (!work_)
            work_.emplace(store_.state_);
        return *work_;
    }

    MemoryStore &store_;
    std::unique_lock<std::mutex> lk_;
    std::optional<State> work_;
    bool committed_{false};
};

std::unique_ptr<IMarketTxn> MemoryStore::begin()
{
    return std::make_unique<MemoryTxn>(*this);
}

std::unique_ptr<IMarketStore> make_memory_store() { return std::make_unique<MemoryStore>(); }
