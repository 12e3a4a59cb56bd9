#include "store/pg_store.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

using OptStr = std::optional<std::string>;
using OptMs = std::optional<std::int64_t>;

OptStr opt_str(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<std::string>();
}

std::optional<Timestamp> opt_ts(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return from_epoch_ms(f.as<std::int64_t>());
}

Timestamp ts(const pqxx::field& f) { return from_epoch_ms(f.as<std::int64_t>()); }

OptMs opt_ms(const std::optional<Timestamp>& t) {
    if (!t) return std::nullopt;
    return to_epoch_ms(*t);
}

template <typename E>
E parse_or_throw(std::optional<E> v, const pqxx::field& f, const char* what) {
    if (!v) {
        throw std::runtime_error(std::string("unknown ") + what + " '" + f.as<std::string>() + "'");
    }
    return *v;
}

constexpr const char* kUserCols = "id, role, wallet_balance, created_at_ms";
constexpr const char* kTxCols =
    "id, user_id, kind, amount, balance_after, reference_id, description, created_at_ms";
constexpr const char* kEscrowCols =
    "id, buyer_id, seller_id, amount, status, auto_release_at_ms, created_at_ms, resolved_at_ms";
constexpr const char* kOrderCols =
    "id, checkout_id, buyer_id, seller_id, escrow_id, status, tracking_info, "
    "shipped_at_ms, completed_at_ms, created_at_ms";
constexpr const char* kDisputeCols =
    "id, order_id, escrow_id, initiated_by, reason, status, resolution, resolution_notes, "
    "resolved_by, warning_sent_at_ms, auto_resolve_at_ms, created_at_ms, resolved_at_ms";
constexpr const char* kEvidenceCols = "id, dispute_id, submitted_by, evidence_type, content, created_at_ms";
constexpr const char* kListingCols = "id, seller_id, title, price, is_active, stock, expires_at_ms";
constexpr const char* kCartCols = "id, user_id, listing_id, added_at_ms";
constexpr const char* kCheckoutCols =
    "id, user_id, status, total_amount, fee_amount, created_at_ms, expires_at_ms, paid_at_ms";
constexpr const char* kBondCols = "user_id, category, bond_paid, paid_at_ms";
constexpr const char* kCheckoutItemCols = "id, checkout_id, listing_id, seller_id, locked_price";

std::string select_sql(const char* cols, const char* rest) {
    return std::string("SELECT ") + cols + " " + rest;
}

User to_user(const pqxx::row& row) {
    User u;
    u.id = row[0].as<std::string>();
    u.role = parse_or_throw(parse_user_role(row[1].as<std::string>()), row[1], "user role");
    u.wallet_balance = row[2].as<Sats>();
    u.created_at = ts(row[3]);
    return u;
}

WalletTransaction to_tx(const pqxx::row& row) {
    WalletTransaction t;
    t.id = row[0].as<std::string>();
    t.user_id = row[1].as<std::string>();
    t.kind = parse_or_throw(parse_transaction_kind(row[2].as<std::string>()), row[2], "transaction kind");
    t.amount = row[3].as<Sats>();
    t.balance_after = row[4].as<Sats>();
    t.reference_id = opt_str(row[5]);
    t.description = opt_str(row[6]);
    t.created_at = ts(row[7]);
    return t;
}

Escrow to_escrow(const pqxx::row& row) {
    Escrow e;
    e.id = row[0].as<std::string>();
    e.buyer_id = row[1].as<std::string>();
    e.seller_id = row[2].as<std::string>();
    e.amount = row[3].as<Sats>();
    e.status = parse_or_throw(parse_escrow_status(row[4].as<std::string>()), row[4], "escrow status");
    e.auto_release_at = ts(row[5]);
    e.created_at = ts(row[6]);
    e.resolved_at = opt_ts(row[7]);
    return e;
}

Order to_order(const pqxx::row& row) {
    Order o;
    o.id = row[0].as<std::string>();
    o.checkout_id = row[1].as<std::string>();
    o.buyer_id = row[2].as<std::string>();
    o.seller_id = row[3].as<std::string>();
    o.escrow_id = row[4].as<std::string>();
    o.status = parse_or_throw(parse_order_status(row[5].as<std::string>()), row[5], "order status");
    o.tracking_info = opt_str(row[6]);
    o.shipped_at = opt_ts(row[7]);
    o.completed_at = opt_ts(row[8]);
    o.created_at = ts(row[9]);
    return o;
}

Dispute to_dispute(const pqxx::row& row) {
    Dispute d;
    d.id = row[0].as<std::string>();
    d.order_id = row[1].as<std::string>();
    d.escrow_id = row[2].as<std::string>();
    d.initiated_by = row[3].as<std::string>();
    d.reason = row[4].as<std::string>();
    d.status = parse_or_throw(parse_dispute_status(row[5].as<std::string>()), row[5], "dispute status");
    if (!row[6].is_null()) {
        d.resolution = parse_or_throw(parse_resolution(row[6].as<std::string>()), row[6], "resolution");
    }
    d.resolution_notes = opt_str(row[7]);
    d.resolved_by = opt_str(row[8]);
    d.warning_sent_at = opt_ts(row[9]);
    d.auto_resolve_at = ts(row[10]);
    d.created_at = ts(row[11]);
    d.resolved_at = opt_ts(row[12]);
    return d;
}

SellerBond to_bond(const pqxx::row& row) {
    SellerBond b;
    b.user_id = row[0].as<std::string>();
    b.category = parse_or_throw(parse_bond_category(row[1].as<std::string>()), row[1], "bond category");
    b.bond_paid = row[2].as<Sats>();
    b.paid_at = ts(row[3]);
    return b;
}

DisputeEvidence to_evidence(const pqxx::row& row) {
    DisputeEvidence ev;
    ev.id = row[0].as<std::string>();
    ev.dispute_id = row[1].as<std::string>();
    ev.submitted_by = row[2].as<std::string>();
    ev.type = parse_or_throw(parse_evidence_type(row[3].as<std::string>()), row[3], "evidence type");
    ev.content = row[4].as<std::string>();
    ev.created_at = ts(row[5]);
    return ev;
}

Listing to_listing(const pqxx::row& row) {
    Listing l;
    l.id = row[0].as<std::string>();
    l.seller_id = row[1].as<std::string>();
    l.title = row[2].as<std::string>();
    l.price = row[3].as<Sats>();
    l.is_active = row[4].as<bool>();
    if (!row[5].is_null()) l.stock = row[5].as<std::int64_t>();
    l.expires_at = ts(row[6]);
    return l;
}

CartItem to_cart_item(const pqxx::row& row) {
    CartItem c;
    c.id = row[0].as<std::string>();
    c.user_id = row[1].as<std::string>();
    c.listing_id = row[2].as<std::string>();
    c.added_at = ts(row[3]);
    return c;
}

CheckoutSession to_checkout(const pqxx::row& row) {
    CheckoutSession s;
    s.id = row[0].as<std::string>();
    s.user_id = row[1].as<std::string>();
    s.status = parse_or_throw(parse_checkout_status(row[2].as<std::string>()), row[2], "checkout status");
    s.total_amount = row[3].as<Sats>();
    s.fee_amount = row[4].as<Sats>();
    s.created_at = ts(row[5]);
    s.expires_at = ts(row[6]);
    s.paid_at = opt_ts(row[7]);
    return s;
}

CheckoutItem to_checkout_item(const pqxx::row& row) {
    CheckoutItem i;
    i.id = row[0].as<std::string>();
    i.checkout_id = row[1].as<std::string>();
    i.listing_id = row[2].as<std::string>();
    i.seller_id = row[3].as<std::string>();
    i.locked_price = row[4].as<Sats>();
    return i;
}

template <typename T, typename Fn>
std::optional<T> first(const pqxx::result& r, Fn&& map) {
    if (r.empty()) return std::nullopt;
    return map(r[0]);
}

template <typename T, typename Fn>
std::vector<T> all(const pqxx::result& r, Fn&& map) {
    std::vector<T> out;
    out.reserve(r.size());
    for (const auto& row : r) out.push_back(map(row));
    return out;
}

std::string read_sql_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open SQL file: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

class PgMarketTxn final : public IMarketTxn {
public:
    explicit PgMarketTxn(PgConnectionPool::Lease lease)
        : lease_(std::move(lease)), txn_(*lease_) {}

    bool insert_user(const User& u) override {
        auto r = txn_.exec(
            "INSERT INTO users (id, role, wallet_balance, created_at_ms) VALUES ($1, $2, $3, $4) "
            "ON CONFLICT (id) DO NOTHING RETURNING id",
            pqxx::params(u.id, to_cstr(u.role), u.wallet_balance, to_epoch_ms(u.created_at)));
        return !r.empty();
    }
    std::optional<User> get_user(const std::string& id) override {
        return first<User>(txn_.exec(select_sql(kUserCols, "FROM users WHERE id = $1"), pqxx::params(id)), to_user);
    }
    std::optional<User> lock_user(const std::string& id) override {
        return first<User>(txn_.exec(select_sql(kUserCols, "FROM users WHERE id = $1 FOR UPDATE"), pqxx::params(id)),
                           to_user);
    }
    void set_balance(const std::string& user_id, Sats balance) override {
        txn_.exec("UPDATE users SET wallet_balance = $1 WHERE id = $2", pqxx::params(balance, user_id));
    }
    void set_role(const std::string& user_id, UserRole role) override {
        txn_.exec("UPDATE users SET role = $1 WHERE id = $2", pqxx::params(to_cstr(role), user_id));
    }
    void append_transaction(const WalletTransaction& t) override {
        txn_.exec(
            "INSERT INTO wallet_transactions (id, user_id, kind, amount, balance_after, reference_id, "
            "description, created_at_ms) VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
            pqxx::params(t.id, t.user_id, to_cstr(t.kind), t.amount, t.balance_after, t.reference_id,
                         t.description, to_epoch_ms(t.created_at)));
    }
    std::vector<WalletTransaction> list_transactions(const std::string& user_id, std::size_t limit) override {
        if (limit == 0) {
            return all<WalletTransaction>(
                txn_.exec(select_sql(kTxCols, "FROM wallet_transactions WHERE user_id = $1 ORDER BY seq DESC"),
                          pqxx::params(user_id)),
                to_tx);
        }
        return all<WalletTransaction>(
            txn_.exec(select_sql(kTxCols, "FROM wallet_transactions WHERE user_id = $1 ORDER BY seq DESC LIMIT $2"),
                      pqxx::params(user_id, static_cast<std::int64_t>(limit))),
            to_tx);
    }
    std::vector<WalletTransaction> transactions_for_reference(const std::string& reference_id) override {
        return all<WalletTransaction>(
            txn_.exec(select_sql(kTxCols, "FROM wallet_transactions WHERE reference_id = $1 ORDER BY seq"),
                      pqxx::params(reference_id)),
            to_tx);
    }

    void insert_seller_bond(const SellerBond& b) override {
        txn_.exec("INSERT INTO seller_bonds (user_id, category, bond_paid, paid_at_ms) VALUES ($1, $2, $3, $4)",
                  pqxx::params(b.user_id, to_cstr(b.category), b.bond_paid, to_epoch_ms(b.paid_at)));
    }
    std::vector<SellerBond> list_seller_bonds(const std::string& user_id) override {
        return all<SellerBond>(
            txn_.exec(select_sql(kBondCols, "FROM seller_bonds WHERE user_id = $1 ORDER BY paid_at_ms, category"),
                      pqxx::params(user_id)),
            to_bond);
    }

    void insert_escrow(const Escrow& e) override {
        txn_.exec(
            "INSERT INTO escrows (id, buyer_id, seller_id, amount, status, auto_release_at_ms, created_at_ms, "
            "resolved_at_ms) VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
            pqxx::params(e.id, e.buyer_id, e.seller_id, e.amount, to_cstr(e.status),
                         to_epoch_ms(e.auto_release_at), to_epoch_ms(e.created_at), opt_ms(e.resolved_at)));
    }
    std::optional<Escrow> get_escrow(const std::string& id) override {
        return first<Escrow>(txn_.exec(select_sql(kEscrowCols, "FROM escrows WHERE id = $1"), pqxx::params(id)),
                             to_escrow);
    }
    std::optional<Escrow> lock_escrow(const std::string& id) override {
        return first<Escrow>(
            txn_.exec(select_sql(kEscrowCols, "FROM escrows WHERE id = $1 FOR UPDATE"), pqxx::params(id)), to_escrow);
    }
    void update_escrow(const Escrow& e) override {
        txn_.exec("UPDATE escrows SET status = $1, resolved_at_ms = $2 WHERE id = $3",
                  pqxx::params(to_cstr(e.status), opt_ms(e.resolved_at), e.id));
    }
    std::vector<Escrow> due_escrows(Timestamp now) override {
        return all<Escrow>(
            txn_.exec(select_sql(kEscrowCols,
                             "FROM escrows WHERE status = 'held' AND auto_release_at_ms <= $1 "
                             "ORDER BY auto_release_at_ms"),
                      pqxx::params(to_epoch_ms(now))),
            to_escrow);
    }

    void insert_order(const Order& o) override {
        txn_.exec(
            "INSERT INTO orders (id, checkout_id, buyer_id, seller_id, escrow_id, status, tracking_info, "
            "shipped_at_ms, completed_at_ms, created_at_ms) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10)",
            pqxx::params(o.id, o.checkout_id, o.buyer_id, o.seller_id, o.escrow_id, to_cstr(o.status),
                         o.tracking_info, opt_ms(o.shipped_at), opt_ms(o.completed_at),
                         to_epoch_ms(o.created_at)));
    }
    void insert_order_item(const OrderItem& item) override {
        txn_.exec("INSERT INTO order_items (id, order_id, listing_id, price) VALUES ($1, $2, $3, $4)",
                  pqxx::params(item.id, item.order_id, item.listing_id, item.price));
    }
    std::optional<Order> get_order(const std::string& id) override {
        return first<Order>(txn_.exec(select_sql(kOrderCols, "FROM orders WHERE id = $1"), pqxx::params(id)), to_order);
    }
    std::optional<Order> lock_order(const std::string& id) override {
        return first<Order>(txn_.exec(select_sql(kOrderCols, "FROM orders WHERE id = $1 FOR UPDATE"), pqxx::params(id)),
                            to_order);
    }
    std::optional<Order> lock_order_for_escrow(const std::string& escrow_id) override {
        return first<Order>(
            txn_.exec(select_sql(kOrderCols, "FROM orders WHERE escrow_id = $1 FOR UPDATE"), pqxx::params(escrow_id)),
            to_order);
    }
    void update_order(const Order& o) override {
        txn_.exec(
            "UPDATE orders SET status = $1, tracking_info = $2, shipped_at_ms = $3, completed_at_ms = $4 "
            "WHERE id = $5",
            pqxx::params(to_cstr(o.status), o.tracking_info, opt_ms(o.shipped_at), opt_ms(o.completed_at), o.id));
    }
    std::vector<OrderItem> list_order_items(const std::string& order_id) override {
        auto r = txn_.exec("SELECT id, order_id, listing_id, price FROM order_items WHERE order_id = $1 ORDER BY seq",
                           pqxx::params(order_id));
        return all<OrderItem>(r, [](const pqxx::row& row) {
            return OrderItem{row[0].as<std::string>(), row[1].as<std::string>(), row[2].as<std::string>(),
                             row[3].as<Sats>()};
        });
    }
    std::vector<Order> orders_for_checkout(const std::string& checkout_id) override {
        return all<Order>(
            txn_.exec(select_sql(kOrderCols, "FROM orders WHERE checkout_id = $1 ORDER BY created_at_ms, id"),
                      pqxx::params(checkout_id)),
            to_order);
    }

    void insert_dispute(const Dispute& d) override {
        OptStr resolution;
        if (d.resolution) resolution = to_string(*d.resolution);
        txn_.exec(
            "INSERT INTO disputes (id, order_id, escrow_id, initiated_by, reason, status, resolution, "
            "resolution_notes, resolved_by, warning_sent_at_ms, auto_resolve_at_ms, created_at_ms, resolved_at_ms) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13)",
            pqxx::params(d.id, d.order_id, d.escrow_id, d.initiated_by, d.reason, to_cstr(d.status), resolution,
                         d.resolution_notes, d.resolved_by, opt_ms(d.warning_sent_at),
                         to_epoch_ms(d.auto_resolve_at), to_epoch_ms(d.created_at), opt_ms(d.resolved_at)));
    }
    std::optional<Dispute> get_dispute(const std::string& id) override {
        return first<Dispute>(txn_.exec(select_sql(kDisputeCols, "FROM disputes WHERE id = $1"), pqxx::params(id)),
                              to_dispute);
    }
    std::optional<Dispute> lock_dispute(const std::string& id) override {
        return first<Dispute>(
            txn_.exec(select_sql(kDisputeCols, "FROM disputes WHERE id = $1 FOR UPDATE"), pqxx::params(id)), to_dispute);
    }
    std::optional<Dispute> dispute_for_order(const std::string& order_id) override {
        return first<Dispute>(
            txn_.exec(select_sql(kDisputeCols, "FROM disputes WHERE order_id = $1"), pqxx::params(order_id)),
            to_dispute);
    }
    void update_dispute(const Dispute& d) override {
        OptStr resolution;
        if (d.resolution) resolution = to_string(*d.resolution);
        txn_.exec(
            "UPDATE disputes SET status = $1, resolution = $2, resolution_notes = $3, resolved_by = $4, "
            "resolved_at_ms = $5, warning_sent_at_ms = $6 WHERE id = $7",
            pqxx::params(to_cstr(d.status), resolution, d.resolution_notes, d.resolved_by, opt_ms(d.resolved_at),
                         opt_ms(d.warning_sent_at), d.id));
    }
    std::vector<Dispute> list_open_disputes() override {
        return all<Dispute>(
            txn_.exec(select_sql(kDisputeCols, "FROM disputes WHERE status = 'open' ORDER BY created_at_ms")),
            to_dispute);
    }
    void insert_evidence(const DisputeEvidence& ev) override {
        txn_.exec(
            "INSERT INTO dispute_evidence (id, dispute_id, submitted_by, evidence_type, content, created_at_ms) "
            "VALUES ($1, $2, $3, $4, $5, $6)",
            pqxx::params(ev.id, ev.dispute_id, ev.submitted_by, to_cstr(ev.type), ev.content,
                         to_epoch_ms(ev.created_at)));
    }
    std::vector<DisputeEvidence> list_evidence(const std::string& dispute_id) override {
        return all<DisputeEvidence>(
            txn_.exec(select_sql(kEvidenceCols, "FROM dispute_evidence WHERE dispute_id = $1 ORDER BY seq"),
                      pqxx::params(dispute_id)),
            to_evidence);
    }

    void insert_listing(const Listing& l) override {
        txn_.exec(
            "INSERT INTO listings (id, seller_id, title, price, is_active, stock, expires_at_ms) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7)",
            pqxx::params(l.id, l.seller_id, l.title, l.price, l.is_active, l.stock, to_epoch_ms(l.expires_at)));
    }
    std::optional<Listing> get_listing(const std::string& id) override {
        return first<Listing>(txn_.exec(select_sql(kListingCols, "FROM listings WHERE id = $1"), pqxx::params(id)),
                              to_listing);
    }
    std::vector<CartItem> list_cart(const std::string& user_id) override {
        return all<CartItem>(
            txn_.exec(select_sql(kCartCols, "FROM cart_items WHERE user_id = $1 ORDER BY seq"), pqxx::params(user_id)),
            to_cart_item);
    }
    void insert_cart_item(const CartItem& item) override {
        txn_.exec("INSERT INTO cart_items (id, user_id, listing_id, added_at_ms) VALUES ($1, $2, $3, $4)",
                  pqxx::params(item.id, item.user_id, item.listing_id, to_epoch_ms(item.added_at)));
    }
    bool delete_cart_item(const std::string& user_id, const std::string& item_id) override {
        auto r = txn_.exec("DELETE FROM cart_items WHERE id = $1 AND user_id = $2 RETURNING id",
                           pqxx::params(item_id, user_id));
        return !r.empty();
    }
    void clear_cart(const std::string& user_id) override {
        txn_.exec("DELETE FROM cart_items WHERE user_id = $1", pqxx::params(user_id));
    }

    void insert_checkout(const CheckoutSession& s) override {
        txn_.exec(
            "INSERT INTO checkout_sessions (id, user_id, status, total_amount, fee_amount, created_at_ms, "
            "expires_at_ms, paid_at_ms) VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
            pqxx::params(s.id, s.user_id, to_cstr(s.status), s.total_amount, s.fee_amount,
                         to_epoch_ms(s.created_at), to_epoch_ms(s.expires_at), opt_ms(s.paid_at)));
    }
    std::optional<CheckoutSession> get_checkout(const std::string& id) override {
        return first<CheckoutSession>(
            txn_.exec(select_sql(kCheckoutCols, "FROM checkout_sessions WHERE id = $1"), pqxx::params(id)), to_checkout);
    }
    std::optional<CheckoutSession> lock_checkout(const std::string& id) override {
        return first<CheckoutSession>(
            txn_.exec(select_sql(kCheckoutCols, "FROM checkout_sessions WHERE id = $1 FOR UPDATE"), pqxx::params(id)),
            to_checkout);
    }
    std::optional<CheckoutSession> pending_checkout_for_user(const std::string& user_id, Timestamp now) override {
        return first<CheckoutSession>(
            txn_.exec(select_sql(kCheckoutCols,
                             "FROM checkout_sessions WHERE user_id = $1 AND status = 'pending' "
                             "AND expires_at_ms > $2 ORDER BY created_at_ms DESC LIMIT 1"),
                      pqxx::params(user_id, to_epoch_ms(now))),
            to_checkout);
    }
    void update_checkout(const CheckoutSession& s) override {
        txn_.exec("UPDATE checkout_sessions SET status = $1, paid_at_ms = $2 WHERE id = $3",
                  pqxx::params(to_cstr(s.status), opt_ms(s.paid_at), s.id));
    }
    void insert_checkout_item(const CheckoutItem& item) override {
        txn_.exec(
            "INSERT INTO checkout_items (id, checkout_id, listing_id, seller_id, locked_price) "
            "VALUES ($1, $2, $3, $4, $5)",
            pqxx::params(item.id, item.checkout_id, item.listing_id, item.seller_id, item.locked_price));
    }
    std::vector<CheckoutItem> list_checkout_items(const std::string& checkout_id) override {
        return all<CheckoutItem>(
            txn_.exec(select_sql(kCheckoutItemCols, "FROM checkout_items WHERE checkout_id = $1 ORDER BY seq"),
                      pqxx::params(checkout_id)),
            to_checkout_item);
    }

    void commit() override { txn_.commit(); }

private:
    // Declared first so the work is aborted before the connection goes back to the pool.
    PgConnectionPool::Lease lease_;
    pqxx::work txn_;
};

PgMarketStore::PgMarketStore(const std::string& connection_string, std::size_t pool_size)
    : pool_(connection_string, pool_size) {}

std::unique_ptr<IMarketTxn> PgMarketStore::begin() {
    return std::make_unique<PgMarketTxn>(pool_.acquire());
}

void PgMarketStore::ensure_schema(const std::string& schema_path) {
    const std::string sql = read_sql_file(schema_path);
    auto lease = pool_.acquire();
    // Use nontransaction for DDL statements (CREATE TABLE, etc.)
    pqxx::nontransaction ntxn(*lease);

    std::istringstream stream(sql);
    std::string statement;
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = line;
        trimmed.erase(0, trimmed.find_first_not_of(" \t"));
        if (trimmed.empty() || trimmed.rfind("--", 0) == 0) {
            continue;
        }
        statement += line + "\n";
        if (line.find(';') == std::string::npos) {
            continue;
        }
        try {
            ntxn.exec(statement);
        } catch (const pqxx::sql_error& e) {
            const std::string msg = e.what();
            if (msg.find("already exists") == std::string::npos) {
                throw std::runtime_error("Failed to execute schema SQL: " + msg);
            }
        }
        statement.clear();
    }
    std::cout << "[store] schema ready (" << schema_path << ")" << std::endl;
}

std::unique_ptr<PgMarketStore> make_pg_store(const std::string& connection_string, std::size_t pool_size,
                                             const std::string& schema_path) {
    auto store = std::make_unique<PgMarketStore>(connection_string, pool_size);
    store->ensure_schema(schema_path);
    return store;
}
