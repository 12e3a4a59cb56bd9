#include "store/market_store.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

static User make_user(const std::string& id, Sats balance = 0)
{
    User u;
    u.id = id;
    u.wallet_balance = balance;
    u.created_at = from_epoch_ms(1'000);
    return u;
}

static Escrow make_escrow(const std::string& id, EscrowStatus st, std::int64_t release_ms)
{
    Escrow e;
    e.id = id;
    e.buyer_id = "buyer";
    e.seller_id = "seller";
    e.amount = 10;
    e.status = st;
    e.auto_release_at = from_epoch_ms(release_ms);
    e.created_at = from_epoch_ms(0);
    return e;
}

static void test_commit_and_rollback()
{
    auto store = make_memory_store();
    {
        auto txn = store->begin();
        assert(txn->insert_user(make_user("alice")));
        assert(!txn->insert_user(make_user("alice")));
        txn->commit();
    }
    {
        auto txn = store->begin();
        txn->set_balance("alice", 500);
        // no commit: dropped
    }
    {
        auto txn = store->begin();
        assert(txn->get_user("alice")->wallet_balance == 0);
        assert(!txn->get_user("bob"));
    }
    {
        auto txn = store->begin();
        txn->set_balance("alice", 42);
        txn->commit();
        bool threw = false;
        try {
            txn->commit();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }
    {
        auto txn = store->begin();
        assert(txn->get_user("alice")->wallet_balance == 42);
        // Updating a missing row is a storage error.
        bool threw = false;
        try {
            txn->set_balance("nobody", 1);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "commit/rollback ok\n";
}

static void test_transaction_log_order()
{
    auto store = make_memory_store();
    auto txn = store->begin();
    txn->insert_user(make_user("alice"));
    for (int i = 1; i <= 5; ++i) {
        WalletTransaction t;
        t.id = "t" + std::to_string(i);
        t.user_id = "alice";
        t.amount = i;
        t.balance_after = i;
        t.reference_id = (i % 2) ? std::optional<std::string>("ref-odd") : std::nullopt;
        txn->append_transaction(t);
    }
    auto newest = txn->list_transactions("alice", 2);
    assert(newest.size() == 2 && newest[0].id == "t5" && newest[1].id == "t4");
    assert(txn->list_transactions("alice", 0).size() == 5);
    assert(txn->list_transactions("bob", 0).empty());
    auto odd = txn->transactions_for_reference("ref-odd");
    assert(odd.size() == 3 && odd.front().id == "t1");
    std::cout << "transaction log order ok\n";
}

static void test_due_escrows()
{
    auto store = make_memory_store();
    auto txn = store->begin();
    txn->insert_escrow(make_escrow("late", EscrowStatus::HELD, 2'000));
    txn->insert_escrow(make_escrow("early", EscrowStatus::HELD, 1'000));
    txn->insert_escrow(make_escrow("future", EscrowStatus::HELD, 9'000));
    txn->insert_escrow(make_escrow("disputed", EscrowStatus::DISPUTED, 500));
    auto due = txn->due_escrows(from_epoch_ms(2'000));
    assert(due.size() == 2);
    assert(due[0].id == "early" && due[1].id == "late");

    bool threw = false;
    try {
        txn->insert_escrow(make_escrow("early", EscrowStatus::HELD, 1));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "due escrows ok\n";
}

static void test_checkout_lookup_and_cart()
{
    auto store = make_memory_store();
    auto txn = store->begin();

    CheckoutSession old_s;
    old_s.id = "old";
    old_s.user_id = "alice";
    old_s.created_at = from_epoch_ms(0);
    old_s.expires_at = from_epoch_ms(100);
    txn->insert_checkout(old_s);

    CheckoutSession live = old_s;
    live.id = "live";
    live.created_at = from_epoch_ms(50);
    live.expires_at = from_epoch_ms(10'000);
    txn->insert_checkout(live);

    auto found = txn->pending_checkout_for_user("alice", from_epoch_ms(200));
    assert(found && found->id == "live");
    assert(!txn->pending_checkout_for_user("alice", from_epoch_ms(10'000)));

    live.status = CheckoutStatus::PAID;
    txn->update_checkout(live);
    assert(!txn->pending_checkout_for_user("alice", from_epoch_ms(200)));

    CartItem c{"c1", "alice", "lst-1", from_epoch_ms(0)};
    txn->insert_cart_item(c);
    bool threw = false;
    try {
        txn->insert_cart_item(CartItem{"c2", "alice", "lst-1", from_epoch_ms(1)});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    txn->insert_cart_item(CartItem{"c3", "bob", "lst-1", from_epoch_ms(1)});
    assert(!txn->delete_cart_item("bob", "c1"));
    assert(txn->delete_cart_item("alice", "c1"));
    txn->clear_cart("bob");
    assert(txn->list_cart("bob").empty());
    std::cout << "checkout lookup and cart ok\n";
}

static void test_reads_see_own_writes()
{
    auto store = make_memory_store();
    {
        auto txn = store->begin();
        txn->insert_user(make_user("carol", 10));
        txn->commit();
    }
    {
        // Read-only transaction: commit leaves the state as it was.
        auto txn = store->begin();
        assert(txn->get_user("carol")->wallet_balance == 10);
        txn->commit();
    }
    {
        auto txn = store->begin();
        txn->set_balance("carol", 25);
        assert(txn->lock_user("carol")->wallet_balance == 25);
        txn->set_role("carol", UserRole::SELLER);
        assert(txn->get_user("carol")->role == UserRole::SELLER);
        // dropped
    }
    {
        auto txn = store->begin();
        const auto carol = txn->get_user("carol");
        assert(carol->wallet_balance == 10 && carol->role == UserRole::BUYER);
    }
    std::cout << "read-your-writes ok\n";
}

static void test_seller_bonds()
{
    auto store = make_memory_store();
    SellerBond b;
    b.user_id = "dan";
    b.category = BondCategory::PHYSICAL;
    b.bond_paid = 250;
    b.paid_at = from_epoch_ms(5);
    {
        auto txn = store->begin();
        txn->insert_user(make_user("dan"));
        txn->insert_seller_bond(b);
        assert(txn->list_seller_bonds("dan").size() == 1);
        bool threw = false;
        try {
            txn->insert_seller_bond(b);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        txn->commit();
    }
    {
        auto txn = store->begin();
        SellerBond other = b;
        other.category = BondCategory::DIGITAL;
        txn->insert_seller_bond(other);
        // dropped
    }
    auto txn = store->begin();
    auto bonds = txn->list_seller_bonds("dan");
    assert(bonds.size() == 1 && bonds[0].category == BondCategory::PHYSICAL && bonds[0].bond_paid == 250);
    assert(txn->list_seller_bonds("erin").empty());
    std::cout << "seller bonds ok\n";
}

int main()
{
    test_commit_and_rollback();
    test_reads_see_own_writes();
    test_seller_bonds();
    test_transaction_log_order();
    test_due_escrows();
    test_checkout_lookup_and_cart();
    std::cout << "OK\n";
    return 0;
}
