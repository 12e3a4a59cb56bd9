#include "test_helpers.hpp"

#include <limits>
#include <thread>
#include <vector>

static LedgerEntry entry(const std::string& user, Sats amount, TransactionKind kind = TransactionKind::PAYMENT)
{
    return LedgerEntry{user, amount, kind, std::nullopt, std::nullopt};
}

static void test_credit_debit()
{
    MarketFixture f;
    f.add_user("alice");

    assert(expect_ok(f.ledger.credit(entry("alice", 300, TransactionKind::DEPOSIT)), "credit") == 300);
    assert(expect_ok(f.ledger.debit(entry("alice", 120)), "debit") == 180);

    auto e = expect_err(f.ledger.debit(entry("alice", 181)), MarketErrorCode::InsufficientBalance, "overdraw");
    assert(e.needed == 181 && e.available == 180);
    assert(f.balance("alice") == 180);

    expect_err(f.ledger.credit(entry("alice", 0)), MarketErrorCode::InvalidAmount, "zero credit");
    expect_err(f.ledger.debit(entry("alice", -5)), MarketErrorCode::InvalidAmount, "negative debit");
    expect_err(f.ledger.credit(entry("nobody", 5)), MarketErrorCode::UserNotFound, "unknown user");
    expect_err(f.ledger.register_user("alice", UserRole::SELLER), MarketErrorCode::UserAlreadyExists, "dup user");

    auto hist = expect_ok(f.ledger.history("alice"), "history");
    assert(hist.size() == 2);
    assert(hist[0].amount == -120 && hist[0].balance_after == 180 && hist[0].kind == TransactionKind::PAYMENT);
    assert(hist[1].amount == 300 && hist[1].balance_after == 300 && hist[1].kind == TransactionKind::DEPOSIT);
    std::cout << "credit/debit ok\n";
}

static void test_history_limit_and_audit()
{
    MarketFixture f;
    f.add_user("bob");
    for (int i = 0; i < 60; ++i) {
        expect_ok(f.ledger.deposit("bob", 10), "deposit");
    }
    for (int i = 0; i < 15; ++i) {
        expect_ok(f.ledger.debit(entry("bob", 7)), "debit");
    }
    assert(expect_ok(f.ledger.history("bob"), "history").size() == WalletLedger::kDefaultHistoryLimit);
    assert(expect_ok(f.ledger.history("bob", 5), "history").size() == 5);
    assert(expect_ok(f.ledger.history("bob", 0), "history").size() == 75);

    auto a = expect_ok(f.ledger.audit("bob"), "audit");
    assert(a.consistent());
    assert(a.balance == 600 - 105);
    assert(a.transactions == 75);
    expect_err(f.ledger.history("ghost"), MarketErrorCode::UserNotFound, "history of unknown user");
    std::cout << "history/audit ok\n";
}

static void test_concurrent_mutations()
{
    MarketFixture f;
    f.add_user("carol", UserRole::BUYER, 1'000);

    constexpr int kThreads = 8;
    constexpr int kOps = 200;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&f, t] {
            for (int i = 0; i < kOps; ++i) {
                if ((i + t) % 2 == 0) {
                    auto r = f.ledger.credit(LedgerEntry{"carol", 3, TransactionKind::RECEIPT, std::nullopt, std::nullopt});
                    assert(!is_error(r));
                } else {
                    // May legitimately fail with InsufficientBalance; must never go negative.
                    auto r = f.ledger.debit(LedgerEntry{"carol", 5, TransactionKind::PAYMENT, std::nullopt, std::nullopt});
                    if (is_error(r)) {
                        assert(error_of(r).code == MarketErrorCode::InsufficientBalance);
                    } else {
                        assert(std::get<Sats>(r) >= 0);
                    }
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    auto a = expect_ok(f.ledger.audit("carol"), "audit");
    assert(a.consistent());
    assert(a.balance >= 0);
    std::cout << "concurrent mutations ok (balance=" << a.balance << ", txs=" << a.transactions << ")\n";
}

static std::optional<User> user_row(MarketFixture& f, const std::string& id)
{
    auto txn = f.store->begin();
    return txn->get_user(id);
}

static void test_withdraw()
{
    MarketFixture f;
    f.add_user("dave", UserRole::SELLER, 500);

    auto inv = expect_ok(f.payments.create_invoice(200), "invoice");
    auto paid = expect_ok(f.ledger.withdraw("dave", 200, inv.payment_request), "withdraw");
    assert(paid.amount_paid == 200);
    assert(f.payments.total_paid() == 200);
    assert(f.balance("dave") == 300);
    auto hist = expect_ok(f.ledger.history("dave", 1), "history");
    assert(hist[0].kind == TransactionKind::WITHDRAW && hist[0].amount == -200);
    assert(hist[0].reference_id.has_value());

    // A failed payout is reversed: debit and reversal share a reference and net to zero.
    f.payments.fail_next_payment();
    expect_err(f.ledger.withdraw("dave", 100, inv.payment_request), MarketErrorCode::PaymentFailed, "failed payout");
    assert(f.balance("dave") == 300);
    assert(f.payments.total_paid() == 200);
    hist = expect_ok(f.ledger.history("dave", 2), "history");
    assert(hist[0].amount == 100 && hist[1].amount == -100);
    assert(hist[0].reference_id == hist[1].reference_id);
    auto pair = expect_ok(f.ledger.by_reference(*hist[0].reference_id), "by_reference");
    assert(pair.size() == 2);
    assert(pair[0].amount == -100 && pair[0].balance_after == 200);
    assert(pair[1].amount == 100 && pair[1].balance_after == 300);

    expect_err(f.ledger.withdraw("dave", 100, "not-an-invoice"), MarketErrorCode::PaymentFailed, "bad invoice");
    expect_err(f.ledger.withdraw("dave", 301, inv.payment_request), MarketErrorCode::InsufficientBalance, "overdraw");
    assert(f.balance("dave") == 300);
    assert(expect_ok(f.ledger.audit("dave"), "audit").consistent());

    WalletLedger no_processor{*f.store, f.clock};
    expect_err(no_processor.withdraw("dave", 1, inv.payment_request), MarketErrorCode::PaymentFailed, "no processor");
    std::cout << "withdraw ok\n";
}

static void test_withdraw_never_pays_uncommitted_debit()
{
    MarketFixture f;
    f.add_user("ivan", UserRole::SELLER, 500);
    auto inv = expect_ok(f.payments.create_invoice(400), "invoice");

    f.faults.fail_next_commit();
    expect_err(f.ledger.withdraw("ivan", 400, inv.payment_request), MarketErrorCode::StorageFailure, "commit fails");
    assert(f.payments.total_paid() == 0);
    assert(f.balance("ivan") == 500);
    assert(expect_ok(f.ledger.history("ivan", 0), "history").size() == 1);

    expect_ok(f.ledger.withdraw("ivan", 400, inv.payment_request), "retry");
    assert(f.payments.total_paid() == 400);
    assert(f.balance("ivan") == 100);
    std::cout << "withdraw commit failure ok\n";
}

static void test_deposit_token()
{
    MarketFixture f;
    f.add_user("judy");

    const std::string token = MockPaymentProcessor::mint_token(750);
    assert(expect_ok(f.ledger.deposit_token("judy", token), "deposit_token") == 750);
    assert(f.balance("judy") == 750);
    auto hist = expect_ok(f.ledger.history("judy", 1), "history");
    assert(hist[0].kind == TransactionKind::DEPOSIT && hist[0].amount == 750);
    assert(hist[0].description == std::optional<std::string>("Ecash token deposit"));

    expect_err(f.ledger.deposit_token("judy", token), MarketErrorCode::InvalidPaymentToken, "replay");
    expect_err(f.ledger.deposit_token("judy", "garbage"), MarketErrorCode::InvalidPaymentToken, "garbage");

    // An unknown user is refused before the token is claimed.
    const std::string other = MockPaymentProcessor::mint_token(20);
    expect_err(f.ledger.deposit_token("nobody", other), MarketErrorCode::UserNotFound, "unknown user");
    assert(expect_ok(f.ledger.deposit_token("judy", other), "token still good") == 20);

    // Claimed but not credited: the error surfaces and the balance is untouched.
    const std::string lost = MockPaymentProcessor::mint_token(5);
    f.faults.fail_next_commit(1);
    expect_err(f.ledger.deposit_token("judy", lost), MarketErrorCode::StorageFailure, "credit commit fails");
    assert(f.balance("judy") == 770);
    expect_err(f.ledger.deposit_token("judy", lost), MarketErrorCode::InvalidPaymentToken, "already claimed");
    assert(expect_ok(f.ledger.audit("judy"), "audit").consistent());
    std::cout << "deposit_token ok\n";
}

static void test_credit_overflow()
{
    MarketFixture f;
    f.add_user("kim");
    constexpr Sats kMax = std::numeric_limits<Sats>::max();
    assert(expect_ok(f.ledger.deposit("kim", kMax), "max deposit") == kMax);
    expect_err(f.ledger.deposit("kim", kMax), MarketErrorCode::InvalidAmount, "overflow");
    expect_err(f.ledger.deposit("kim", 1), MarketErrorCode::InvalidAmount, "overflow by one");
    assert(f.balance("kim") == kMax);
    assert(expect_ok(f.ledger.history("kim", 0), "history").size() == 1);
    assert(expect_ok(f.ledger.audit("kim"), "audit").consistent());
    std::cout << "credit overflow ok\n";
}

static void test_seller_bonds()
{
    MarketFixture f;
    WalletLedger ledger{*f.store, f.clock, &f.payments, SellerBondSchedule{100, 200, 300, 451}};
    f.add_user("erin", UserRole::BUYER, 2000);

    expect_err(ledger.pay_bond("erin", "jewelry"), MarketErrorCode::InvalidCategory, "bad category");
    expect_err(ledger.pay_bond("ghost", "digital"), MarketErrorCode::UserNotFound, "unknown user");

    auto granted = expect_ok(ledger.pay_bond("erin", "digital"), "digital");
    assert(granted.size() == 1 && granted[0].category == BondCategory::DIGITAL && granted[0].bond_paid == 100);
    assert(f.balance("erin") == 1900);
    assert(user_row(f, "erin")->role == UserRole::SELLER);
    auto hist = expect_ok(ledger.history("erin", 1), "history");
    assert(hist[0].kind == TransactionKind::BOND && hist[0].amount == -100);
    assert(hist[0].description == std::optional<std::string>("Seller bond for digital category"));

    expect_err(ledger.pay_bond("erin", "digital"), MarketErrorCode::BondAlreadyPaid, "twice");
    assert(f.balance("erin") == 1900);

    // "all" only grants what is missing, at a third of the bundle price each.
    granted = expect_ok(ledger.pay_bond("erin", "all"), "all");
    assert(granted.size() == 2);
    assert(granted[0].category == BondCategory::PHYSICAL && granted[0].bond_paid == 150);
    assert(granted[1].category == BondCategory::SERVICES && granted[1].bond_paid == 150);
    assert(f.balance("erin") == 1600);
    assert(expect_ok(ledger.bonds("erin"), "bonds").size() == 3);
    expect_err(ledger.pay_bond("erin", "all"), MarketErrorCode::BondAlreadyPaid, "all twice");
    expect_err(ledger.pay_bond("erin", "services"), MarketErrorCode::BondAlreadyPaid, "covered by all");

    // Fresh "all" charges the bundle; the last row takes the rounding remainder.
    f.add_user("gina", UserRole::BUYER, 1000);
    granted = expect_ok(ledger.pay_bond("gina", "all"), "gina all");
    assert(granted.size() == 3);
    assert(granted[0].bond_paid + granted[1].bond_paid + granted[2].bond_paid == 451);
    assert(granted[2].bond_paid == 151);
    assert(f.balance("gina") == 549);

    f.add_user("frank", UserRole::BUYER, 100);
    expect_err(ledger.pay_bond("frank", "physical"), MarketErrorCode::InsufficientBalance, "short");
    assert(expect_ok(ledger.bonds("frank"), "bonds").empty());
    assert(user_row(f, "frank")->role == UserRole::BUYER);

    f.add_user("root", UserRole::ADMIN, 1000);
    expect_ok(ledger.pay_bond("root", "services"), "admin bond");
    assert(user_row(f, "root")->role == UserRole::ADMIN);

    assert(expect_ok(ledger.audit("erin"), "audit").consistent());
    assert(expect_ok(ledger.audit("gina"), "audit").consistent());
    std::cout << "seller bonds ok\n";
}

int main()
{
    test_credit_debit();
    test_history_limit_and_audit();
    test_concurrent_mutations();
    test_withdraw();
    test_withdraw_never_pays_uncommitted_debit();
    test_deposit_token();
    test_credit_overflow();
    test_seller_bonds();
    std::cout << "OK\n";
    return 0;
}
