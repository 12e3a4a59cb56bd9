#include "ledger/wallet_ledger.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

#include "store/txn_runner.hpp"
#include "util/ids.hpp"
#include "util/sha256.hpp"

namespace {
MarketError user_not_found(const std::string& id) {
    return market_error(MarketErrorCode::UserNotFound, "user '" + id + "' not found");
}

MarketError no_processor() {
    return market_error(MarketErrorCode::PaymentFailed, "no payment processor configured");
}

constexpr BondCategory kSingleCategories[] = {BondCategory::DIGITAL, BondCategory::PHYSICAL,
                                              BondCategory::SERVICES};
}

MarketResult<User> WalletLedger::register_user(const std::string& id, UserRole role) {
    return in_transaction<User>(store_, [&](IMarketTxn& txn) -> MarketResult<User> {
        User u;
        u.id = id;
        u.role = role;
        u.wallet_balance = 0;
        u.created_at = clock_.now();
        if (!txn.insert_user(u)) {
            return market_error(MarketErrorCode::UserAlreadyExists, "user '" + id + "' already exists");
        }
        return u;
    });
}

MarketResult<Sats> WalletLedger::apply(IMarketTxn& txn, const LedgerEntry& entry, bool is_credit) const {
    if (entry.amount <= 0) {
        return market_error(MarketErrorCode::InvalidAmount,
                            "amount must be positive, got " + std::to_string(entry.amount));
    }
    auto user = txn.lock_user(entry.user_id);
    if (!user) {
        return user_not_found(entry.user_id);
    }
    if (!is_credit && user->wallet_balance < entry.amount) {
        return insufficient_balance(entry.amount, user->wallet_balance);
    }
    if (is_credit && entry.amount > std::numeric_limits<Sats>::max() - user->wallet_balance) {
        return market_error(MarketErrorCode::InvalidAmount,
                            "credit of " + std::to_string(entry.amount) + " would overflow the balance of '" +
                                entry.user_id + "'");
    }

    const Sats delta = is_credit ? entry.amount : -entry.amount;
    const Sats new_balance = user->wallet_balance + delta;

    WalletTransaction tx;
    tx.id = new_id("wtx");
    tx.user_id = entry.user_id;
    tx.kind = entry.kind;
    tx.amount = delta;
    tx.balance_after = new_balance;
    tx.reference_id = entry.reference_id;
    tx.description = entry.description;
    tx.created_at = clock_.now();

    txn.set_balance(entry.user_id, new_balance);
    txn.append_transaction(tx);
    return new_balance;
}

MarketResult<Sats> WalletLedger::apply_credit(IMarketTxn& txn, const LedgerEntry& entry) const {
    return apply(txn, entry, true);
}

MarketResult<Sats> WalletLedger::apply_debit(IMarketTxn& txn, const LedgerEntry& entry) const {
    return apply(txn, entry, false);
}

MarketResult<Sats> WalletLedger::credit(const LedgerEntry& entry) {
    return in_transaction<Sats>(store_, [&](IMarketTxn& txn) { return apply_credit(txn, entry); });
}

MarketResult<Sats> WalletLedger::debit(const LedgerEntry& entry) {
    return in_transaction<Sats>(store_, [&](IMarketTxn& txn) { return apply_debit(txn, entry); });
}

MarketResult<Sats> WalletLedger::deposit(const std::string& user_id, Sats amount,
                                         std::optional<std::string> description) {
    LedgerEntry e{user_id, amount, TransactionKind::DEPOSIT, std::nullopt,
                  description ? std::move(description) : std::optional<std::string>("Deposit")};
    return credit(e);
}

MarketResult<PaymentReceipt> WalletLedger::withdraw(const std::string& user_id, Sats amount,
                                                    const std::string& invoice) {
    if (!payments_) {
        return no_processor();
    }
    const std::string ref = new_id("wdr");
    auto debited = debit(LedgerEntry{user_id, amount, TransactionKind::WITHDRAW, ref,
                                     std::string("Withdrawal to Lightning invoice")});
    if (is_error(debited)) {
        return error_of(debited);
    }

    auto paid = payments_->pay_invoice(invoice, amount);
    if (!is_error(paid)) {
        return paid;
    }
    std::cerr << "[ledger] withdrawal " << ref << " for " << user_id << " failed: "
              << error_of(paid).message << std::endl;

    auto reversed = credit(LedgerEntry{user_id, amount, TransactionKind::WITHDRAW, ref,
                                       std::string("Withdrawal reversed: payout failed")});
    if (is_error(reversed)) {
        std::cerr << "[ledger] MANUAL CREDIT NEEDED: " << amount << " sats to " << user_id
                  << " for withdrawal " << ref << ": " << error_of(reversed).message << std::endl;
    }
    return error_of(paid);
}

MarketResult<Sats> WalletLedger::deposit_token(const std::string& user_id, const std::string& token,
                                               std::optional<std::string> reference_id,
                                               std::optional<std::string> description) {
    if (!payments_) {
        return no_processor();
    }
    // Refuse before claiming, so an unknown user never burns a token.
    auto known = balance(user_id);
    if (is_error(known)) {
        return error_of(known);
    }

    auto received = payments_->receive_token(token);
    if (is_error(received)) {
        return error_of(received);
    }
    const Sats amount = std::get<Sats>(received);

    LedgerEntry e{user_id, amount, TransactionKind::DEPOSIT, std::move(reference_id),
                  description ? std::move(description) : std::optional<std::string>("Ecash token deposit")};
    auto credited = credit(e);
    if (is_error(credited)) {
        std::cerr << "[ledger] MANUAL CREDIT NEEDED: token " << sha256_hex(token) << " worth " << amount
                  << " sats claimed for " << user_id << " but not credited: " << error_of(credited).message
                  << std::endl;
        return error_of(credited);
    }
    return amount;
}

MarketResult<std::vector<SellerBond>> WalletLedger::pay_bond(const std::string& user_id,
                                                             const std::string& category) {
    using Bonds = std::vector<SellerBond>;
    auto cat = parse_bond_category(category);
    if (!cat) {
        return market_error(MarketErrorCode::InvalidCategory, "unknown seller category '" + category + "'");
    }

    return in_transaction<Bonds>(store_, [&](IMarketTxn& txn) -> MarketResult<Bonds> {
        auto user = txn.lock_user(user_id);
        if (!user) {
            return user_not_found(user_id);
        }
        const auto held = txn.list_seller_bonds(user_id);
        auto holds = [&](BondCategory c) {
            return std::any_of(held.begin(), held.end(), [c](const SellerBond& b) { return b.category == c; });
        };

        std::vector<BondCategory> granting;
        if (*cat == BondCategory::ALL) {
            for (auto c : kSingleCategories) {
                if (!holds(c)) granting.push_back(c);
            }
        } else if (!holds(*cat)) {
            granting.push_back(*cat);
        }
        if (granting.empty()) {
            return market_error(MarketErrorCode::BondAlreadyPaid,
                                "'" + user_id + "' already holds a " + std::string(to_cstr(*cat)) + " bond");
        }

        // "all" is priced as a bundle and split evenly across the three rows;
        // the last row takes the remainder.
        const Sats total_bond = bond_schedule_.amount_for(*cat);
        const Sats share = *cat == BondCategory::ALL ? total_bond / 3 : total_bond;
        const Sats remainder = *cat == BondCategory::ALL ? total_bond - share * 3 : 0;

        Bonds granted;
        Sats charge = 0;
        const Timestamp now = clock_.now();
        for (auto c : granting) {
            SellerBond b;
            b.user_id = user_id;
            b.category = c;
            b.bond_paid = share;
            b.paid_at = now;
            charge += share;
            granted.push_back(std::move(b));
        }
        if (granting.size() == 3) {
            granted.back().bond_paid += remainder;
            charge += remainder;
        }

        auto debited = apply_debit(txn, LedgerEntry{user_id, charge, TransactionKind::BOND, std::nullopt,
                                                     std::string("Seller bond for ") + to_cstr(*cat) + " category"});
        if (is_error(debited)) {
            return error_of(debited);
        }
        for (const auto& b : granted) {
            txn.insert_seller_bond(b);
        }
        if (user->role == UserRole::BUYER) {
            txn.set_role(user_id, UserRole::SELLER);
        }
        std::cout << "[ledger] " << user_id << " paid " << charge << " sats bond for " << to_cstr(*cat) << std::endl;
        return granted;
    });
}

MarketResult<std::vector<SellerBond>> WalletLedger::bonds(const std::string& user_id) {
    using Bonds = std::vector<SellerBond>;
    return in_transaction<Bonds>(store_, [&](IMarketTxn& txn) -> MarketResult<Bonds> {
        if (!txn.get_user(user_id)) {
            return user_not_found(user_id);
        }
        return txn.list_seller_bonds(user_id);
    });
}

MarketResult<Sats> WalletLedger::balance(const std::string& user_id) {
    return in_transaction<Sats>(store_, [&](IMarketTxn& txn) -> MarketResult<Sats> {
        auto user = txn.get_user(user_id);
        if (!user) {
            return user_not_found(user_id);
        }
        return user->wallet_balance;
    });
}

MarketResult<std::vector<WalletTransaction>> WalletLedger::history(const std::string& user_id,
                                                                   std::size_t limit) {
    using Txs = std::vector<WalletTransaction>;
    return in_transaction<Txs>(store_, [&](IMarketTxn& txn) -> MarketResult<Txs> {
        if (!txn.get_user(user_id)) {
            return user_not_found(user_id);
        }
        return txn.list_transactions(user_id, limit);
    });
}

MarketResult<LedgerAudit> WalletLedger::audit(const std::string& user_id) {
    return in_transaction<LedgerAudit>(store_, [&](IMarketTxn& txn) -> MarketResult<LedgerAudit> {
        auto user = txn.lock_user(user_id);
        if (!user) {
            return user_not_found(user_id);
        }
        LedgerAudit a;
        a.balance = user->wallet_balance;
        for (const auto& tx : txn.list_transactions(user_id, 0)) {
            a.sum_of_deltas += tx.amount;
            ++a.transactions;
        }
        if (!a.consistent()) {
            std::cerr << "[ledger] audit mismatch for " << user_id << ": balance=" << a.balance
                      << " sum=" << a.sum_of_deltas << std::endl;
        }
        return a;
    });
}

MarketResult<std::vector<WalletTransaction>> WalletLedger::by_reference(const std::string& reference_id) {
    using Txs = std::vector<WalletTransaction>;
    return in_transaction<Txs>(store_, [&](IMarketTxn& txn) -> MarketResult<Txs> {
        return txn.transactions_for_reference(reference_id);
    });
}
