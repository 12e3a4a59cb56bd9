#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "market/errors.hpp"
#include "market/types.hpp"
#include "payment/payment_processor.hpp"
#include "store/market_store.hpp"
#include "util/clock.hpp"

// One balance mutation and the transaction row that records it.
struct LedgerEntry {
    std::string user_id;
    Sats amount{0};  // always positive; direction comes from credit vs debit
    TransactionKind kind{TransactionKind::DEPOSIT};
    std::optional<std::string> reference_id;
    std::optional<std::string> description;
};

struct LedgerAudit {
    Sats balance{0};         // materialized on the user row
    Sats sum_of_deltas{0};   // recomputed from the transaction log
    std::size_t transactions{0};

    bool consistent() const { return balance == sum_of_deltas && balance >= 0; }
};

// Owns every balance change. Each public call is one store transaction holding
// the user's row lock; apply_* compose into a caller's transaction instead.
class WalletLedger {
public:
    static constexpr std::size_t kDefaultHistoryLimit = 50;

    WalletLedger(IMarketStore& store, const IClock& clock, IPaymentProcessor* payments = nullptr,
                 SellerBondSchedule bonds = {})
        : store_(store), clock_(clock), payments_(payments), bond_schedule_(bonds) {}

    MarketResult<User> register_user(const std::string& id, UserRole role);

    MarketResult<Sats> credit(const LedgerEntry& entry);
    MarketResult<Sats> debit(const LedgerEntry& entry);

    MarketResult<Sats> deposit(const std::string& user_id, Sats amount,
                               std::optional<std::string> description = std::nullopt);
    // Commits the debit before paying the invoice. If the payout fails the debit
    // is reversed with a second WITHDRAW row, so the net balance is unchanged.
    MarketResult<PaymentReceipt> withdraw(const std::string& user_id, Sats amount,
                                          const std::string& invoice);

    // Claims the token, then credits its value. A token claimed but not credited
    // is logged by hash for manual recovery.
    MarketResult<Sats> deposit_token(const std::string& user_id, const std::string& token,
                                     std::optional<std::string> reference_id = std::nullopt,
                                     std::optional<std::string> description = std::nullopt);

    // Debits the category bond and grants selling rights. "all" grants every
    // category not yet held.
    MarketResult<std::vector<SellerBond>> pay_bond(const std::string& user_id, const std::string& category);
    MarketResult<std::vector<SellerBond>> bonds(const std::string& user_id);

    MarketResult<Sats> balance(const std::string& user_id);
    MarketResult<std::vector<WalletTransaction>> history(const std::string& user_id,
                                                         std::size_t limit = kDefaultHistoryLimit);
    MarketResult<LedgerAudit> audit(const std::string& user_id);
    // Every row tagged with the reference, across users.
    MarketResult<std::vector<WalletTransaction>> by_reference(const std::string& reference_id);

    MarketResult<Sats> apply_credit(IMarketTxn& txn, const LedgerEntry& entry) const;
    MarketResult<Sats> apply_debit(IMarketTxn& txn, const LedgerEntry& entry) const;

private:
    MarketResult<Sats> apply(IMarketTxn& txn, const LedgerEntry& entry, bool is_credit) const;

    IMarketStore& store_;
    const IClock& clock_;
    IPaymentProcessor* payments_;
    SellerBondSchedule bond_schedule_;
};
