#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "ledger/wallet_ledger.hpp"
#include "market/dispute.hpp"
#include "market/errors.hpp"
#include "market/types.hpp"
#include "store/market_store.hpp"
#include "util/clock.hpp"

struct ResolutionOutcome {
    Escrow escrow;
    SplitAmounts split;
};

// Escrow lifecycle: held -> {released, refunded, disputed}; disputed -> {released, refunded}.
// Every transition and its ledger movements commit together or not at all.
class EscrowEngine {
public:
    EscrowEngine(IMarketStore& store, WalletLedger& ledger, const IClock& clock)
        : store_(store), ledger_(ledger), clock_(clock) {}

    // Debits the buyer (escrow_hold) and persists a held escrow.
    MarketResult<Escrow> create_escrow(const std::string& buyer_id, const std::string& seller_id,
                                       Sats amount, int hold_days);
    MarketResult<Escrow> release(const std::string& escrow_id);
    // Refunding a disputed escrow also closes its dispute as buyer_full, resolved by "system".
    MarketResult<Escrow> refund(const std::string& escrow_id);
    // true if the escrow moved held -> disputed, false if it was not held.
    MarketResult<bool> mark_disputed(const std::string& escrow_id);
    MarketResult<ResolutionOutcome> resolve_dispute(const std::string& escrow_id,
                                                    const DisputeResolution& resolution);

    MarketResult<Escrow> get(const std::string& escrow_id);
    MarketResult<std::vector<Escrow>> due_for_release();
    // Zero once the deadline has passed.
    std::chrono::seconds time_until_release(const Escrow& e) const;

    // Transaction-scoped forms used by checkout, orders and disputes.
    MarketResult<Escrow> apply_create(IMarketTxn& txn, const std::string& buyer_id,
                                      const std::string& seller_id, Sats amount, int hold_days) const;
    MarketResult<Escrow> apply_release(IMarketTxn& txn, const std::string& escrow_id) const;
    MarketResult<Escrow> apply_refund(IMarketTxn& txn, const std::string& escrow_id) const;
    MarketResult<bool> apply_mark_disputed(IMarketTxn& txn, const std::string& escrow_id) const;
    MarketResult<ResolutionOutcome> apply_resolve_dispute(IMarketTxn& txn, const std::string& escrow_id,
                                                          const DisputeResolution& resolution) const;

private:
    IMarketStore& store_;
    WalletLedger& ledger_;
    const IClock& clock_;
};
