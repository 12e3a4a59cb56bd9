#include "escrow/escrow_engine.hpp"

#include <algorithm>
#include <iostream>

#include "store/txn_runner.hpp"
#include "util/ids.hpp"

namespace {
MarketError escrow_not_found(const std::string& id) {
    return market_error(MarketErrorCode::EscrowNotFound, "escrow '" + id + "' not found");
}

// Applies the settled status to the order attached to this escrow, if any.
std::optional<Order> settle_order(IMarketTxn& txn, const std::string& escrow_id, OrderStatus status,
                                  std::optional<Timestamp> completed_at) {
    auto order = txn.lock_order_for_escrow(escrow_id);
    if (!order) return std::nullopt;
    order->status = status;
    if (completed_at) order->completed_at = completed_at;
    txn.update_order(*order);
    return order;
}

// A refund of a disputed escrow settles the dispute in the buyer's favour.
void close_dispute_for_refund(IMarketTxn& txn, const Order& order, Timestamp now) {
    auto found = txn.dispute_for_order(order.id);
    if (!found) return;
    auto d = txn.lock_dispute(found->id);
    if (!d || !d->is_open()) return;
    d->status = DisputeStatus::RESOLVED;
    d->resolution = DisputeResolution::buyer_full();
    d->resolved_by = "system";
    d->resolution_notes = "Escrow refunded directly";
    d->resolved_at = now;
    txn.update_dispute(*d);
    std::cout << "[escrow] dispute " << d->id << " closed by refund of " << order.escrow_id << std::endl;
}
}

MarketResult<Escrow> EscrowEngine::apply_create(IMarketTxn& txn, const std::string& buyer_id,
                                                const std::string& seller_id, Sats amount,
                                                int hold_days) const {
    if (amount <= 0) {
        return market_error(MarketErrorCode::InvalidAmount,
                            "escrow amount must be positive, got " + std::to_string(amount));
    }
    if (!txn.get_user(seller_id)) {
        return market_error(MarketErrorCode::UserNotFound, "seller '" + seller_id + "' not found");
    }

    const Timestamp now = clock_.now();
    Escrow e;
    e.id = new_id("esc");
    e.buyer_id = buyer_id;
    e.seller_id = seller_id;
    e.amount = amount;
    e.status = EscrowStatus::HELD;
    e.created_at = now;
    e.auto_release_at = now + days(hold_days);

    auto debited = ledger_.apply_debit(txn, LedgerEntry{buyer_id, amount, TransactionKind::ESCROW_HOLD,
                                                        e.id, std::nullopt});
    if (is_error(debited)) {
        return error_of(debited);
    }
    txn.insert_escrow(e);
    return e;
}

MarketResult<Escrow> EscrowEngine::apply_release(IMarketTxn& txn, const std::string& escrow_id) const {
    auto e = txn.lock_escrow(escrow_id);
    if (!e) {
        return escrow_not_found(escrow_id);
    }
    if (e->status != EscrowStatus::HELD) {
        return market_error(MarketErrorCode::EscrowAlreadyReleased,
                            "escrow '" + escrow_id + "' is " + to_cstr(e->status) + ", not held");
    }

    const Timestamp now = clock_.now();
    e->status = EscrowStatus::RELEASED;
    e->resolved_at = now;
    txn.update_escrow(*e);

    auto credited = ledger_.apply_credit(txn, LedgerEntry{e->seller_id, e->amount,
                                                          TransactionKind::ESCROW_RELEASE, e->id,
                                                          std::nullopt});
    if (is_error(credited)) {
        return error_of(credited);
    }
    settle_order(txn, escrow_id, OrderStatus::COMPLETED, now);
    return *e;
}

MarketResult<Escrow> EscrowEngine::apply_refund(IMarketTxn& txn, const std::string& escrow_id) const {
    auto e = txn.lock_escrow(escrow_id);
    if (!e) {
        return escrow_not_found(escrow_id);
    }
    if (e->status != EscrowStatus::HELD && e->status != EscrowStatus::DISPUTED) {
        return market_error(MarketErrorCode::EscrowAlreadyRefunded,
                            "escrow '" + escrow_id + "' is " + to_cstr(e->status) + ", cannot refund");
    }

    const bool was_disputed = e->status == EscrowStatus::DISPUTED;
    const Timestamp now = clock_.now();
    e->status = EscrowStatus::REFUNDED;
    e->resolved_at = now;
    txn.update_escrow(*e);

    auto credited = ledger_.apply_credit(txn, LedgerEntry{e->buyer_id, e->amount,
                                                          TransactionKind::ESCROW_REFUND, e->id,
                                                          std::nullopt});
    if (is_error(credited)) {
        return error_of(credited);
    }
    auto order = settle_order(txn, escrow_id, OrderStatus::REFUNDED, std::nullopt);
    if (was_disputed && order) {
        close_dispute_for_refund(txn, *order, now);
    }
    return *e;
}

MarketResult<bool> EscrowEngine::apply_mark_disputed(IMarketTxn& txn, const std::string& escrow_id) const {
    auto e = txn.lock_escrow(escrow_id);
    if (!e) {
        return escrow_not_found(escrow_id);
    }
    if (e->status != EscrowStatus::HELD) {
        return false;
    }
    e->status = EscrowStatus::DISPUTED;
    txn.update_escrow(*e);
    return true;
}

MarketResult<ResolutionOutcome> EscrowEngine::apply_resolve_dispute(IMarketTxn& txn,
                                                                    const std::string& escrow_id,
                                                                    const DisputeResolution& resolution) const {
    auto e = txn.lock_escrow(escrow_id);
    if (!e || e->status != EscrowStatus::DISPUTED) {
        return market_error(MarketErrorCode::EscrowNotFound,
                            "escrow '" + escrow_id + "' not found in disputed state");
    }

    const Timestamp now = clock_.now();
    const SplitAmounts split = compute_split(resolution, e->amount);

    e->status = settled_escrow_status(resolution);
    e->resolved_at = now;
    txn.update_escrow(*e);

    // Both parties may be credited; take their row locks in id order.
    std::string first = std::min(e->buyer_id, e->seller_id);
    std::string second = std::max(e->buyer_id, e->seller_id);
    if (!txn.lock_user(first)) {
        return market_error(MarketErrorCode::UserNotFound, "user '" + first + "' not found");
    }
    if (second != first && !txn.lock_user(second)) {
        return market_error(MarketErrorCode::UserNotFound, "user '" + second + "' not found");
    }

    if (split.buyer > 0) {
        auto r = ledger_.apply_credit(txn, LedgerEntry{e->buyer_id, split.buyer,
                                                       TransactionKind::ESCROW_REFUND, e->id,
                                                       std::nullopt});
        if (is_error(r)) return error_of(r);
    }
    if (split.seller > 0) {
        auto r = ledger_.apply_credit(txn, LedgerEntry{e->seller_id, split.seller,
                                                       TransactionKind::ESCROW_RELEASE, e->id,
                                                       std::nullopt});
        if (is_error(r)) return error_of(r);
    }
    settle_order(txn, escrow_id, settled_order_status(resolution), now);

    if (split.destroyed > 0) {
        std::cout << "[escrow] " << escrow_id << " resolved " << to_string(resolution)
                  << ", destroyed " << split.destroyed << " sats" << std::endl;
    }
    return ResolutionOutcome{*e, split};
}

MarketResult<Escrow> EscrowEngine::create_escrow(const std::string& buyer_id, const std::string& seller_id,
                                                 Sats amount, int hold_days) {
    return in_transaction<Escrow>(store_, [&](IMarketTxn& txn) {
        return apply_create(txn, buyer_id, seller_id, amount, hold_days);
    });
}

MarketResult<Escrow> EscrowEngine::release(const std::string& escrow_id) {
    return in_transaction<Escrow>(store_, [&](IMarketTxn& txn) { return apply_release(txn, escrow_id); });
}

MarketResult<Escrow> EscrowEngine::refund(const std::string& escrow_id) {
    return in_transaction<Escrow>(store_, [&](IMarketTxn& txn) { return apply_refund(txn, escrow_id); });
}

MarketResult<bool> EscrowEngine::mark_disputed(const std::string& escrow_id) {
    return in_transaction<bool>(store_, [&](IMarketTxn& txn) { return apply_mark_disputed(txn, escrow_id); });
}

MarketResult<ResolutionOutcome> EscrowEngine::resolve_dispute(const std::string& escrow_id,
                                                              const DisputeResolution& resolution) {
    return in_transaction<ResolutionOutcome>(store_, [&](IMarketTxn& txn) {
        return apply_resolve_dispute(txn, escrow_id, resolution);
    });
}

MarketResult<Escrow> EscrowEngine::get(const std::string& escrow_id) {
    return in_transaction<Escrow>(store_, [&](IMarketTxn& txn) -> MarketResult<Escrow> {
        auto e = txn.get_escrow(escrow_id);
        if (!e) return escrow_not_found(escrow_id);
        return *e;
    });
}

MarketResult<std::vector<Escrow>> EscrowEngine::due_for_release() {
    using Escrows = std::vector<Escrow>;
    const Timestamp now = clock_.now();
    return in_transaction<Escrows>(store_, [&](IMarketTxn& txn) -> MarketResult<Escrows> {
        return txn.due_escrows(now);
    });
}

std::chrono::seconds EscrowEngine::time_until_release(const Escrow& e) const {
    const auto remaining = e.auto_release_at - clock_.now();
    if (remaining <= Timestamp::duration::zero()) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(remaining);
}
