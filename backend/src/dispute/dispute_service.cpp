#include "dispute/dispute_service.hpp"

#include <chrono>
#include <iostream>

#include "store/txn_runner.hpp"
#include "util/ids.hpp"

namespace {
MarketError dispute_not_found(const std::string& id) {
    return market_error(MarketErrorCode::DisputeNotFound, "dispute '" + id + "' not found");
}

MarketError already_resolved(const std::string& id) {
    return market_error(MarketErrorCode::DisputeAlreadyResolved, "dispute '" + id + "' is already resolved");
}

bool is_party(const Order& o, const std::string& user_id) {
    return o.buyer_id == user_id || o.seller_id == user_id;
}
}

MarketResult<Dispute> DisputeService::open(const std::string& order_id, const std::string& initiator,
                                           const std::string& reason) {
    return in_transaction<Dispute>(store_, [&](IMarketTxn& txn) -> MarketResult<Dispute> {
        auto order = txn.get_order(order_id);
        if (!order) {
            return market_error(MarketErrorCode::OrderNotFound, "order '" + order_id + "' not found");
        }
        if (!is_party(*order, initiator)) {
            return market_error(MarketErrorCode::NotAuthorized,
                                "'" + initiator + "' is not a party to order '" + order_id + "'");
        }

        // Escrow row first, then the order row.
        auto marked = escrow_.apply_mark_disputed(txn, order->escrow_id);
        if (is_error(marked)) {
            return error_of(marked);
        }
        order = txn.lock_order(order_id);
        if (!order) {
            return market_error(MarketErrorCode::OrderNotFound, "order '" + order_id + "' not found");
        }
        if (!order->can_dispute() || txn.dispute_for_order(order_id)) {
            return market_error(MarketErrorCode::OrderCannotBeDisputed,
                                "order '" + order_id + "' is " + to_cstr(order->status) +
                                    " and cannot be disputed");
        }

        const Timestamp now = clock_.now();
        Dispute d;
        d.id = new_id("dsp");
        d.order_id = order_id;
        d.escrow_id = order->escrow_id;
        d.initiated_by = initiator;
        d.reason = reason;
        d.status = DisputeStatus::OPEN;
        d.auto_resolve_at = now + days(opts_.window_days);
        d.created_at = now;
        txn.insert_dispute(d);

        order->status = OrderStatus::DISPUTED;
        txn.update_order(*order);

        std::cout << "[dispute] opened " << d.id << " on order " << order_id << std::endl;
        return d;
    });
}

MarketResult<DisputeEvidence> DisputeService::submit_evidence(const std::string& dispute_id,
                                                              const std::string& submitter,
                                                              EvidenceType type,
                                                              const std::string& content) {
    return in_transaction<DisputeEvidence>(store_, [&](IMarketTxn& txn) -> MarketResult<DisputeEvidence> {
        auto d = txn.lock_dispute(dispute_id);
        if (!d) {
            return dispute_not_found(dispute_id);
        }
        if (!d->is_open()) {
            return already_resolved(dispute_id);
        }
        auto order = txn.get_order(d->order_id);
        const bool party = order && is_party(*order, submitter);
        if (!party) {
            auto user = txn.get_user(submitter);
            if (!user || user->role != UserRole::ADMIN) {
                return market_error(MarketErrorCode::NotAuthorized,
                                    "'" + submitter + "' may not add evidence to dispute '" +
                                        dispute_id + "'");
            }
        }

        DisputeEvidence ev;
        ev.id = new_id("evd");
        ev.dispute_id = dispute_id;
        ev.submitted_by = submitter;
        ev.type = type;
        ev.content = content;
        ev.created_at = clock_.now();
        txn.insert_evidence(ev);
        return ev;
    });
}

MarketResult<Dispute> DisputeService::resolve(const std::string& dispute_id, const std::string& resolution,
                                              const std::string& adjudicator,
                                              std::optional<std::string> notes) {
    return in_transaction<Dispute>(store_, [&](IMarketTxn& txn) -> MarketResult<Dispute> {
        auto found = txn.get_dispute(dispute_id);
        if (!found) {
            return dispute_not_found(dispute_id);
        }
        if (!found->is_open()) {
            return already_resolved(dispute_id);
        }
        auto parsed = parse_resolution(resolution);
        if (!parsed) {
            return invalid_resolution(resolution);
        }

        auto outcome = escrow_.apply_resolve_dispute(txn, found->escrow_id, *parsed);
        if (is_error(outcome)) {
            return error_of(outcome);
        }

        // Re-read under lock; the escrow lock already serializes concurrent resolvers.
        auto d = txn.lock_dispute(dispute_id);
        if (!d) {
            return dispute_not_found(dispute_id);
        }
        if (!d->is_open()) {
            return already_resolved(dispute_id);
        }
        d->status = DisputeStatus::RESOLVED;
        d->resolution = *parsed;
        d->resolution_notes = std::move(notes);
        d->resolved_by = adjudicator;
        d->resolved_at = clock_.now();
        txn.update_dispute(*d);

        const auto& split = std::get<ResolutionOutcome>(outcome).split;
        std::cout << "[dispute] resolved " << dispute_id << " as " << to_string(*parsed)
                  << " (buyer=" << split.buyer << " seller=" << split.seller
                  << " destroyed=" << split.destroyed << ")" << std::endl;
        return *d;
    });
}

bool DisputeService::should_auto_resolve(const Dispute& d) const {
    return d.is_open() && d.auto_resolve_at <= clock_.now();
}

bool DisputeService::should_send_warning(const Dispute& d) const {
    if (!d.is_open() || d.warning_sent_at) {
        return false;
    }
    // Whole days remaining, truncated: 7d23h counts as 7.
    const auto remaining = std::chrono::duration_cast<std::chrono::days>(d.auto_resolve_at - clock_.now());
    return remaining.count() <= opts_.warning_window_days;
}

MarketResult<Dispute> DisputeService::mark_warning_sent(const std::string& dispute_id) {
    return in_transaction<Dispute>(store_, [&](IMarketTxn& txn) -> MarketResult<Dispute> {
        auto d = txn.lock_dispute(dispute_id);
        if (!d) {
            return dispute_not_found(dispute_id);
        }
        if (!d->is_open()) {
            return already_resolved(dispute_id);
        }
        if (!d->warning_sent_at) {
            d->warning_sent_at = clock_.now();
            txn.update_dispute(*d);
        }
        return *d;
    });
}

MarketResult<Dispute> DisputeService::get(const std::string& dispute_id) {
    return in_transaction<Dispute>(store_, [&](IMarketTxn& txn) -> MarketResult<Dispute> {
        auto d = txn.get_dispute(dispute_id);
        if (!d) return dispute_not_found(dispute_id);
        return *d;
    });
}

MarketResult<Dispute> DisputeService::for_order(const std::string& order_id) {
    return in_transaction<Dispute>(store_, [&](IMarketTxn& txn) -> MarketResult<Dispute> {
        auto d = txn.dispute_for_order(order_id);
        if (!d) {
            return market_error(MarketErrorCode::DisputeNotFound, "order '" + order_id + "' has no dispute");
        }
        return *d;
    });
}

MarketResult<std::vector<DisputeEvidence>> DisputeService::evidence(const std::string& dispute_id) {
    using Evidence = std::vector<DisputeEvidence>;
    return in_transaction<Evidence>(store_, [&](IMarketTxn& txn) -> MarketResult<Evidence> {
        if (!txn.get_dispute(dispute_id)) {
            return dispute_not_found(dispute_id);
        }
        return txn.list_evidence(dispute_id);
    });
}

MarketResult<std::vector<Dispute>> DisputeService::list_open() {
    using Disputes = std::vector<Dispute>;
    return in_transaction<Disputes>(store_, [&](IMarketTxn& txn) -> MarketResult<Disputes> {
        return txn.list_open_disputes();
    });
}
