#pragma once
#include <optional>
#include <string>
#include <vector>

#include "escrow/escrow_engine.hpp"
#include "market/dispute.hpp"
#include "market/errors.hpp"
#include "store/market_store.hpp"
#include "util/clock.hpp"

class DisputeService {
public:
    struct Options {
        int window_days{10};         // open -> auto_resolve_at
        int warning_window_days{7};  // warn once this close to auto_resolve_at
    };

    DisputeService(IMarketStore& store, EscrowEngine& escrow, const IClock& clock)
        : DisputeService(store, escrow, clock, Options{}) {}

    DisputeService(IMarketStore& store, EscrowEngine& escrow, const IClock& clock, Options opts)
        : store_(store), escrow_(escrow), clock_(clock), opts_(opts) {}

    // initiator must be the order's buyer or seller.
    MarketResult<Dispute> open(const std::string& order_id, const std::string& initiator,
                               const std::string& reason);

    // submitter must be a party to the order or an admin.
    MarketResult<DisputeEvidence> submit_evidence(const std::string& dispute_id,
                                                  const std::string& submitter, EvidenceType type,
                                                  const std::string& content);

    // The caller is responsible for checking that adjudicator may resolve.
    MarketResult<Dispute> resolve(const std::string& dispute_id, const std::string& resolution,
                                  const std::string& adjudicator,
                                  std::optional<std::string> notes = std::nullopt);

    bool should_auto_resolve(const Dispute& d) const;
    // Open and not yet warned, with at most warning_window_days whole days left.
    bool should_send_warning(const Dispute& d) const;
    MarketResult<Dispute> mark_warning_sent(const std::string& dispute_id);

    MarketResult<Dispute> get(const std::string& dispute_id);
    MarketResult<Dispute> for_order(const std::string& order_id);
    MarketResult<std::vector<DisputeEvidence>> evidence(const std::string& dispute_id);
    MarketResult<std::vector<Dispute>> list_open();

private:
    IMarketStore& store_;
    EscrowEngine& escrow_;
    const IClock& clock_;
    Options opts_;
};
