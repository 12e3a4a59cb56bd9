#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "market/types.hpp"

// How an adjudicator splits a disputed escrow.
struct DisputeResolution {
    enum class Kind { BUYER_FULL, SELLER_FULL, SPLIT, BURN };

    Kind kind{Kind::BUYER_FULL};
    int buyer_percent{0};   // SPLIT only
    int seller_percent{0};  // SPLIT only

    static DisputeResolution buyer_full() { return {Kind::BUYER_FULL, 100, 0}; }
    static DisputeResolution seller_full() { return {Kind::SELLER_FULL, 0, 100}; }
    static DisputeResolution burn() { return {Kind::BURN, 0, 0}; }
    static DisputeResolution split(int buyer, int seller) { return {Kind::SPLIT, buyer, seller}; }

    bool operator==(const DisputeResolution& o) const {
        if (kind != o.kind) return false;
        return kind != Kind::SPLIT ||
               (buyer_percent == o.buyer_percent && seller_percent == o.seller_percent);
    }
    bool operator!=(const DisputeResolution& o) const { return !(*this == o); }
};

// buyer + seller + destroyed always equals the escrowed total.
struct SplitAmounts {
    Sats buyer{0};
    Sats seller{0};
    Sats destroyed{0};
};

// Accepts "buyer_full" | "seller_full" | "burn" | "split_<b>_<s>" with b + s == 100.
std::optional<DisputeResolution> parse_resolution(std::string_view s);
std::string to_string(const DisputeResolution& r);

// Split amounts are floored; the rounding remainder is destroyed.
SplitAmounts compute_split(const DisputeResolution& r, Sats total);

// BUYER_FULL refunds; every other outcome (including SPLIT and BURN) counts as released.
EscrowStatus settled_escrow_status(const DisputeResolution& r);
OrderStatus settled_order_status(const DisputeResolution& r);

struct Dispute {
    std::string id;
    std::string order_id;
    std::string escrow_id;
    std::string initiated_by;
    std::string reason;
    DisputeStatus status{DisputeStatus::OPEN};
    std::optional<DisputeResolution> resolution;
    std::optional<std::string> resolution_notes;
    std::optional<std::string> resolved_by;
    std::optional<Timestamp> warning_sent_at;
    Timestamp auto_resolve_at{};
    Timestamp created_at{};
    std::optional<Timestamp> resolved_at;

    bool is_open() const { return status == DisputeStatus::OPEN; }
};

struct DisputeEvidence {
    std::string id;
    std::string dispute_id;
    std::string submitted_by;
    EvidenceType type{EvidenceType::TEXT};
    std::string content;  // text, or base64 image data
    Timestamp created_at{};
};
