#include "market/dispute.hpp"

#include <charconv>

namespace
{
    // Plain decimal digits only: no sign, no whitespace, no trailing garbage.
    std::optional<int> parse_percent(std::string_view s)
    {
        if (s.empty() || s.size() > 3) return std::nullopt;
        for (char c : s) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        int v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
        if (v > 100) return std::nullopt;
        return v;
    }
}

std::optional<DisputeResolution> parse_resolution(std::string_view s)
{
    if (s == "buyer_full") return DisputeResolution::buyer_full();
    if (s == "seller_full") return DisputeResolution::seller_full();
    if (s == "burn") return DisputeResolution::burn();

    constexpr std::string_view kSplit = "split_";
    if (s.substr(0, kSplit.size()) != kSplit) return std::nullopt;

    std::string_view rest = s.substr(kSplit.size());
    auto sep = rest.find('_');
    if (sep == std::string_view::npos) return std::nullopt;

    auto buyer = parse_percent(rest.substr(0, sep));
    auto seller = parse_percent(rest.substr(sep + 1));
    if (!buyer || !seller) return std::nullopt;
    if (*buyer + *seller != 100) return std::nullopt;

    return DisputeResolution::split(*buyer, *seller);
}

std::string to_string(const DisputeResolution& r)
{
    switch (r.kind) {
        case DisputeResolution::Kind::BUYER_FULL: return "buyer_full";
        case DisputeResolution::Kind::SELLER_FULL: return "seller_full";
        case DisputeResolution::Kind::BURN: return "burn";
        case DisputeResolution::Kind::SPLIT:
            return "split_" + std::to_string(r.buyer_percent) + "_" + std::to_string(r.seller_percent);
    }
    return "?";
}

SplitAmounts compute_split(const DisputeResolution& r, Sats total)
{
    SplitAmounts out;
    switch (r.kind) {
        case DisputeResolution::Kind::BUYER_FULL:
            out.buyer = total;
            break;
        case DisputeResolution::Kind::SELLER_FULL:
            out.seller = total;
            break;
        case DisputeResolution::Kind::BURN:
            break;
        case DisputeResolution::Kind::SPLIT:
            out.buyer = (total * r.buyer_percent) / 100;
            out.seller = (total * r.seller_percent) / 100;
            break;
    }
    out.destroyed = total - out.buyer - out.seller;
    return out;
}

EscrowStatus settled_escrow_status(const DisputeResolution& r)
{
    return r.kind == DisputeResolution::Kind::BUYER_FULL ? EscrowStatus::REFUNDED
                                                         : EscrowStatus::RELEASED;
}

OrderStatus settled_order_status(const DisputeResolution& r)
{
    return r.kind == DisputeResolution::Kind::BUYER_FULL ? OrderStatus::REFUNDED
                                                         : OrderStatus::COMPLETED;
}
