#pragma once
#include <string>
#include <vector>

#include "escrow/escrow_engine.hpp"
#include "market/errors.hpp"
#include "market/types.hpp"
#include "store/market_store.hpp"
#include "util/clock.hpp"

// Seller and buyer actions on an order after checkout.
class OrderService {
public:
    OrderService(IMarketStore& store, EscrowEngine& escrow, const IClock& clock)
        : store_(store), escrow_(escrow), clock_(clock) {}

    MarketResult<Order> mark_shipped(const std::string& order_id, const std::string& seller_id,
                                     const std::string& tracking_info);

    // Releases the order's escrow to the seller.
    MarketResult<Order> confirm_delivery(const std::string& order_id, const std::string& buyer_id);

    MarketResult<Order> get(const std::string& order_id);
    MarketResult<std::vector<OrderItem>> items(const std::string& order_id);

private:
    IMarketStore& store_;
    EscrowEngine& escrow_;
    const IClock& clock_;
};
