#include "orders/order_service.hpp"

#include <iostream>

#include "store/txn_runner.hpp"

namespace {
MarketError order_not_found(const std::string& id) {
    return market_error(MarketErrorCode::OrderNotFound, "order '" + id + "' not found");
}

MarketError not_authorized(const std::string& who, const std::string& order_id) {
    return market_error(MarketErrorCode::NotAuthorized,
                        "'" + who + "' may not act on order '" + order_id + "'");
}
}

MarketResult<Order> OrderService::mark_shipped(const std::string& order_id, const std::string& seller_id,
                                               const std::string& tracking_info) {
    return in_transaction<Order>(store_, [&](IMarketTxn& txn) -> MarketResult<Order> {
        auto o = txn.lock_order(order_id);
        if (!o) {
            return order_not_found(order_id);
        }
        if (o->seller_id != seller_id) {
            return not_authorized(seller_id, order_id);
        }
        if (!o->can_ship()) {
            return market_error(MarketErrorCode::NotAuthorized,
                                "order '" + order_id + "' is " + to_cstr(o->status) + " and cannot be shipped");
        }
        o->status = OrderStatus::SHIPPED;
        o->shipped_at = clock_.now();
        if (!tracking_info.empty()) {
            o->tracking_info = tracking_info;
        }
        txn.update_order(*o);
        return *o;
    });
}

MarketResult<Order> OrderService::confirm_delivery(const std::string& order_id, const std::string& buyer_id) {
    return in_transaction<Order>(store_, [&](IMarketTxn& txn) -> MarketResult<Order> {
        auto o = txn.get_order(order_id);
        if (!o) {
            return order_not_found(order_id);
        }
        if (o->buyer_id != buyer_id) {
            return not_authorized(buyer_id, order_id);
        }
        if (!o->can_confirm()) {
            return market_error(MarketErrorCode::OrderAlreadyCompleted,
                                "order '" + order_id + "' is already " + to_cstr(o->status));
        }
        auto released = escrow_.apply_release(txn, o->escrow_id);
        if (is_error(released)) {
            return error_of(released);
        }
        auto settled = txn.get_order(order_id);
        if (!settled) {
            return order_not_found(order_id);
        }
        std::cout << "[orders] " << order_id << " confirmed by buyer" << std::endl;
        return *settled;
    });
}

MarketResult<Order> OrderService::get(const std::string& order_id) {
    return in_transaction<Order>(store_, [&](IMarketTxn& txn) -> MarketResult<Order> {
        auto o = txn.get_order(order_id);
        if (!o) return order_not_found(order_id);
        return *o;
    });
}

MarketResult<std::vector<OrderItem>> OrderService::items(const std::string& order_id) {
    using Items = std::vector<OrderItem>;
    return in_transaction<Items>(store_, [&](IMarketTxn& txn) -> MarketResult<Items> {
        if (!txn.get_order(order_id)) {
            return order_not_found(order_id);
        }
        return txn.list_order_items(order_id);
    });
}
