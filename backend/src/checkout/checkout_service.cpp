#include "checkout/checkout_service.hpp"

#include <iostream>
#include <map>

#include "store/txn_runner.hpp"
#include "util/ids.hpp"

namespace {
MarketError checkout_not_found(const std::string& id) {
    return market_error(MarketErrorCode::CheckoutNotFound, "checkout '" + id + "' not found");
}

MarketError price_lock_expired(const std::string& id) {
    return market_error(MarketErrorCode::PriceLockExpired, "price lock for checkout '" + id + "' is no longer valid");
}

MarketError user_not_found(const std::string& id) {
    return market_error(MarketErrorCode::UserNotFound, "user '" + id + "' not found");
}
}

MarketResult<CartItem> CheckoutService::add_to_cart(const std::string& user_id, const std::string& listing_id) {
    return in_transaction<CartItem>(store_, [&](IMarketTxn& txn) -> MarketResult<CartItem> {
        if (!txn.get_user(user_id)) {
            return user_not_found(user_id);
        }
        auto listing = txn.get_listing(listing_id);
        if (!listing) {
            return market_error(MarketErrorCode::ListingNotFound, "listing '" + listing_id + "' not found");
        }
        const Timestamp now = clock_.now();
        if (!listing->is_available(now)) {
            return market_error(MarketErrorCode::ListingNotAvailable,
                                "listing '" + listing_id + "' is not available");
        }
        for (const auto& existing : txn.list_cart(user_id)) {
            if (existing.listing_id == listing_id) {
                return market_error(MarketErrorCode::ItemAlreadyInCart,
                                    "listing '" + listing_id + "' is already in the cart");
            }
        }
        CartItem item;
        item.id = new_id("cart");
        item.user_id = user_id;
        item.listing_id = listing_id;
        item.added_at = now;
        txn.insert_cart_item(item);
        return item;
    });
}

MarketResult<bool> CheckoutService::remove_from_cart(const std::string& user_id, const std::string& item_id) {
    return in_transaction<bool>(store_, [&](IMarketTxn& txn) -> MarketResult<bool> {
        return txn.delete_cart_item(user_id, item_id);
    });
}

MarketResult<std::vector<CartItem>> CheckoutService::cart(const std::string& user_id) {
    using Items = std::vector<CartItem>;
    return in_transaction<Items>(store_, [&](IMarketTxn& txn) -> MarketResult<Items> {
        return txn.list_cart(user_id);
    });
}

MarketResult<CheckoutQuote> CheckoutService::start(const std::string& user_id) {
    return in_transaction<CheckoutQuote>(store_, [&](IMarketTxn& txn) -> MarketResult<CheckoutQuote> {
        if (!txn.lock_user(user_id)) {
            return user_not_found(user_id);
        }
        const Timestamp now = clock_.now();
        if (auto existing = txn.pending_checkout_for_user(user_id, now)) {
            return CheckoutQuote{*existing, txn.list_checkout_items(existing->id)};
        }

        auto cart_items = txn.list_cart(user_id);
        if (cart_items.empty()) {
            return market_error(MarketErrorCode::CartEmpty, "cart is empty");
        }

        CheckoutQuote q;
        q.session.id = new_id("chk");
        q.session.user_id = user_id;
        q.session.status = CheckoutStatus::PENDING;
        q.session.created_at = now;
        q.session.expires_at = now + std::chrono::hours(opts_.price_lock_hours);

        for (const auto& ci : cart_items) {
            auto listing = txn.get_listing(ci.listing_id);
            if (!listing || !listing->is_available(now)) {
                continue;
            }
            CheckoutItem item;
            item.id = new_id("chi");
            item.checkout_id = q.session.id;
            item.listing_id = listing->id;
            item.seller_id = listing->seller_id;
            item.locked_price = listing->price;
            q.session.total_amount += item.locked_price;
            q.items.push_back(std::move(item));
        }
        if (q.items.empty()) {
            return market_error(MarketErrorCode::CartEmpty, "no item in the cart is still available");
        }
        q.session.fee_amount = q.session.total_amount * opts_.fee_percent / 100;

        txn.insert_checkout(q.session);
        for (const auto& item : q.items) {
            txn.insert_checkout_item(item);
        }
        std::cout << "[checkout] locked " << q.items.size() << " item(s) for " << user_id
                  << ", total=" << q.session.total_amount << " fee=" << q.session.fee_amount << std::endl;
        return q;
    });
}

MarketResult<CheckoutSession> CheckoutService::live_session(const std::string& session_id) {
    try {
        auto txn = store_.begin();
        auto s = txn->lock_checkout(session_id);
        if (!s) {
            return checkout_not_found(session_id);
        }
        if (s->status == CheckoutStatus::PENDING && s->expires_at <= clock_.now()) {
            s->status = CheckoutStatus::EXPIRED;
            txn->update_checkout(*s);
            txn->commit();
            std::cout << "[checkout] price lock expired for " << session_id << std::endl;
            return price_lock_expired(session_id);
        }
        if (s->status != CheckoutStatus::PENDING) {
            return price_lock_expired(session_id);
        }
        return *s;
    } catch (const std::exception& e) {
        std::cerr << "[store] transaction rolled back: " << e.what() << std::endl;
        return storage_failure(e);
    }
}

MarketResult<CheckoutReceipt> CheckoutService::complete(const std::string& session_id, const Payment& payment) {
    auto live = live_session(session_id);
    if (is_error(live)) {
        return error_of(live);
    }
    const std::string buyer_id = std::get<CheckoutSession>(live).user_id;

    if (payment.method == PaymentMethod::TOKEN) {
        // The token is banked first so a failed checkout leaves its value in the wallet.
        auto deposited = ledger_.deposit_token(buyer_id, payment.token, session_id,
                                               std::string("Ecash token received at checkout"));
        if (is_error(deposited)) {
            return error_of(deposited);
        }
    }

    return in_transaction<CheckoutReceipt>(store_, [&](IMarketTxn& txn) -> MarketResult<CheckoutReceipt> {
        const Timestamp now = clock_.now();
        auto s = txn.lock_checkout(session_id);
        if (!s) {
            return checkout_not_found(session_id);
        }
        if (s->status != CheckoutStatus::PENDING || s->is_expired(now)) {
            return price_lock_expired(session_id);
        }
        auto buyer = txn.lock_user(s->user_id);
        if (!buyer) {
            return user_not_found(s->user_id);
        }
        const Sats due = s->total_amount + s->fee_amount;
        if (buyer->wallet_balance < due) {
            return insufficient_balance(due, buyer->wallet_balance);
        }

        std::map<std::string, std::vector<CheckoutItem>> by_seller;
        for (auto& item : txn.list_checkout_items(session_id)) {
            by_seller[item.seller_id].push_back(std::move(item));
        }

        CheckoutReceipt receipt;
        for (const auto& [seller_id, items] : by_seller) {
            Sats subtotal = 0;
            for (const auto& item : items) subtotal += item.locked_price;

            auto escrow = escrow_.apply_create(txn, s->user_id, seller_id, subtotal, opts_.escrow_hold_days);
            if (is_error(escrow)) {
                return error_of(escrow);
            }
            const Escrow& e = std::get<Escrow>(escrow);

            Order o;
            o.id = new_id("ord");
            o.checkout_id = session_id;
            o.buyer_id = s->user_id;
            o.seller_id = seller_id;
            o.escrow_id = e.id;
            o.status = OrderStatus::PENDING;
            o.created_at = now;
            txn.insert_order(o);
            for (const auto& item : items) {
                txn.insert_order_item(OrderItem{new_id("ori"), o.id, item.listing_id, item.locked_price});
            }
            receipt.escrows.push_back(e);
            receipt.orders.push_back(std::move(o));
        }

        if (s->fee_amount > 0) {
            auto fee = ledger_.apply_debit(txn, LedgerEntry{s->user_id, s->fee_amount, TransactionKind::FEE,
                                                            session_id, std::string("Marketplace fee")});
            if (is_error(fee)) {
                return error_of(fee);
            }
            if (!opts_.fee_collector_id.empty()) {
                auto collected = ledger_.apply_credit(txn, LedgerEntry{opts_.fee_collector_id, s->fee_amount,
                                                                       TransactionKind::FEE, session_id,
                                                                       std::string("Marketplace fee collected")});
                if (is_error(collected)) {
                    return error_of(collected);
                }
            }
        }

        s->status = CheckoutStatus::PAID;
        s->paid_at = now;
        txn.update_checkout(*s);
        txn.clear_cart(s->user_id);

        std::cout << "[checkout] " << session_id << " paid by " << to_cstr(payment.method)
                  << ", " << receipt.orders.size() << " order(s)" << std::endl;
        receipt.session = *s;
        return receipt;
    });
}

std::chrono::seconds CheckoutService::time_remaining(const CheckoutSession& s) const {
    if (s.status != CheckoutStatus::PENDING) {
        return std::chrono::seconds(0);
    }
    const auto remaining = s.expires_at - clock_.now();
    if (remaining <= Timestamp::duration::zero()) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(remaining);
}

MarketResult<std::vector<Order>> CheckoutService::orders(const std::string& session_id) {
    using Orders = std::vector<Order>;
    return in_transaction<Orders>(store_, [&](IMarketTxn& txn) -> MarketResult<Orders> {
        if (!txn.get_checkout(session_id)) {
            return checkout_not_found(session_id);
        }
        return txn.orders_for_checkout(session_id);
    });
}
