#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// All amounts are integer sats.
using Sats = std::int64_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class UserRole { BUYER, SELLER, ADMIN };

enum class TransactionKind {
    DEPOSIT,
    WITHDRAW,
    PAYMENT,
    RECEIPT,
    FEE,
    BOND,
    ESCROW_HOLD,
    ESCROW_RELEASE,
    ESCROW_REFUND
};

enum class EscrowStatus { HELD, RELEASED, REFUNDED, DISPUTED };

enum class OrderStatus { PENDING, SHIPPED, COMPLETED, DISPUTED, REFUNDED };

enum class DisputeStatus { OPEN, RESOLVED };

enum class EvidenceType { TEXT, IMAGE };

enum class CheckoutStatus { PENDING, PAID, EXPIRED };

// ALL buys the three concrete categories at once.
enum class BondCategory { DIGITAL, PHYSICAL, SERVICES, ALL };

// Persisted spellings. Business logic compares enums, never these strings.
inline const char* to_cstr(UserRole r){
    switch(r){
        case UserRole::BUYER: return "buyer";
        case UserRole::SELLER: return "seller";
        case UserRole::ADMIN: return "admin";
    }
    return "?";
}
inline const char* to_cstr(TransactionKind k){
    switch(k){
        case TransactionKind::DEPOSIT: return "deposit";
        case TransactionKind::WITHDRAW: return "withdraw";
        case TransactionKind::PAYMENT: return "payment";
        case TransactionKind::RECEIPT: return "receipt";
        case TransactionKind::FEE: return "fee";
        case TransactionKind::BOND: return "bond";
        case TransactionKind::ESCROW_HOLD: return "escrow_hold";
        case TransactionKind::ESCROW_RELEASE: return "escrow_release";
        case TransactionKind::ESCROW_REFUND: return "escrow_refund";
    }
    return "?";
}
inline const char* to_cstr(EscrowStatus st){
    switch(st){
        case EscrowStatus::HELD: return "held";
        case EscrowStatus::RELEASED: return "released";
        case EscrowStatus::REFUNDED: return "refunded";
        case EscrowStatus::DISPUTED: return "disputed";
    }
    return "?";
}
inline const char* to_cstr(OrderStatus st){
    switch(st){
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::SHIPPED: return "shipped";
        case OrderStatus::COMPLETED: return "completed";
        case OrderStatus::DISPUTED: return "disputed";
        case OrderStatus::REFUNDED: return "refunded";
    }
    return "?";
}
inline const char* to_cstr(DisputeStatus st){ return st==DisputeStatus::OPEN?"open":"resolved"; }
inline const char* to_cstr(EvidenceType t){ return t==EvidenceType::TEXT?"text":"image"; }
inline const char* to_cstr(CheckoutStatus st){
    switch(st){
        case CheckoutStatus::PENDING: return "pending";
        case CheckoutStatus::PAID: return "paid";
        case CheckoutStatus::EXPIRED: return "expired";
    }
    return "?";
}

inline const char* to_cstr(BondCategory c){
    switch(c){
        case BondCategory::DIGITAL: return "digital";
        case BondCategory::PHYSICAL: return "physical";
        case BondCategory::SERVICES: return "services";
        case BondCategory::ALL: return "all";
    }
    return "?";
}

std::optional<UserRole> parse_user_role(std::string_view s);
std::optional<TransactionKind> parse_transaction_kind(std::string_view s);
std::optional<EscrowStatus> parse_escrow_status(std::string_view s);
std::optional<OrderStatus> parse_order_status(std::string_view s);
std::optional<DisputeStatus> parse_dispute_status(std::string_view s);
std::optional<EvidenceType> parse_evidence_type(std::string_view s);
std::optional<CheckoutStatus> parse_checkout_status(std::string_view s);
std::optional<BondCategory> parse_bond_category(std::string_view s);

inline std::int64_t to_epoch_ms(Timestamp t) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}
inline Timestamp from_epoch_ms(std::int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}
inline std::chrono::hours days(int n) { return std::chrono::hours(24 * n); }

struct User {
    std::string id;          // opaque public identifier (npub)
    UserRole role{UserRole::BUYER};
    Sats wallet_balance{0};  // materialized sum of the user's transaction deltas
    Timestamp created_at{};
};

struct WalletTransaction {
    std::string id;
    std::string user_id;
    TransactionKind kind{TransactionKind::DEPOSIT};
    Sats amount{0};          // signed delta
    Sats balance_after{0};
    std::optional<std::string> reference_id;  // escrow / checkout / order id
    std::optional<std::string> description;
    Timestamp created_at{};
};

struct Escrow {
    std::string id;
    std::string buyer_id;
    std::string seller_id;
    Sats amount{0};
    EscrowStatus status{EscrowStatus::HELD};
    Timestamp auto_release_at{};
    Timestamp created_at{};
    std::optional<Timestamp> resolved_at;
};

struct Order {
    std::string id;
    std::string checkout_id;
    std::string buyer_id;
    std::string seller_id;
    std::string escrow_id;
    OrderStatus status{OrderStatus::PENDING};
    std::optional<std::string> tracking_info;
    std::optional<Timestamp> shipped_at;
    std::optional<Timestamp> completed_at;
    Timestamp created_at{};

    bool can_confirm() const { return status == OrderStatus::PENDING || status == OrderStatus::SHIPPED; }
    bool can_dispute() const { return status == OrderStatus::PENDING || status == OrderStatus::SHIPPED; }
    bool can_ship() const { return status == OrderStatus::PENDING; }
};

struct OrderItem {
    std::string id;
    std::string order_id;
    std::string listing_id;
    Sats price{0};
};

struct Listing {
    std::string id;
    std::string seller_id;
    std::string title;
    Sats price{0};
    bool is_active{true};
    std::optional<std::int64_t> stock;  // unset = unlimited
    Timestamp expires_at{};

    bool is_available(Timestamp now) const {
        return is_active && expires_at > now && (!stock || *stock > 0);
    }
};

struct CartItem {
    std::string id;
    std::string user_id;
    std::string listing_id;
    Timestamp added_at{};
};

struct CheckoutSession {
    std::string id;
    std::string user_id;
    CheckoutStatus status{CheckoutStatus::PENDING};
    Sats total_amount{0};
    Sats fee_amount{0};
    Timestamp created_at{};
    Timestamp expires_at{};
    std::optional<Timestamp> paid_at;

    bool is_expired(Timestamp now) const {
        return expires_at <= now || status == CheckoutStatus::EXPIRED;
    }
};

struct CheckoutItem {
    std::string id;
    std::string checkout_id;
    std::string listing_id;
    std::string seller_id;
    Sats locked_price{0};
};

// Access to sell in one category, bought with a bond debited from the wallet.
struct SellerBond {
    std::string user_id;
    BondCategory category{BondCategory::DIGITAL};  // never ALL
    Sats bond_paid{0};
    Timestamp paid_at{};
};

// Bond price per category, in sats.
struct SellerBondSchedule {
    Sats digital{250'000};
    Sats physical{250'000};
    Sats services{250'000};
    Sats all{600'000};

    Sats amount_for(BondCategory c) const {
        switch (c) {
            case BondCategory::DIGITAL: return digital;
            case BondCategory::PHYSICAL: return physical;
            case BondCategory::SERVICES: return services;
            case BondCategory::ALL: return all;
        }
        return all;
    }
};
