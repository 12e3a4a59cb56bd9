#include "market/types.hpp"

std::optional<UserRole> parse_user_role(std::string_view s) {
    if (s == "buyer") return UserRole::BUYER;
    if (s == "seller") return UserRole::SELLER;
    if (s == "admin") return UserRole::ADMIN;
    return std::nullopt;
}

std::optional<TransactionKind> parse_transaction_kind(std::string_view s) {
    if (s == "deposit") return TransactionKind::DEPOSIT;
    if (s == "withdraw") return TransactionKind::WITHDRAW;
    if (s == "payment") return TransactionKind::PAYMENT;
    if (s == "receipt") return TransactionKind::RECEIPT;
    if (s == "fee") return TransactionKind::FEE;
    if (s == "bond") return TransactionKind::BOND;
    if (s == "escrow_hold") return TransactionKind::ESCROW_HOLD;
    if (s == "escrow_release") return TransactionKind::ESCROW_RELEASE;
    if (s == "escrow_refund") return TransactionKind::ESCROW_REFUND;
    return std::nullopt;
}

std::optional<EscrowStatus> parse_escrow_status(std::string_view s) {
    if (s == "held") return EscrowStatus::HELD;
    if (s == "released") return EscrowStatus::RELEASED;
    if (s == "refunded") return EscrowStatus::REFUNDED;
    if (s == "disputed") return EscrowStatus::DISPUTED;
    return std::nullopt;
}

std::optional<OrderStatus> parse_order_status(std::string_view s) {
    if (s == "pending") return OrderStatus::PENDING;
    if (s == "shipped") return OrderStatus::SHIPPED;
    if (s == "completed") return OrderStatus::COMPLETED;
    if (s == "disputed") return OrderStatus::DISPUTED;
    if (s == "refunded") return OrderStatus::REFUNDED;
    return std::nullopt;
}

std::optional<DisputeStatus> parse_dispute_status(std::string_view s) {
    if (s == "open") return DisputeStatus::OPEN;
    if (s == "resolved") return DisputeStatus::RESOLVED;
    return std::nullopt;
}

std::optional<EvidenceType> parse_evidence_type(std::string_view s) {
    if (s == "text") return EvidenceType::TEXT;
    if (s == "image") return EvidenceType::IMAGE;
    return std::nullopt;
}

std::optional<CheckoutStatus> parse_checkout_status(std::string_view s) {
    if (s == "pending") return CheckoutStatus::PENDING;
    if (s == "paid") return CheckoutStatus::PAID;
    if (s == "expired") return CheckoutStatus::EXPIRED;
    return std::nullopt;
}

std::optional<BondCategory> parse_bond_category(std::string_view s) {
    if (s == "digital") return BondCategory::DIGITAL;
    if (s == "physical") return BondCategory::PHYSICAL;
    if (s == "services") return BondCategory::SERVICES;
    if (s == "all") return BondCategory::ALL;
    return std::nullopt;
}
