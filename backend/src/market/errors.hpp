#pragma once

#include <exception>
#include <string>
#include <variant>

#include "market/types.hpp"

enum class MarketErrorCode {
    // Not found
    UserNotFound,
    EscrowNotFound,
    OrderNotFound,
    DisputeNotFound,
    ListingNotFound,
    CheckoutNotFound,
    // State conflicts
    UserAlreadyExists,
    EscrowAlreadyReleased,
    EscrowAlreadyRefunded,
    DisputeAlreadyResolved,
    OrderAlreadyCompleted,
    OrderCannotBeDisputed,
    ListingNotAvailable,
    ItemAlreadyInCart,
    CartEmpty,
    PriceLockExpired,
    BondAlreadyPaid,
    // Funds
    InsufficientBalance,
    // Validation
    InvalidAmount,
    InvalidResolution,
    InvalidPaymentToken,
    InvalidCategory,
    // Payment processor
    PaymentFailed,
    // Caller is not a party to the record
    NotAuthorized,
    // Store threw; the transaction was rolled back
    StorageFailure,
};

enum class ErrorCategory { NotFound, Conflict, Funds, Validation, Payment, Authorization, Internal };

struct MarketError {
    MarketErrorCode code;
    std::string message;
    // InsufficientBalance only
    Sats needed{0};
    Sats available{0};
};

template <typename T>
using MarketResult = std::variant<T, MarketError>;

template <typename T>
inline bool is_error(const MarketResult<T>& r) { return std::holds_alternative<MarketError>(r); }

template <typename T>
inline const MarketError& error_of(const MarketResult<T>& r) { return std::get<MarketError>(r); }

inline const char* to_cstr(MarketErrorCode c) {
    switch (c) {
        case MarketErrorCode::UserNotFound: return "UserNotFound";
        case MarketErrorCode::EscrowNotFound: return "EscrowNotFound";
        case MarketErrorCode::OrderNotFound: return "OrderNotFound";
        case MarketErrorCode::DisputeNotFound: return "DisputeNotFound";
        case MarketErrorCode::ListingNotFound: return "ListingNotFound";
        case MarketErrorCode::CheckoutNotFound: return "CheckoutNotFound";
        case MarketErrorCode::UserAlreadyExists: return "UserAlreadyExists";
        case MarketErrorCode::EscrowAlreadyReleased: return "EscrowAlreadyReleased";
        case MarketErrorCode::EscrowAlreadyRefunded: return "EscrowAlreadyRefunded";
        case MarketErrorCode::DisputeAlreadyResolved: return "DisputeAlreadyResolved";
        case MarketErrorCode::OrderAlreadyCompleted: return "OrderAlreadyCompleted";
        case MarketErrorCode::OrderCannotBeDisputed: return "OrderCannotBeDisputed";
        case MarketErrorCode::ListingNotAvailable: return "ListingNotAvailable";
        case MarketErrorCode::ItemAlreadyInCart: return "ItemAlreadyInCart";
        case MarketErrorCode::CartEmpty: return "CartEmpty";
        case MarketErrorCode::PriceLockExpired: return "PriceLockExpired";
        case MarketErrorCode::BondAlreadyPaid: return "BondAlreadyPaid";
        case MarketErrorCode::InsufficientBalance: return "InsufficientBalance";
        case MarketErrorCode::InvalidAmount: return "InvalidAmount";
        case MarketErrorCode::InvalidResolution: return "InvalidResolution";
        case MarketErrorCode::InvalidPaymentToken: return "InvalidPaymentToken";
        case MarketErrorCode::InvalidCategory: return "InvalidCategory";
        case MarketErrorCode::PaymentFailed: return "PaymentFailed";
        case MarketErrorCode::NotAuthorized: return "NotAuthorized";
        case MarketErrorCode::StorageFailure: return "StorageFailure";
    }
    return "?";
}

inline ErrorCategory error_category(MarketErrorCode c) {
    switch (c) {
        case MarketErrorCode::UserNotFound:
        case MarketErrorCode::EscrowNotFound:
        case MarketErrorCode::OrderNotFound:
        case MarketErrorCode::DisputeNotFound:
        case MarketErrorCode::ListingNotFound:
        case MarketErrorCode::CheckoutNotFound:
            return ErrorCategory::NotFound;
        case MarketErrorCode::UserAlreadyExists:
        case MarketErrorCode::EscrowAlreadyReleased:
        case MarketErrorCode::EscrowAlreadyRefunded:
        case MarketErrorCode::DisputeAlreadyResolved:
        case MarketErrorCode::OrderAlreadyCompleted:
        case MarketErrorCode::OrderCannotBeDisputed:
        case MarketErrorCode::ListingNotAvailable:
        case MarketErrorCode::ItemAlreadyInCart:
        case MarketErrorCode::CartEmpty:
        case MarketErrorCode::PriceLockExpired:
        case MarketErrorCode::BondAlreadyPaid:
            return ErrorCategory::Conflict;
        case MarketErrorCode::InsufficientBalance:
            return ErrorCategory::Funds;
        case MarketErrorCode::InvalidAmount:
        case MarketErrorCode::InvalidResolution:
        case MarketErrorCode::InvalidPaymentToken:
        case MarketErrorCode::InvalidCategory:
            return ErrorCategory::Validation;
        case MarketErrorCode::PaymentFailed:
            return ErrorCategory::Payment;
        case MarketErrorCode::NotAuthorized:
            return ErrorCategory::Authorization;
        case MarketErrorCode::StorageFailure:
            return ErrorCategory::Internal;
    }
    return ErrorCategory::Internal;
}

inline MarketError market_error(MarketErrorCode code, std::string message) {
    return MarketError{code, std::move(message)};
}

inline MarketError insufficient_balance(Sats needed, Sats available) {
    MarketError e{
        MarketErrorCode::InsufficientBalance,
        "insufficient balance: need " + std::to_string(needed) +
            " sats, have " + std::to_string(available) + " sats"
    };
    e.needed = needed;
    e.available = available;
    return e;
}

inline MarketError invalid_resolution(const std::string& raw) {
    return MarketError{MarketErrorCode::InvalidResolution, "invalid resolution '" + raw + "'"};
}

inline MarketError storage_failure(const std::exception& e) {
    return MarketError{MarketErrorCode::StorageFailure, e.what()};
}

// Caller-facing one-liner, e.g. "InsufficientBalance: insufficient balance: need 10 sats, have 3 sats".
inline std::string describe(const MarketError& e) {
    return std::string(to_cstr(e.code)) + ": " + e.message;
}
