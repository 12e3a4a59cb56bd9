#include "payment/mock_payment.hpp"

#include <charconv>
#include <string_view>

#include "util/ids.hpp"
#include "util/sha256.hpp"

namespace {
constexpr std::string_view kTokenPrefix = "cashuA";

MarketError invalid_token(const std::string& why) {
    return MarketError{MarketErrorCode::InvalidPaymentToken, "invalid payment token: " + why};
}
}

std::string MockPaymentProcessor::mint_token(Sats amount) {
    return std::string(kTokenPrefix) + std::to_string(amount) + "_" + random_hex(16) + "_mock";
}

MarketResult<Sats> MockPaymentProcessor::receive_token(const std::string& token) {
    std::string_view sv(token);
    if (sv.substr(0, kTokenPrefix.size()) != kTokenPrefix) {
        return invalid_token("unrecognised format");
    }
    sv.remove_prefix(kTokenPrefix.size());
    const auto sep = sv.find('_');
    const std::string_view digits = sv.substr(0, sep);

    Sats amount = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), amount);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() || amount <= 0) {
        return invalid_token("bad amount");
    }

    const std::string token_id = sha256_hex(token);
    std::scoped_lock lk(m_);
    if (!spent_.insert(token_id).second) {
        return invalid_token("already spent");
    }
    return amount;
}

MarketResult<Invoice> MockPaymentProcessor::create_invoice(Sats amount) {
    if (amount <= 0) {
        return MarketError{MarketErrorCode::InvalidAmount, "invoice amount must be positive"};
    }
    Invoice inv;
    inv.payment_hash = random_hex(32);
    inv.payment_request = "lnbc" + std::to_string(amount) + "n1mock" + inv.payment_hash.substr(0, 16);
    inv.amount = amount;
    return inv;
}

MarketResult<PaymentReceipt> MockPaymentProcessor::pay_invoice(const std::string& invoice, Sats amount) {
    if (invoice.rfind("lnbc", 0) != 0 && invoice.rfind("lntb", 0) != 0) {
        return MarketError{MarketErrorCode::PaymentFailed, "invalid Lightning invoice format"};
    }
    {
        std::scoped_lock lk(m_);
        if (fail_next_) {
            fail_next_ = false;
            return MarketError{MarketErrorCode::PaymentFailed, "mock processor: payment rejected"};
        }
        total_paid_ += amount;
    }
    return PaymentReceipt{random_hex(32), amount, 0};
}
