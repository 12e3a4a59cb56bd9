#pragma once
#include <mutex>
#include <string>
#include <unordered_set>

#include "payment/payment_processor.hpp"

// Offline processor. Tokens look like "cashuA<amount>_<random>_mock"; each one
// can be received once (tracked by its SHA-256). Invoices are always payable.
class MockPaymentProcessor final : public IPaymentProcessor {
public:
    MarketResult<Sats> receive_token(const std::string& token) override;
    MarketResult<Invoice> create_invoice(Sats amount) override;
    MarketResult<PaymentReceipt> pay_invoice(const std::string& invoice, Sats amount) override;

    // Mints a fresh token worth `amount`.
    static std::string mint_token(Sats amount);

    // Next pay_invoice call fails with PaymentFailed.
    void fail_next_payment() {
        std::scoped_lock lk(m_);
        fail_next_ = true;
    }

    // Sum of every successful pay_invoice.
    Sats total_paid() {
        std::scoped_lock lk(m_);
        return total_paid_;
    }

private:
    std::mutex m_;
    std::unordered_set<std::string> spent_;
    bool fail_next_{false};
    Sats total_paid_{0};
};
