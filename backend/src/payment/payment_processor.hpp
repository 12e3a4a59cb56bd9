#pragma once
#include <string>
#include <variant>

#include "market/errors.hpp"

struct Invoice {
    std::string payment_request;  // what the payer pays, e.g. a bolt11 string
    std::string payment_hash;     // quote id used to look the invoice up later
    Sats amount{0};
};

struct PaymentReceipt {
    std::string preimage;
    Sats amount_paid{0};
    Sats fee_paid{0};
};

// External ecash / Lightning collaborator. Implementations must be thread-safe.
class IPaymentProcessor {
public:
    virtual ~IPaymentProcessor() = default;

    // Claims a bearer token; returns the credited amount or InvalidPaymentToken.
    virtual MarketResult<Sats> receive_token(const std::string& token) = 0;

    virtual MarketResult<Invoice> create_invoice(Sats amount) = 0;

    // Pays an external invoice out of the operator's funds; PaymentFailed on error.
    virtual MarketResult<PaymentReceipt> pay_invoice(const std::string& invoice, Sats amount) = 0;
};
