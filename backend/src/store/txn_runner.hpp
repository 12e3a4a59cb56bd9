#pragma once
#include <exception>
#include <iostream>
#include <utility>

#include "market/errors.hpp"
#include "store/market_store.hpp"

// Runs fn(txn) in a fresh transaction. Commits when fn returns a value; an
// error result or an exception leaves the transaction to roll back.
// Exceptions surface as StorageFailure.
template <typename T, typename Fn>
MarketResult<T> in_transaction(IMarketStore& store, Fn&& fn) {
    try {
        auto txn = store.begin();
        MarketResult<T> r = std::forward<Fn>(fn)(*txn);
        if (!is_error(r)) {
            txn->commit();
        }
        return r;
    } catch (const std::exception& e) {
        std::cerr << "[store] transaction rolled back: " << e.what() << std::endl;
        return storage_failure(e);
    }
}
