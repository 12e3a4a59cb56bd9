#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "store/market_store.hpp"
#include "store/pg_pool.hpp"

// PostgreSQL-backed store using libpqxx. Each transaction is a pqxx::work on a
// pooled connection; lock_* reads use SELECT ... FOR UPDATE.
class PgMarketStore final : public IMarketStore {
public:
    PgMarketStore(const std::string& connection_string, std::size_t pool_size);

    std::unique_ptr<IMarketTxn> begin() override;

    // Runs the DDL in schema_path statement by statement.
    void ensure_schema(const std::string& schema_path);

private:
    PgConnectionPool pool_;
};

std::unique_ptr<PgMarketStore> make_pg_store(const std::string& connection_string,
                                             std::size_t pool_size,
                                             const std::string& schema_path);
