#pragma once
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

// Bounded pool of libpqxx connections. Connections are opened lazily;
// acquire() blocks while all `size` connections are leased out.
class PgConnectionPool {
public:
    class Lease {
    public:
        Lease(PgConnectionPool& pool, std::unique_ptr<pqxx::connection> conn)
            : pool_(&pool), conn_(std::move(conn)) {}
        Lease(Lease&& o) noexcept : pool_(o.pool_), conn_(std::move(o.conn_)) { o.pool_ = nullptr; }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease() {
            if (pool_) pool_->give_back(std::move(conn_));
        }

        pqxx::connection& operator*() const { return *conn_; }
        pqxx::connection* operator->() const { return conn_.get(); }

    private:
        PgConnectionPool* pool_;
        std::unique_ptr<pqxx::connection> conn_;
    };

    PgConnectionPool(std::string conn_str, std::size_t size)
        : conn_str_(with_connect_timeout(std::move(conn_str))), size_(size ? size : 1) {}

    Lease acquire() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return !idle_.empty() || opened_ < size_; });
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return Lease(*this, std::move(conn));
        }
        ++opened_;
        lk.unlock();
        try {
            return Lease(*this, std::make_unique<pqxx::connection>(conn_str_));
        } catch (...) {
            lk.lock();
            --opened_;
            cv_.notify_one();
            throw;
        }
    }

    const std::string& connection_string() const { return conn_str_; }

private:
    void give_back(std::unique_ptr<pqxx::connection> conn) {
        std::scoped_lock lk(m_);
        if (conn && conn->is_open()) {
            idle_.push_back(std::move(conn));
        } else {
            --opened_;
        }
        cv_.notify_one();
    }

    static std::string with_connect_timeout(std::string s) {
        if (s.find("connect_timeout") == std::string::npos) {
            s += (s.find('?') != std::string::npos) ? "&connect_timeout=10" : "?connect_timeout=10";
        }
        return s;
    }

    std::string conn_str_;
    std::size_t size_;
    std::mutex m_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    std::size_t opened_{0};
};
