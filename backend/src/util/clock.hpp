#pragma once
#include <chrono>
#include <mutex>

#include "market/types.hpp"

// Wall clock used for every persisted timestamp and deadline comparison.
class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock final : public IClock {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }
};

// Test clock; only moves when told to.
class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = from_epoch_ms(1'700'000'000'000)) : now_(start) {}

    Timestamp now() const override {
        std::scoped_lock lk(m_);
        return now_;
    }

    void set(Timestamp t) {
        std::scoped_lock lk(m_);
        now_ = t;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        std::scoped_lock lk(m_);
        now_ += std::chrono::duration_cast<Timestamp::duration>(d);
    }

private:
    mutable std::mutex m_;
    Timestamp now_;
};
