#ifndef OFFLINE_CACHE_TESTS_MANUAL_CLOCK_HPP
#define OFFLINE_CACHE_TESTS_MANUAL_CLOCK_HPP

#include <atomic>

#include "../../src/utils/clock.hpp"

namespace test_support {
    class ManualClock : public utils::IClock {
       public:
        explicit ManualClock(long long start_ms = 1'700'000'000'000LL) : now_ms_(start_ms) {}

        [[nodiscard]] long long now_ms() const override { return now_ms_.load(); }

        void set(long long ms) { now_ms_ = ms; }
        void advance(long long ms) { now_ms_ += ms; }

       private:
        std::atomic<long long> now_ms_;
    };
}  // namespace test_support

#endif
