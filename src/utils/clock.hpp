#ifndef OFFLINE_CACHE_CLOCK_HPP
#define OFFLINE_CACHE_CLOCK_HPP

#include <chrono>

namespace utils {
    class IClock {
       public:
        IClock() = default;
        virtual ~IClock() = default;
        IClock(const IClock&) = delete;
        IClock& operator=(const IClock&) = delete;
        IClock(IClock&&) = delete;
        IClock& operator=(IClock&&) = delete;

        // Unix epoch milliseconds.
        [[nodiscard]] virtual long long now_ms() const = 0;
    };

    class SystemClock : public IClock {
       public:
        [[nodiscard]] long long now_ms() const override {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
        }
    };
}  // namespace utils

#endif
