#ifndef OFFLINE_CACHE_CACHE_FIRST_HPP
#define OFFLINE_CACHE_CACHE_FIRST_HPP

#include "interface.hpp"

namespace strategies {
    // Serves the static partition without touching the network; fetches and stores on a miss.
    class CacheFirst : public IStrategy {
       public:
        explicit CacheFirst(StrategyContext context);

        Resolution resolve(const http::model::Request& req) override;
        [[nodiscard]] routing::StrategyTag tag() const override { return routing::StrategyTag::CACHE_FIRST; }

       private:
        StrategyContext context_;
    };
}  // namespace strategies

#endif
