#ifndef OFFLINE_CACHE_STALE_WHILE_REVALIDATE_HPP
#define OFFLINE_CACHE_STALE_WHILE_REVALIDATE_HPP

#include <optional>

#include "interface.hpp"

namespace strategies {
    // Returns the dynamic partition entry immediately and refreshes it on the background pool.
    // On a miss the request waits for that same background fetch.
    class StaleWhileRevalidate : public IStrategy {
       public:
        explicit StaleWhileRevalidate(StrategyContext context);

        Resolution resolve(const http::model::Request& req) override;
        [[nodiscard]] routing::StrategyTag tag() const override { return routing::StrategyTag::STALE_WHILE_REVALIDATE; }

       private:
        // nullopt when the transport failed.
        static std::optional<http::model::Response> revalidate(const StrategyContext& context, const cache::store::Partition& partition,
                                                               const std::string& key, const http::model::Request& req);

        StrategyContext context_;
    };
}  // namespace strategies

#endif
