#ifndef OFFLINE_CACHE_NETWORK_FIRST_HPP
#define OFFLINE_CACHE_NETWORK_FIRST_HPP

#include "../cache/expiration/expiration_policy.hpp"
#include "interface.hpp"

namespace strategies {
    // Always asks the network first; falls back to a fresh-enough api partition entry.
    class NetworkFirst : public IStrategy {
       public:
        explicit NetworkFirst(StrategyContext context);

        Resolution resolve(const http::model::Request& req) override;
        [[nodiscard]] routing::StrategyTag tag() const override { return routing::StrategyTag::NETWORK_FIRST; }

       private:
        StrategyContext context_;
        cache::expiration::ExpirationPolicy expiration_;
    };
}  // namespace strategies

#endif
