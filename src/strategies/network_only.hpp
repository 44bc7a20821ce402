#ifndef OFFLINE_CACHE_NETWORK_ONLY_HPP
#define OFFLINE_CACHE_NETWORK_ONLY_HPP

#include "interface.hpp"

namespace strategies {
    class NetworkOnly : public IStrategy {
       public:
        explicit NetworkOnly(StrategyContext context);

        Resolution resolve(const http::model::Request& req) override;
        [[nodiscard]] routing::StrategyTag tag() const override { return routing::StrategyTag::NETWORK_ONLY; }

       private:
        StrategyContext context_;
    };
}  // namespace strategies

#endif
