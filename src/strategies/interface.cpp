#include "interface.hpp"

#include <memory>

#include "cache_first.hpp"
#include "network_first.hpp"
#include "network_only.hpp"
#include "stale_while_revalidate.hpp"

namespace strategies {
    const char* to_string(ResponseSource source) {
        switch (source) {
            case ResponseSource::CACHE:
                return "cache";
            case ResponseSource::NETWORK:
                return "network";
            case ResponseSource::SYNTHESIZED:
                return "synthesized";
        }
        return "synthesized";
    }

    std::unique_ptr<IStrategy> make_strategy(routing::StrategyTag tag, const StrategyContext& context) {
        switch (tag) {
            case routing::StrategyTag::CACHE_FIRST:
                return std::make_unique<CacheFirst>(context);
            case routing::StrategyTag::NETWORK_FIRST:
                return std::make_unique<NetworkFirst>(context);
            case routing::StrategyTag::STALE_WHILE_REVALIDATE:
                return std::make_unique<StaleWhileRevalidate>(context);
            case routing::StrategyTag::NETWORK_ONLY:
                return std::make_unique<NetworkOnly>(context);
        }
        return std::make_unique<NetworkOnly>(context);
    }
}  // namespace strategies
