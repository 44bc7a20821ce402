#ifndef OFFLINE_CACHE_EXPIRATION_POLICY_HPP
#define OFFLINE_CACHE_EXPIRATION_POLICY_HPP

#include "../../utils/constants.hpp"
#include "../entry/cache_entry.hpp"

namespace cache::expiration {
    // now - stored_at > ttl. An entry exactly ttl old is still fresh.
    [[nodiscard]] bool is_expired(const cache::entry::CacheEntry& entry, long long now_ms, long long ttl_ms = constants::DEFAULT_API_TTL_MS);

    class ExpirationPolicy {
       public:
        explicit ExpirationPolicy(long long ttl_ms = constants::DEFAULT_API_TTL_MS);

        [[nodiscard]] bool is_expired(const cache::entry::CacheEntry& entry, long long now_ms) const;
        [[nodiscard]] long long ttl_ms() const;

       private:
        long long ttl_ms_;
    };
}  // namespace cache::expiration

#endif
