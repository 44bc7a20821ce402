#include "expiration_policy.hpp"

namespace cache::expiration {
    bool is_expired(const cache::entry::CacheEntry& entry, long long now_ms, long long ttl_ms) { return now_ms - entry.stored_at_ms_ > ttl_ms; }

    ExpirationPolicy::ExpirationPolicy(long long ttl_ms) : ttl_ms_(ttl_ms) {}

    bool ExpirationPolicy::is_expired(const cache::entry::CacheEntry& entry, long long now_ms) const {
        return cache::expiration::is_expired(entry, now_ms, ttl_ms_);
    }

    long long ExpirationPolicy::ttl_ms() const { return ttl_ms_; }
}  // namespace cache::expiration
