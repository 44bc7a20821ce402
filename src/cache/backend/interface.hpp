#ifndef OFFLINE_CACHE_BACKEND_INTERFACE_HPP
#define OFFLINE_CACHE_BACKEND_INTERFACE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../entry/cache_entry.hpp"

namespace cache::backend {
    struct QuotaExceededError : public std::runtime_error {
        std::string partition_;
        explicit QuotaExceededError(std::string partition, const std::string& msg) : std::runtime_error(msg), partition_(std::move(partition)) {}
    };

    // The storage substrate under the store manager. Every call is atomic with respect
    // to the others; there are no multi-call transactions.
    class IStorageBackend {
       public:
        IStorageBackend() = default;
        virtual ~IStorageBackend() = default;
        IStorageBackend(const IStorageBackend&) = delete;
        IStorageBackend& operator=(const IStorageBackend&) = delete;
        IStorageBackend(IStorageBackend&&) = delete;
        IStorageBackend& operator=(IStorageBackend&&) = delete;

        [[nodiscard]] virtual std::vector<std::string> list_partitions() const = 0;
        [[nodiscard]] virtual bool has_partition(const std::string& partition) const = 0;
        virtual void open_partition(const std::string& partition) = 0;
        virtual bool delete_partition(const std::string& partition) = 0;

        [[nodiscard]] virtual std::optional<cache::entry::CacheEntry> get(const std::string& partition, const std::string& key) const = 0;
        // Creates the partition if needed. Throws QuotaExceededError when the write is rejected.
        virtual void put(const std::string& partition, const cache::entry::CacheEntry& entry) = 0;
        [[nodiscard]] virtual std::vector<std::string> keys(const std::string& partition) const = 0;
    };
}  // namespace cache::backend

#endif
