#ifndef OFFLINE_CACHE_MEMORY_BACKEND_HPP
#define OFFLINE_CACHE_MEMORY_BACKEND_HPP

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "interface.hpp"

namespace cache::backend {

    class MemoryBackend : public IStorageBackend {
       public:
        // quota_bytes == 0 disables the quota.
        explicit MemoryBackend(size_t quota_bytes = 0);

        [[nodiscard]] std::vector<std::string> list_partitions() const override;
        [[nodiscard]] bool has_partition(const std::string& partition) const override;
        void open_partition(const std::string& partition) override;
        bool delete_partition(const std::string& partition) override;

        [[nodiscard]] std::optional<cache::entry::CacheEntry> get(const std::string& partition, const std::string& key) const override;
        void put(const std::string& partition, const cache::entry::CacheEntry& entry) override;
        [[nodiscard]] std::vector<std::string> keys(const std::string& partition) const override;

        [[nodiscard]] size_t used_bytes() const;

       private:
        size_t quota_bytes_;
        size_t used_bytes_ = 0;
        mutable std::mutex mutex_;
        std::map<std::string, std::map<std::string, cache::entry::CacheEntry>> partitions_;
    };
}  // namespace cache::backend

#endif
