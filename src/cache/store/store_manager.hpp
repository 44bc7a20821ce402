#ifndef OFFLINE_CACHE_STORE_MANAGER_HPP
#define OFFLINE_CACHE_STORE_MANAGER_HPP

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../http/client/interface.hpp"
#include "../../utils/clock.hpp"
#include "../backend/interface.hpp"
#include "../entry/cache_entry.hpp"
#include "partition.hpp"

namespace cache::store {
    struct PrecacheResult {
        std::vector<std::string> succeeded_;
        std::vector<std::string> failed_;
    };

    struct PartitionStats {
        size_t count_ = 0;
        std::vector<std::string> urls_;
    };

    struct CacheStats {
        std::map<std::string, PartitionStats> caches_;
        size_t total_caches_ = 0;
        size_t total_entries_ = 0;
    };

    struct PrecacheOptions {
        std::string origin_;
        size_t parallelism_ = 4;
    };

    // Sole owner and mutator of the cache partitions. Strategies borrow Partition
    // handles for one resolution and go through get/put.
    class StoreManager {
       public:
        StoreManager(std::shared_ptr<cache::backend::IStorageBackend> backend, std::shared_ptr<const utils::IClock> clock, std::string version,
                     std::string prefix = "");

        ~StoreManager() = default;
        StoreManager(const StoreManager&) = delete;
        StoreManager& operator=(const StoreManager&) = delete;
        StoreManager(StoreManager&&) = delete;
        StoreManager& operator=(StoreManager&&) = delete;

        // Idempotent; creates the current-version partition if absent.
        Partition open_partition(const std::string& logical);

        // Deletes managed partitions whose version differs from current_version; returns how many.
        size_t purge_obsolete(const std::string& current_version);

        [[nodiscard]] std::optional<cache::entry::CacheEntry> get(const Partition& partition, const std::string& key) const;

        // Overwrites any entry under key. stored_at never moves backwards for a key.
        // Returns false when the substrate rejected the write; never throws for quota.
        bool put(const Partition& partition, const std::string& key, cache::entry::CacheEntry entry);

        // Fetches and stores every 2xx response; failures are collected, not raised.
        PrecacheResult precache(const Partition& partition, const std::vector<std::string>& urls, const http::client::HttpClientFactory& client_factory,
                                const PrecacheOptions& options);

        // Deletes every managed partition regardless of version; returns how many.
        size_t clear_managed();

        [[nodiscard]] CacheStats stats() const;

        [[nodiscard]] const std::string& version() const;
        [[nodiscard]] long long now_ms() const;

       private:
        std::shared_ptr<cache::backend::IStorageBackend> backend_;
        std::shared_ptr<const utils::IClock> clock_;
        std::string version_;
        PartitionNaming naming_;
        // Held across the read-clamp-write in put.
        std::mutex write_mutex_;
    };
}  // namespace cache::store

#endif
