#include "memory_backend.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cache::backend {
    MemoryBackend::MemoryBackend(size_t quota_bytes) : quota_bytes_(quota_bytes) {}

    std::vector<std::string> MemoryBackend::list_partitions() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> names;
        names.reserve(partitions_.size());
        for (const auto& [name, _] : partitions_) {
            names.push_back(name);
        }

        return names;
    }

    bool MemoryBackend::has_partition(const std::string& partition) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return partitions_.find(partition) != partitions_.end();
    }

    void MemoryBackend::open_partition(const std::string& partition) {
        std::lock_guard<std::mutex> lock(mutex_);
        partitions_.try_emplace(partition);
    }

    bool MemoryBackend::delete_partition(const std::string& partition) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = partitions_.find(partition);
        if (it == partitions_.end()) {
            return false;
        }

        for (const auto& [_, entry] : it->second) {
            used_bytes_ -= cache::entry::approximate_size(entry);
        }
        partitions_.erase(it);
        return true;
    }

    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
    std::optional<cache::entry::CacheEntry> MemoryBackend::get(const std::string& partition, const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto partition_it = partitions_.find(partition);
        if (partition_it == partitions_.end()) {
            return std::nullopt;
        }

        auto entry_it = partition_it->second.find(key);
        if (entry_it == partition_it->second.end()) {
            return std::nullopt;
        }

        return entry_it->second;
    }

    void MemoryBackend::put(const std::string& partition, const cache::entry::CacheEntry& entry) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& entries = partitions_[partition];

        size_t replaced_bytes = 0;
        auto existing = entries.find(entry.key_);
        if (existing != entries.end()) {
            replaced_bytes = cache::entry::approximate_size(existing->second);
        }

        const size_t incoming_bytes = cache::entry::approximate_size(entry);
        if (quota_bytes_ > 0 && used_bytes_ - replaced_bytes + incoming_bytes > quota_bytes_) {
            throw QuotaExceededError(partition, "Quota exceeded writing " + entry.key_ + " (" + std::to_string(incoming_bytes) + " bytes)");
        }

        used_bytes_ = used_bytes_ - replaced_bytes + incoming_bytes;
        entries[entry.key_] = entry;
    }

    std::vector<std::string> MemoryBackend::keys(const std::string& partition) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> out;
        auto it = partitions_.find(partition);
        if (it != partitions_.end()) {
            out.reserve(it->second.size());
            for (const auto& [key, _] : it->second) {
                out.push_back(key);
            }
        }

        return out;
    }

    size_t MemoryBackend::used_bytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_bytes_;
    }
}  // namespace cache::backend
