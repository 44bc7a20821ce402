#ifndef OFFLINE_CACHE_DISK_BACKEND_HPP
#define OFFLINE_CACHE_DISK_BACKEND_HPP

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "interface.hpp"

namespace cache::backend {

    // One directory per partition, one "<hash>.body" + "<hash>.meta" pair per entry.
    // Each file is replaced by rename, body first and meta last. The meta records a digest of
    // its body, so a pair left mismatched by a crash between the two renames reads as absent.
    class DiskBackend : public IStorageBackend {
       public:
        // quota_bytes == 0 disables the quota.
        explicit DiskBackend(std::filesystem::path root, size_t quota_bytes = 0);

        ~DiskBackend() override = default;
        DiskBackend(const DiskBackend&) = delete;
        DiskBackend& operator=(const DiskBackend&) = delete;
        DiskBackend(DiskBackend&&) = delete;
        DiskBackend& operator=(DiskBackend&&) = delete;

        [[nodiscard]] std::vector<std::string> list_partitions() const override;
        [[nodiscard]] bool has_partition(const std::string& partition) const override;
        void open_partition(const std::string& partition) override;
        bool delete_partition(const std::string& partition) override;

        [[nodiscard]] std::optional<cache::entry::CacheEntry> get(const std::string& partition, const std::string& key) const override;
        void put(const std::string& partition, const cache::entry::CacheEntry& entry) override;
        [[nodiscard]] std::vector<std::string> keys(const std::string& partition) const override;

        // Bytes of every file under the root; scanned once on construction, then kept current.
        [[nodiscard]] size_t used_bytes() const;

       private:
        std::filesystem::path root_;
        size_t quota_bytes_;
        size_t used_bytes_ = 0;
        mutable std::mutex mutex_;

        [[nodiscard]] std::filesystem::path partition_path(const std::string& partition) const;
        [[nodiscard]] std::filesystem::path create_base_path(const std::string& partition, const std::string& key) const;

        static size_t scan_bytes(const std::filesystem::path& path);
        static std::string body_digest(std::string_view body);
        static bool load_meta(const std::filesystem::path& p, cache::entry::CacheEntry& out, std::string* digest = nullptr);
        static std::string serialize_meta(const cache::entry::CacheEntry& entry);
        static void write_atomic(const std::string& partition, const std::filesystem::path& p, std::string_view bytes);
    };
}  // namespace cache::backend

#endif
