#ifndef OFFLINE_CACHE_WORKER_CONFIG_HPP
#define OFFLINE_CACHE_WORKER_CONFIG_HPP

#include <simdjson.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace config {

    struct ConfigError : public std::runtime_error {
        std::string key_;
        explicit ConfigError(std::string key, const std::string& msg) : std::runtime_error(msg), key_(std::move(key)) {}
    };

    template <typename T>
    struct ParserOptions {
        bool is_required_ = false;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    enum class InstallPolicy { STRICT, LENIENT };

    enum class StorageKind { MEMORY, DISK };

    struct StorageConfig {
        StorageKind kind_ = StorageKind::MEMORY;
        std::string root_path_ = "cache/offline";
        size_t quota_bytes_ = 0;
    };

    // Built once at startup and shared read-only afterwards.
    // See: config/worker.example.json for every key.
    struct WorkerConfig {
        std::string version_;
        std::string cache_prefix_;
        std::string origin_;
        std::vector<std::string> precache_manifest_;

        std::vector<std::string> cache_first_patterns_;
        std::vector<std::string> network_first_patterns_;
        std::vector<std::string> stale_while_revalidate_patterns_;

        long long api_ttl_ms_ = 0;
        long network_first_timeout_ms_ = 0;
        InstallPolicy install_policy_ = InstallPolicy::STRICT;
        bool skip_waiting_ = true;

        std::vector<std::string> trusted_origin_markers_;
        std::vector<std::string> bypass_paths_;
        std::vector<std::string> bypass_path_fragments_;

        unsigned int request_threads_ = 4;
        unsigned int background_threads_ = 2;
        size_t precache_parallelism_ = 4;

        StorageConfig storage_;
        std::string log_level_;

        [[nodiscard]] static WorkerConfig defaults();
        [[nodiscard]] static WorkerConfig load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static WorkerConfig parse_json(std::string_view json);

        // Throws ConfigError naming the offending key.
        void validate() const;
    };

    const char* to_string(InstallPolicy policy);
    const char* to_string(StorageKind kind);

}  // namespace config

#endif
