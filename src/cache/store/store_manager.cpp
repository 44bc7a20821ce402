#include "store_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../http/error/http_error.hpp"
#include "../../http/model/url.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/thread_pool.hpp"

namespace cache::store {

    StoreManager::StoreManager(std::shared_ptr<cache::backend::IStorageBackend> backend, std::shared_ptr<const utils::IClock> clock, std::string version,
                               std::string prefix)
        : backend_(std::move(backend)), clock_(std::move(clock)), version_(std::move(version)), naming_(std::move(prefix)) {
        if (backend_ == nullptr) {
            throw std::invalid_argument("Storage backend is required");
        }
        if (clock_ == nullptr) {
            throw std::invalid_argument("Clock is required");
        }
    }

    Partition StoreManager::open_partition(const std::string& logical) {
        Partition partition{.name_ = naming_.format(logical, version_), .logical_ = logical, .version_ = version_};
        backend_->open_partition(partition.name_);
        return partition;
    }

    size_t StoreManager::purge_obsolete(const std::string& current_version) {
        size_t purged = 0;

        for (const auto& name : backend_->list_partitions()) {
            auto parsed = naming_.parse(name);
            if (!parsed || !PartitionNaming::is_managed(parsed->logical_) || parsed->version_ == current_version) {
                continue;
            }

            if (backend_->delete_partition(name)) {
                spdlog::info("Removed obsolete cache partition {}", name);
                ++purged;
            }
        }

        return purged;
    }

    std::optional<cache::entry::CacheEntry> StoreManager::get(const Partition& partition, const std::string& key) const {
        return backend_->get(partition.name_, key);
    }

    bool StoreManager::put(const Partition& partition, const std::string& key, cache::entry::CacheEntry entry) {
        entry.key_ = key;
        if (entry.url_.empty()) {
            entry.url_ = cache::entry::url_from_key(key);
        }
        if (entry.version_.empty()) {
            entry.version_ = partition.version_;
        }

        std::lock_guard<std::mutex> lock(write_mutex_);
        try {
            auto existing = backend_->get(partition.name_, key);
            if (existing && existing->stored_at_ms_ > entry.stored_at_ms_) {
                entry.stored_at_ms_ = existing->stored_at_ms_;
                if (entry.response_.header(constants::STORED_AT_HEADER)) {
                    entry.response_.set_header(constants::STORED_AT_HEADER, std::to_string(entry.stored_at_ms_));
                }
            }

            backend_->put(partition.name_, entry);
        } catch (const cache::backend::QuotaExceededError& e) {
            spdlog::warn("Cache write to {} rejected: {}", partition.name_, e.what());
            return false;
        } catch (const std::runtime_error& e) {
            spdlog::error("Cache write to {} failed: {}", partition.name_, e.what());
            return false;
        }

        return true;
    }

    PrecacheResult StoreManager::precache(const Partition& partition, const std::vector<std::string>& urls,
                                          const http::client::HttpClientFactory& client_factory, const PrecacheOptions& options) {
        // One slot per url keeps the result in manifest order regardless of completion order.
        std::vector<std::optional<bool>> outcomes(urls.size());
        std::mutex outcomes_mutex;

        {
            concurrency::ThreadPool pool(std::max<size_t>(1, std::min(options.parallelism_, urls.size())));

            for (size_t i = 0; i < urls.size(); ++i) {
                pool.enqueue([this, i, &urls, &outcomes, &outcomes_mutex, &partition, &client_factory, &options]() {
                    const std::string request_url = http::model::resolve_url(options.origin_, urls[i]);
                    bool stored = false;

                    try {
                        auto http_client = client_factory();
                        http::model::Request req;
                        req.url_ = request_url;

                        http::model::Response resp = http_client->fetch(req);
                        if (resp.is_ok()) {
                            cache::entry::CacheEntry entry;
                            entry.url_ = request_url;
                            entry.response_ = std::move(resp);
                            entry.stored_at_ms_ = clock_->now_ms();
                            entry.version_ = partition.version_;
                            stored = put(partition, cache::entry::make_cache_key("GET", request_url), std::move(entry));
                        } else {
                            spdlog::debug("Precache of {} returned status {}", request_url, resp.status_);
                        }
                    } catch (const http::error::NetworkError& e) {
                        spdlog::debug("Precache of {} failed: {}", request_url, e.what());
                    } catch (const std::exception& e) {
                        spdlog::warn("Precache of {} failed unexpectedly: {}", request_url, e.what());
                    }

                    std::lock_guard<std::mutex> lock(outcomes_mutex);
                    outcomes[i] = stored;
                });
            }

            pool.wait_all();
        }

        PrecacheResult result;
        for (size_t i = 0; i < urls.size(); ++i) {
            if (outcomes[i].value_or(false)) {
                result.succeeded_.push_back(urls[i]);
            } else {
                result.failed_.push_back(urls[i]);
            }
        }

        spdlog::info("Precached {} of {} urls into {}", result.succeeded_.size(), urls.size(), partition.name_);
        return result;
    }

    size_t StoreManager::clear_managed() {
        size_t cleared = 0;

        for (const auto& name : backend_->list_partitions()) {
            auto parsed = naming_.parse(name);
            if (!parsed || !PartitionNaming::is_managed(parsed->logical_)) {
                continue;
            }

            if (backend_->delete_partition(name)) {
                ++cleared;
            }
        }

        spdlog::info("Cleared {} cache partitions", cleared);
        return cleared;
    }

    CacheStats StoreManager::stats() const {
        CacheStats stats;

        for (const auto& name : backend_->list_partitions()) {
            PartitionStats partition_stats;
            for (const auto& key : backend_->keys(name)) {
                partition_stats.urls_.push_back(cache::entry::url_from_key(key));
            }
            partition_stats.count_ = partition_stats.urls_.size();

            stats.total_entries_ += partition_stats.count_;
            stats.caches_[name] = std::move(partition_stats);
        }

        stats.total_caches_ = stats.caches_.size();
        return stats;
    }

    const std::string& StoreManager::version() const { return version_; }

    long long StoreManager::now_ms() const { return clock_->now_ms(); }
}  // namespace cache::store
