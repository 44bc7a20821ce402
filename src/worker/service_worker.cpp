#include "service_worker.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include "../cache/backend/disk_backend.hpp"
#include "../cache/backend/memory_backend.hpp"
#include "../strategies/fallback.hpp"
#include "../utils/constants.hpp"

namespace worker {
    const char* to_string(WorkerState state) {
        switch (state) {
            case WorkerState::UNINSTALLED:
                return "uninstalled";
            case WorkerState::INSTALLING:
                return "installing";
            case WorkerState::INSTALLED:
                return "installed";
            case WorkerState::ACTIVATING:
                return "activating";
            case WorkerState::ACTIVE:
                return "active";
        }
        return "uninstalled";
    }

    //
    // ServiceWorkerBuilder implementation
    //

    ServiceWorkerBuilder::ServiceWorkerBuilder() : service_worker_(std::make_unique<ServiceWorker>()) {}

    ServiceWorkerBuilder& ServiceWorkerBuilder::with_config(std::shared_ptr<const config::WorkerConfig> cfg) {
        service_worker_->set_config(std::move(cfg));
        return *this;
    }

    ServiceWorkerBuilder& ServiceWorkerBuilder::with_storage_backend(std::shared_ptr<cache::backend::IStorageBackend> backend) {
        service_worker_->set_storage_backend(std::move(backend));
        return *this;
    }

    ServiceWorkerBuilder& ServiceWorkerBuilder::with_clock(std::shared_ptr<const utils::IClock> clock) {
        service_worker_->set_clock(std::move(clock));
        return *this;
    }

    ServiceWorkerBuilder& ServiceWorkerBuilder::with_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        service_worker_->set_http_client_factory(std::move(http_client_factory));
        return *this;
    }

    ServiceWorkerBuilder& ServiceWorkerBuilder::validate() {
        if (service_worker_->get_config() == nullptr) {
            throw std::runtime_error("Worker config is required");
        }
        if (service_worker_->get_http_client_factory() == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        service_worker_->get_config()->validate();
        return *this;
    }

    std::unique_ptr<ServiceWorker> ServiceWorkerBuilder::build() {
        if (service_worker_->get_config() == nullptr) {
            throw std::runtime_error("Worker config is required");
        }
        const auto& cfg = *service_worker_->get_config();

        if (service_worker_->get_clock() == nullptr) {
            service_worker_->set_clock(std::make_shared<utils::SystemClock>());
        }

        if (service_worker_->get_storage_backend() == nullptr) {
            if (cfg.storage_.kind_ == config::StorageKind::DISK) {
                service_worker_->set_storage_backend(std::make_shared<cache::backend::DiskBackend>(cfg.storage_.root_path_, cfg.storage_.quota_bytes_));
            } else {
                service_worker_->set_storage_backend(std::make_shared<cache::backend::MemoryBackend>(cfg.storage_.quota_bytes_));
            }
        }

        service_worker_->initialize();
        return std::move(service_worker_);
    }

    //
    // ServiceWorker implementation
    //

    ServiceWorker::~ServiceWorker() {
        // Request tasks may still be waiting on revalidations, so the request pool goes first.
        request_pool_.reset();
        background_pool_.reset();
    }

    void ServiceWorker::set_config(std::shared_ptr<const config::WorkerConfig> cfg) { config_ = std::move(cfg); }

    void ServiceWorker::set_storage_backend(std::shared_ptr<cache::backend::IStorageBackend> backend) { backend_ = std::move(backend); }

    void ServiceWorker::set_clock(std::shared_ptr<const utils::IClock> clock) { clock_ = std::move(clock); }

    void ServiceWorker::set_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
    }

    const std::shared_ptr<const config::WorkerConfig>& ServiceWorker::get_config() const { return config_; }

    const std::shared_ptr<cache::backend::IStorageBackend>& ServiceWorker::get_storage_backend() const { return backend_; }

    const std::shared_ptr<const utils::IClock>& ServiceWorker::get_clock() const { return clock_; }

    const http::client::HttpClientFactory& ServiceWorker::get_http_client_factory() const { return http_client_factory_; }

    void ServiceWorker::initialize() {
        store_ = std::make_unique<cache::store::StoreManager>(backend_, clock_, config_->version_, config_->cache_prefix_);
        classifier_ = std::make_unique<routing::PatternClassifier>(*config_);
        interception_ = std::make_unique<InterceptionPolicy>(*config_);

        background_pool_ = std::make_unique<concurrency::ThreadPool>(config_->background_threads_);
        request_pool_ = std::make_unique<concurrency::ThreadPool>(config_->request_threads_);

        const strategies::StrategyContext context{
            .store_ = store_.get(),
            .client_factory_ = http_client_factory_,
            .background_pool_ = background_pool_.get(),
            .config_ = config_,
        };
        for (auto tag : {routing::StrategyTag::CACHE_FIRST, routing::StrategyTag::NETWORK_FIRST, routing::StrategyTag::STALE_WHILE_REVALIDATE,
                         routing::StrategyTag::NETWORK_ONLY}) {
            strategies_[tag] = strategies::make_strategy(tag, context);
        }

        control_channel_ = std::make_unique<control::ControlChannel>(
            *store_, http_client_factory_, *request_pool_, [this]() { return skip_waiting(); },
            control::ControlChannelOptions{.origin_ = config_->origin_, .precache_parallelism_ = config_->precache_parallelism_});

        spdlog::debug("Worker {} initialized with {} request and {} background threads", config_->version_, config_->request_threads_,
                      config_->background_threads_);
    }

    InstallOutcome ServiceWorker::install() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);

        if (state_ != WorkerState::UNINSTALLED) {
            throw LifecycleError(state_.load(), std::string("Cannot install a worker that is ") + to_string(state_.load()));
        }

        state_ = WorkerState::INSTALLING;
        spdlog::info("Installing worker {}", config_->version_);

        const auto partition = store_->open_partition(constants::STATIC_PARTITION);
        auto result = store_->precache(partition, config_->precache_manifest_, http_client_factory_,
                                       cache::store::PrecacheOptions{.origin_ = config_->origin_, .parallelism_ = config_->precache_parallelism_});

        if (!result.failed_.empty()) {
            if (config_->install_policy_ == config::InstallPolicy::STRICT) {
                spdlog::warn("Install of {} aborted, {} manifest urls failed", config_->version_, result.failed_.size());
                state_ = WorkerState::UNINSTALLED;
                return InstallOutcome{.installed_ = false, .failed_ = std::move(result.failed_), .state_ = state_.load()};
            }
            spdlog::warn("Installing {} with {} manifest urls missing", config_->version_, result.failed_.size());
        }

        state_ = WorkerState::INSTALLED;

        if (config_->skip_waiting_) {
            activate_locked();
        }

        return InstallOutcome{.installed_ = true, .failed_ = std::move(result.failed_), .state_ = state_.load()};
    }

    void ServiceWorker::activate() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        activate_locked();
    }

    void ServiceWorker::activate_locked() {
        if (state_ != WorkerState::INSTALLED) {
            throw LifecycleError(state_.load(), std::string("Cannot activate a worker that is ") + to_string(state_.load()));
        }

        state_ = WorkerState::ACTIVATING;

        store_->purge_obsolete(config_->version_);
        for (auto logical : constants::MANAGED_PARTITIONS) {
            store_->open_partition(std::string(logical));
        }
        clients_.claim(config_->version_);

        state_ = WorkerState::ACTIVE;
        spdlog::info("Worker {} activated", config_->version_);
    }

    std::string ServiceWorker::skip_waiting() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state_ == WorkerState::INSTALLED) {
            activate_locked();
        }
        return to_string(state_.load());
    }

    WorkerState ServiceWorker::state() const { return state_; }

    bool ServiceWorker::intercepts(const http::model::Request& req) const {
        return state_ == WorkerState::ACTIVE && interception_->should_intercept(req.url_);
    }

    std::optional<std::future<http::model::Response>> ServiceWorker::handle_fetch(const http::model::Request& req) {
        if (!intercepts(req)) {
            return std::nullopt;
        }

        return request_pool_->submit([this, req]() { return resolve(req).response_; });
    }

    strategies::Resolution ServiceWorker::resolve(const http::model::Request& req) {
        const auto tag = req.method_ == "GET" ? classifier_->classify(req.url_) : routing::StrategyTag::NETWORK_ONLY;
        spdlog::debug("{} {} -> {}", req.method_, req.url_, routing::to_string(tag));

        try {
            return strategies_.at(tag)->resolve(req);
        } catch (const std::exception& e) {
            spdlog::error("Strategy {} failed for {}: {}", routing::to_string(tag), req.url_, e.what());
            return strategies::Resolution{
                .response_ = strategies::fallback::offline_text_response(), .source_ = strategies::ResponseSource::SYNTHESIZED, .failures_ = {}};
        }
    }

    bool ServiceWorker::on_message(const std::string& client_id, const std::string& raw) {
        return control_channel_->on_message(raw, clients_.sink_for(client_id));
    }

    bool ServiceWorker::on_message(const std::string& raw, control::ReplySink reply_sink) {
        return control_channel_->on_message(raw, std::move(reply_sink));
    }

    ClientRegistry& ServiceWorker::clients() { return clients_; }

    cache::store::StoreManager& ServiceWorker::store() { return *store_; }

    void ServiceWorker::drain() {
        request_pool_->wait_all();
        background_pool_->wait_all();
    }
}  // namespace worker
