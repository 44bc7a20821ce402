#ifndef OFFLINE_CACHE_SERVICE_WORKER_HPP
#define OFFLINE_CACHE_SERVICE_WORKER_HPP

#pragma once

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../cache/backend/interface.hpp"
#include "../cache/store/store_manager.hpp"
#include "../config/worker_config.hpp"
#include "../control/control_channel.hpp"
#include "../http/client/interface.hpp"
#include "../routing/classifier.hpp"
#include "../strategies/interface.hpp"
#include "../utils/clock.hpp"
#include "../utils/thread_pool.hpp"
#include "clients.hpp"
#include "interception.hpp"

namespace worker {
    enum class WorkerState { UNINSTALLED, INSTALLING, INSTALLED, ACTIVATING, ACTIVE };

    const char* to_string(WorkerState state);

    struct LifecycleError : public std::runtime_error {
        WorkerState state_;
        explicit LifecycleError(WorkerState state, const std::string& msg) : std::runtime_error(msg), state_(state) {}
    };

    struct InstallOutcome {
        bool installed_ = false;
        std::vector<std::string> failed_;
        WorkerState state_ = WorkerState::UNINSTALLED;
    };

    // Uninstalled -> Installing -> Installed -> Activating -> Active.
    // Requests are only intercepted while Active; control messages are accepted in any state.
    class ServiceWorker {
       public:
        ServiceWorker() = default;
        ~ServiceWorker();
        ServiceWorker(const ServiceWorker&) = delete;
        ServiceWorker& operator=(const ServiceWorker&) = delete;
        ServiceWorker(ServiceWorker&&) = delete;
        ServiceWorker& operator=(ServiceWorker&&) = delete;

        void set_config(std::shared_ptr<const config::WorkerConfig> cfg);
        void set_storage_backend(std::shared_ptr<cache::backend::IStorageBackend> backend);
        void set_clock(std::shared_ptr<const utils::IClock> clock);
        void set_http_client_factory(http::client::HttpClientFactory http_client_factory);

        [[nodiscard]] const std::shared_ptr<const config::WorkerConfig>& get_config() const;
        [[nodiscard]] const std::shared_ptr<cache::backend::IStorageBackend>& get_storage_backend() const;
        [[nodiscard]] const std::shared_ptr<const utils::IClock>& get_clock() const;
        [[nodiscard]] const http::client::HttpClientFactory& get_http_client_factory() const;

        // Wires the store, pools, executors and control channel. Called once by the builder.
        void initialize();

        // Precaches the manifest into the static partition. Under the strict policy any failed
        // url returns the worker to Uninstalled.
        InstallOutcome install();
        // Throws LifecycleError unless Installed.
        void activate();
        // Activates a waiting worker; returns the resulting state name.
        std::string skip_waiting();

        [[nodiscard]] WorkerState state() const;

        [[nodiscard]] bool intercepts(const http::model::Request& req) const;

        // nullopt when the request is not intercepted and should go to the network untouched.
        std::optional<std::future<http::model::Response>> handle_fetch(const http::model::Request& req);

        // Runs the classifier and the matching executor on the calling thread. Never throws.
        strategies::Resolution resolve(const http::model::Request& req);

        // Replies go to the registered client's mailbox.
        bool on_message(const std::string& client_id, const std::string& raw);
        // Replies go to reply_sink.
        bool on_message(const std::string& raw, control::ReplySink reply_sink);

        ClientRegistry& clients();
        cache::store::StoreManager& store();

        // Blocks until in-flight requests, revalidations and control commands have settled.
        void drain();

       private:
        void activate_locked();

        std::shared_ptr<const config::WorkerConfig> config_;
        std::shared_ptr<cache::backend::IStorageBackend> backend_;
        std::shared_ptr<const utils::IClock> clock_;
        http::client::HttpClientFactory http_client_factory_;

        std::unique_ptr<cache::store::StoreManager> store_;
        std::unique_ptr<routing::PatternClassifier> classifier_;
        std::unique_ptr<InterceptionPolicy> interception_;
        ClientRegistry clients_;
        std::map<routing::StrategyTag, std::unique_ptr<strategies::IStrategy>> strategies_;
        std::unique_ptr<control::ControlChannel> control_channel_;

        // Declared last so they are torn down before anything their tasks touch.
        std::unique_ptr<concurrency::ThreadPool> background_pool_;
        std::unique_ptr<concurrency::ThreadPool> request_pool_;

        std::mutex lifecycle_mutex_;
        std::atomic<WorkerState> state_ = WorkerState::UNINSTALLED;
    };

    class ServiceWorkerBuilder {
       public:
        ServiceWorkerBuilder();

        ServiceWorkerBuilder& with_config(std::shared_ptr<const config::WorkerConfig> cfg);
        ServiceWorkerBuilder& with_storage_backend(std::shared_ptr<cache::backend::IStorageBackend> backend);
        ServiceWorkerBuilder& with_clock(std::shared_ptr<const utils::IClock> clock);
        ServiceWorkerBuilder& with_http_client_factory(http::client::HttpClientFactory http_client_factory);
        ServiceWorkerBuilder& validate();
        std::unique_ptr<ServiceWorker> build();

       private:
        std::unique_ptr<ServiceWorker> service_worker_;
    };
}  // namespace worker

#endif
