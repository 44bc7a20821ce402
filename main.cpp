#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "src/config/worker_config.hpp"
#include "src/control/control_client.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/utils/logging.hpp"
#include "src/utils/string_utils.hpp"
#include "src/worker/service_worker.hpp"

namespace {
    constexpr const char* HOST_CLIENT_ID = "host";

    std::mutex output_mutex;

    void print_line(const std::string& line) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << line << std::endl;
    }

    void run_fetch(worker::ServiceWorker& service_worker, const http::client::HttpClientFactory& client_factory, const std::string& method,
                   const std::string& url) {
        http::model::Request req{.url_ = url, .method_ = string_utils::to_upper(method), .body_ = "", .headers_ = {}, .timeout_ms_ = 0};

        http::model::Response resp;
        std::string route = "worker";
        if (auto pending = service_worker.handle_fetch(req)) {
            resp = pending->get();
        } else {
            route = "passthrough";
            resp = client_factory()->fetch(req);
        }

        print_line(std::to_string(resp.status_) + " " + resp.status_text_ + " (" + std::to_string(resp.body_.size()) + " bytes, " + route + ")");
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Configure
        //

        auto cfg = std::make_shared<const config::WorkerConfig>(argc > 1 ? config::WorkerConfig::load_from_file(argv[1])
                                                                         : config::WorkerConfig::defaults());
        logging::init(cfg->log_level_);

        http::client::CurlGlobal curl_global;
        spdlog::info("Using {}", http::client::CurlGlobal::version());

        http::client::HttpClientFactory client_factory = []() -> std::unique_ptr<http::client::IHttpClient> {
            auto client = std::make_unique<http::client::CurlEasy>();
            client->enable_keepalive();
            client->enable_compression();
            return client;
        };

        auto service_worker = worker::ServiceWorkerBuilder().with_config(cfg).with_http_client_factory(client_factory).validate().build();
        service_worker->clients().register_client(HOST_CLIENT_ID, cfg->origin_, [](const std::string& reply) { print_line(reply); });

        //
        // Install and activate
        //

        auto outcome = service_worker->install();
        if (!outcome.installed_) {
            spdlog::warn("Install failed for {} manifest urls", outcome.failed_.size());
        } else if (service_worker->state() == worker::WorkerState::INSTALLED) {
            service_worker->activate();
        }
        print_line(std::string("state ") + worker::to_string(service_worker->state()));

        control::ControlClient control_client([&service_worker](const std::string& message, control::ReplySink reply_sink) {
            if (!service_worker->on_message(message, std::move(reply_sink))) {
                spdlog::warn("Worker dropped control message {}", message);
            }
        });

        //
        // Serve
        //

        std::string line;
        while (std::getline(std::cin, line)) {
            std::istringstream words(string_utils::trim(line));
            std::string command;
            words >> command;

            try {
                if (command == "quit") {
                    break;
                } else if (command == "fetch") {
                    std::string method;
                    std::string url;
                    words >> method >> url;
                    run_fetch(*service_worker, client_factory, method, url);
                } else if (command == "message") {
                    std::string raw;
                    std::getline(words >> std::ws, raw);
                    if (!service_worker->on_message(HOST_CLIENT_ID, raw)) {
                        print_line("dropped");
                    }
                    service_worker->drain();
                } else if (command == "stats") {
                    auto stats = control_client.get_cache_stats();
                    print_line(std::to_string(stats.total_caches_) + " caches, " + std::to_string(stats.total_entries_) + " entries");
                } else if (command == "clear") {
                    print_line(std::to_string(control_client.clear_cache()) + " caches cleared");
                } else if (command == "precache") {
                    std::string urls;
                    std::getline(words >> std::ws, urls);
                    auto succeeded = control_client.precache_urls(string_utils::split_comma_delimited_string(urls));
                    print_line(std::to_string(succeeded.size()) + " urls precached");
                } else if (command == "skip-waiting") {
                    print_line(std::string("state ") + control_client.skip_waiting());
                } else if (!command.empty()) {
                    print_line("unknown command " + command);
                }
            } catch (const http::error::NetworkError& e) {
                print_line("network error: " + std::string(e.what()) + " (URL: " + e.url_ + ")");
            } catch (const control::ControlTimeoutError& e) {
                print_line("control error: " + std::string(e.what()));
            }
        }

        service_worker->drain();
    } catch (const config::ConfigError& e) {
        std::cerr << "Config Error: " << e.what() << " (key: " << e.key_ << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
