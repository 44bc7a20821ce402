#include "worker_config.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include "../utils/constants.hpp"
#include "../utils/logging.hpp"

namespace config {
    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options, const std::string& key) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }

            if (result.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError(key, options.error_message_);
            }

            auto value = result.value();

            if (options.allowed_values_.empty()) {
                return T(value);
            }

            if (!std::ranges::any_of(options.allowed_values_, [value](const T& allowed_value) { return allowed_value == value; })) {
                throw ConfigError(key, options.error_message_);
            }

            return T(value);
        }

        // Counts are stored unsigned.
        static int64_t non_negative(int64_t value, const std::string& key) {
            if (value < 0) {
                throw ConfigError(key, "Value must not be negative");
            }
            return value;
        }

        static std::vector<std::string> parse_string_array(simdjson::simdjson_result<simdjson::ondemand::array> result,
                                                           const ParserOptions<std::vector<std::string>>& options, const std::string& key) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }

            if (result.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError(key, options.error_message_);
            }

            std::vector<std::string> out;
            for (auto raw_item : result.value()) {
                auto item = raw_item.get_string();
                if (item.error() != simdjson::error_code::SUCCESS) {
                    throw ConfigError(key, options.error_message_);
                }
                out.emplace_back(item.value());
            }
            return out;
        }
    }  // namespace parser

    WorkerConfig WorkerConfig::defaults() {
        return WorkerConfig{
            .version_ = "1.0.1",
            .cache_prefix_ = "",
            .origin_ = "http://localhost",
            .precache_manifest_ = {"/", "/index.html", "/manifest.json"},
            .cache_first_patterns_ =
                {
                    R"(\.(?:js|css|png|jpg|jpeg|svg|gif|ico|woff|woff2|ttf)$)",
                    R"(/assets/)",
                    R"(chunk-[a-zA-Z0-9]+\.js$)",
                    R"(index-[a-zA-Z0-9]+\.(js|css)$)",
                },
            .network_first_patterns_ =
                {
                    R"(/api/)",
                    R"(gemini)",
                    R"(/auth/)",
                },
            .stale_while_revalidate_patterns_ =
                {
                    R"(\.(?:html)$)",
                    R"(/$)",
                    R"(/manifest\.json$)",
                },
            .api_ttl_ms_ = constants::DEFAULT_API_TTL_MS,
            .network_first_timeout_ms_ = 0,
            .install_policy_ = InstallPolicy::STRICT,
            .skip_waiting_ = true,
            .trusted_origin_markers_ = {"chrome-extension"},
            .bypass_paths_ = {"/sw.js"},
            .bypass_path_fragments_ = {"_next/", "__webpack"},
            .request_threads_ = 4,
            .background_threads_ = 2,
            .precache_parallelism_ = 4,
            .storage_ = StorageConfig{},
            .log_level_ = "info",
        };
    }

    WorkerConfig WorkerConfig::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw ConfigError("", "Config file not found: " + path.string());
        }

        simdjson::padded_string json;
        auto error = simdjson::padded_string::load(path.string()).get(json);
        if (error != simdjson::error_code::SUCCESS) {
            throw ConfigError("", "Unable to read config file: " + path.string());
        }

        return parse_json(std::string_view(json.data(), json.size()));
    }

    WorkerConfig WorkerConfig::parse_json(std::string_view json) {
        const WorkerConfig fallback = defaults();

        simdjson::ondemand::parser json_parser;
        simdjson::padded_string padded(json);
        simdjson::ondemand::document doc;
        if (json_parser.iterate(padded).get(doc) != simdjson::error_code::SUCCESS) {
            throw ConfigError("", "Config is not valid JSON");
        }

        auto string_option = [](std::string_view fallback_value, std::string message, std::vector<std::string_view> allowed = {}) {
            return ParserOptions<std::string_view>{
                .is_required_ = false, .allowed_values_ = std::move(allowed), .fallback_value_ = fallback_value, .error_message_ = std::move(message)};
        };
        auto int_option = [](int64_t fallback_value, std::string message) {
            return ParserOptions<int64_t>{.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = fallback_value, .error_message_ = std::move(message)};
        };
        auto bool_option = [](bool fallback_value, std::string message) {
            return ParserOptions<bool>{.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = fallback_value, .error_message_ = std::move(message)};
        };
        auto array_option = [](std::vector<std::string> fallback_value, std::string message) {
            return ParserOptions<std::vector<std::string>>{
                .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = std::move(fallback_value), .error_message_ = std::move(message)};
        };

        WorkerConfig cfg;
        cfg.version_ = std::string(parser::parse_value(doc["version"].get_string(), string_option(fallback.version_, "Invalid version"), "version"));
        cfg.cache_prefix_ =
            std::string(parser::parse_value(doc["cache_prefix"].get_string(), string_option(fallback.cache_prefix_, "Invalid cache prefix"), "cache_prefix"));
        cfg.origin_ = std::string(parser::parse_value(doc["origin"].get_string(), string_option(fallback.origin_, "Invalid origin"), "origin"));
        cfg.precache_manifest_ = parser::parse_string_array(doc["precache_manifest"].get_array(),
                                                            array_option(fallback.precache_manifest_, "Invalid precache manifest"), "precache_manifest");

        cfg.cache_first_patterns_ = parser::parse_string_array(doc["patterns"]["cache_first"].get_array(),
                                                               array_option(fallback.cache_first_patterns_, "Invalid cache-first patterns"),
                                                               "patterns.cache_first");
        cfg.network_first_patterns_ = parser::parse_string_array(doc["patterns"]["network_first"].get_array(),
                                                                 array_option(fallback.network_first_patterns_, "Invalid network-first patterns"),
                                                                 "patterns.network_first");
        cfg.stale_while_revalidate_patterns_ = parser::parse_string_array(
            doc["patterns"]["stale_while_revalidate"].get_array(),
            array_option(fallback.stale_while_revalidate_patterns_, "Invalid stale-while-revalidate patterns"), "patterns.stale_while_revalidate");

        cfg.api_ttl_ms_ = parser::parse_value(doc["api_ttl_ms"].get_int64(), int_option(fallback.api_ttl_ms_, "Invalid api ttl"), "api_ttl_ms");
        cfg.network_first_timeout_ms_ = long(parser::parse_value(
            doc["network_first_timeout_ms"].get_int64(), int_option(fallback.network_first_timeout_ms_, "Invalid network-first timeout"), "network_first_timeout_ms"));

        const std::string install_policy = std::string(parser::parse_value(
            doc["install_policy"].get_string(), string_option("strict", "Invalid install policy", {"strict", "lenient"}), "install_policy"));
        cfg.install_policy_ = install_policy == "lenient" ? InstallPolicy::LENIENT : InstallPolicy::STRICT;
        cfg.skip_waiting_ = parser::parse_value(doc["skip_waiting"].get_bool(), bool_option(fallback.skip_waiting_, "Invalid skip waiting"), "skip_waiting");

        cfg.trusted_origin_markers_ = parser::parse_string_array(
            doc["trusted_origin_markers"].get_array(), array_option(fallback.trusted_origin_markers_, "Invalid trusted origin markers"), "trusted_origin_markers");
        cfg.bypass_paths_ =
            parser::parse_string_array(doc["bypass_paths"].get_array(), array_option(fallback.bypass_paths_, "Invalid bypass paths"), "bypass_paths");
        cfg.bypass_path_fragments_ = parser::parse_string_array(
            doc["bypass_path_fragments"].get_array(), array_option(fallback.bypass_path_fragments_, "Invalid bypass path fragments"), "bypass_path_fragments");

        cfg.request_threads_ = static_cast<unsigned int>(parser::non_negative(
            parser::parse_value(doc["threads"]["request"].get_int64(), int_option(fallback.request_threads_, "Invalid request threads"), "threads.request"),
            "threads.request"));
        cfg.background_threads_ = static_cast<unsigned int>(parser::non_negative(
            parser::parse_value(doc["threads"]["background"].get_int64(), int_option(fallback.background_threads_, "Invalid background threads"),
                                "threads.background"),
            "threads.background"));
        cfg.precache_parallelism_ = static_cast<size_t>(parser::non_negative(
            parser::parse_value(doc["precache_parallelism"].get_int64(),
                                int_option(static_cast<int64_t>(fallback.precache_parallelism_), "Invalid precache parallelism"), "precache_parallelism"),
            "precache_parallelism"));

        const std::string storage_kind = std::string(parser::parse_value(
            doc["storage"]["kind"].get_string(), string_option("memory", "Invalid storage kind", {"memory", "disk"}), "storage.kind"));
        cfg.storage_.kind_ = storage_kind == "disk" ? StorageKind::DISK : StorageKind::MEMORY;
        cfg.storage_.root_path_ = std::string(parser::parse_value(
            doc["storage"]["root_path"].get_string(), string_option(fallback.storage_.root_path_, "Invalid storage root path"), "storage.root_path"));
        cfg.storage_.quota_bytes_ = static_cast<size_t>(parser::non_negative(
            parser::parse_value(doc["storage"]["quota_bytes"].get_int64(), int_option(0, "Invalid storage quota"), "storage.quota_bytes"),
            "storage.quota_bytes"));

        cfg.log_level_ = std::string(parser::parse_value(doc["log_level"].get_string(),
                                                         string_option(fallback.log_level_, "Invalid log level", {"trace", "debug", "info", "warn", "error", "off"}),
                                                         "log_level"));

        cfg.validate();
        return cfg;
    }

    void WorkerConfig::validate() const {
        if (version_.empty()) {
            throw ConfigError("version", "Version must not be empty");
        }
        if (origin_.empty()) {
            throw ConfigError("origin", "Origin must not be empty");
        }
        if (api_ttl_ms_ < 0) {
            throw ConfigError("api_ttl_ms", "Api ttl must not be negative");
        }
        if (network_first_timeout_ms_ < 0) {
            throw ConfigError("network_first_timeout_ms", "Network-first timeout must not be negative");
        }
        if (request_threads_ == 0) {
            throw ConfigError("threads.request", "Request threads are required");
        }
        if (background_threads_ == 0) {
            throw ConfigError("threads.background", "Background threads are required");
        }
        if (precache_parallelism_ == 0) {
            throw ConfigError("precache_parallelism", "Precache parallelism must be positive");
        }
        if (storage_.kind_ == StorageKind::DISK && storage_.root_path_.empty()) {
            throw ConfigError("storage.root_path", "Disk storage requires a root path");
        }

        auto check_patterns = [](const std::vector<std::string>& patterns, const std::string& key) {
            for (const auto& pattern : patterns) {
                try {
                    std::regex compiled(pattern, std::regex::ECMAScript);
                } catch (const std::regex_error& e) {
                    throw ConfigError(key, "Invalid pattern '" + pattern + "': " + e.what());
                }
            }
        };
        check_patterns(cache_first_patterns_, "patterns.cache_first");
        check_patterns(network_first_patterns_, "patterns.network_first");
        check_patterns(stale_while_revalidate_patterns_, "patterns.stale_while_revalidate");

        try {
            logging::parse_level(log_level_);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("log_level", e.what());
        }
    }

    const char* to_string(InstallPolicy policy) { return policy == InstallPolicy::LENIENT ? "lenient" : "strict"; }

    const char* to_string(StorageKind kind) { return kind == StorageKind::DISK ? "disk" : "memory"; }

}  // namespace config
