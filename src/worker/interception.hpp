#ifndef OFFLINE_CACHE_INTERCEPTION_HPP
#define OFFLINE_CACHE_INTERCEPTION_HPP

#include <string>
#include <vector>

#include "../config/worker_config.hpp"

namespace worker {
    // Decides which requests the worker handles at all. Everything else goes to the
    // network untouched.
    class InterceptionPolicy {
       public:
        explicit InterceptionPolicy(const config::WorkerConfig& cfg);

        [[nodiscard]] bool should_intercept(const std::string& url) const;

       private:
        std::string origin_;
        std::vector<std::string> trusted_origin_markers_;
        std::vector<std::string> bypass_paths_;
        std::vector<std::string> bypass_path_fragments_;
    };
}  // namespace worker

#endif
