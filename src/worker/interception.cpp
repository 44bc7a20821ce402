#include "interception.hpp"

#include <algorithm>
#include <string>

#include "../http/model/url.hpp"

namespace worker {
    InterceptionPolicy::InterceptionPolicy(const config::WorkerConfig& cfg)
        : trusted_origin_markers_(cfg.trusted_origin_markers_), bypass_paths_(cfg.bypass_paths_), bypass_path_fragments_(cfg.bypass_path_fragments_) {
        auto parsed = http::model::parse_url(cfg.origin_);
        origin_ = parsed ? parsed->origin() : cfg.origin_;
    }

    bool InterceptionPolicy::should_intercept(const std::string& url) const {
        auto parsed = http::model::parse_url(url);
        if (!parsed) {
            return false;
        }

        const std::string origin = parsed->origin();
        if (origin != origin_ &&
            !std::ranges::any_of(trusted_origin_markers_, [&origin](const std::string& marker) { return origin.find(marker) != std::string::npos; })) {
            return false;
        }

        const std::string& path = parsed->path_;
        if (std::ranges::find(bypass_paths_, path) != bypass_paths_.end()) {
            return false;
        }
        return std::ranges::none_of(bypass_path_fragments_, [&path](const std::string& fragment) { return path.find(fragment) != std::string::npos; });
    }
}  // namespace worker
