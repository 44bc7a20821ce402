#include "classifier.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

#include "../http/model/url.hpp"

namespace routing {
    const char* to_string(StrategyTag tag) {
        switch (tag) {
            case StrategyTag::CACHE_FIRST:
                return "cache-first";
            case StrategyTag::NETWORK_FIRST:
                return "network-first";
            case StrategyTag::STALE_WHILE_REVALIDATE:
                return "stale-while-revalidate";
            case StrategyTag::NETWORK_ONLY:
                return "network-only";
        }
        return "network-only";
    }

    namespace {
        std::vector<std::regex> compile(const std::vector<std::string>& patterns) {
            std::vector<std::regex> compiled;
            compiled.reserve(patterns.size());
            for (const auto& pattern : patterns) {
                compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
            }
            return compiled;
        }
    }  // namespace

    PatternClassifier::PatternClassifier(const std::vector<std::string>& cache_first, const std::vector<std::string>& network_first,
                                         const std::vector<std::string>& stale_while_revalidate) {
        pattern_sets_.push_back(PatternSet{.tag_ = StrategyTag::CACHE_FIRST, .patterns_ = compile(cache_first)});
        pattern_sets_.push_back(PatternSet{.tag_ = StrategyTag::NETWORK_FIRST, .patterns_ = compile(network_first)});
        pattern_sets_.push_back(PatternSet{.tag_ = StrategyTag::STALE_WHILE_REVALIDATE, .patterns_ = compile(stale_while_revalidate)});
    }

    PatternClassifier::PatternClassifier(const config::WorkerConfig& cfg)
        : PatternClassifier(cfg.cache_first_patterns_, cfg.network_first_patterns_, cfg.stale_while_revalidate_patterns_) {}

    StrategyTag PatternClassifier::classify(const std::string& url) const {
        // Unparseable input is matched as-is so classification stays total.
        auto parsed = http::model::parse_url(url);
        const std::string subject = parsed ? parsed->path_and_query() : url;

        for (const auto& pattern_set : pattern_sets_) {
            if (std::ranges::any_of(pattern_set.patterns_, [&subject](const std::regex& re) { return std::regex_search(subject, re); })) {
                return pattern_set.tag_;
            }
        }

        return StrategyTag::NETWORK_ONLY;
    }
}  // namespace routing
