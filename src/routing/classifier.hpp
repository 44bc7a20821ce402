#ifndef OFFLINE_CACHE_CLASSIFIER_HPP
#define OFFLINE_CACHE_CLASSIFIER_HPP

#include <regex>
#include <string>
#include <vector>

#include "../config/worker_config.hpp"

namespace routing {
    enum class StrategyTag {
        CACHE_FIRST,
        NETWORK_FIRST,
        STALE_WHILE_REVALIDATE,
        NETWORK_ONLY,
    };

    const char* to_string(StrategyTag tag);

    // Pattern sets are tested in fixed priority order against the url's path and query;
    // the first set with a matching pattern wins.
    class PatternClassifier {
       public:
        PatternClassifier(const std::vector<std::string>& cache_first, const std::vector<std::string>& network_first,
                          const std::vector<std::string>& stale_while_revalidate);
        explicit PatternClassifier(const config::WorkerConfig& cfg);

        [[nodiscard]] StrategyTag classify(const std::string& url) const;

       private:
        struct PatternSet {
            StrategyTag tag_;
            std::vector<std::regex> patterns_;
        };

        std::vector<PatternSet> pattern_sets_;
    };
}  // namespace routing

#endif
