#include "partition.hpp"

#include <algorithm>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

static constexpr const char *VERSION_MARKER = "-v";

namespace cache::store {
    PartitionNaming::PartitionNaming(std::string prefix) : prefix_(std::move(prefix)) {}

    std::string PartitionNaming::format(const std::string &logical, const std::string &version) const {
        std::string name = prefix_.empty() ? std::string{} : prefix_ + "-";
        return name + logical + VERSION_MARKER + version;
    }

    std::optional<PartitionName> PartitionNaming::parse(const std::string &name) const {
        std::string rest = name;
        if (!prefix_.empty()) {
            const std::string expected = prefix_ + "-";
            if (!string_utils::starts_with(rest, expected)) {
                return std::nullopt;
            }
            rest = rest.substr(expected.size());
        }

        // Versions may contain the marker themselves, so the logical name ends at the first one.
        // A managed name is matched whole so "static-v2024-v3" keeps version "2024-v3".
        size_t marker = std::string::npos;
        for (auto managed : constants::MANAGED_PARTITIONS) {
            if (string_utils::starts_with(rest, std::string(managed) + VERSION_MARKER)) {
                marker = managed.size();
                break;
            }
        }
        if (marker == std::string::npos) {
            marker = rest.find(VERSION_MARKER);
        }
        if (marker == std::string::npos || marker == 0) {
            return std::nullopt;
        }

        PartitionName parsed{
            .logical_ = rest.substr(0, marker),
            .version_ = rest.substr(marker + std::char_traits<char>::length(VERSION_MARKER)),
        };

        if (parsed.version_.empty()) {
            return std::nullopt;
        }

        return parsed;
    }

    bool PartitionNaming::is_managed(const std::string &logical) {
        return std::ranges::any_of(constants::MANAGED_PARTITIONS, [&logical](std::string_view managed) { return managed == logical; });
    }
}  // namespace cache::store
