#ifndef OFFLINE_CACHE_PARTITION_HPP
#define OFFLINE_CACHE_PARTITION_HPP

#include <optional>
#include <string>

namespace cache::store {
    struct PartitionName {
        std::string logical_;
        std::string version_;
    };

    // A borrowed handle to one opened partition; valid for a single resolution.
    struct Partition {
        std::string name_;
        std::string logical_;
        std::string version_;
    };

    // Maps (logical, version) to storage names of the form "[<prefix>-]<logical>-v<version>".
    class PartitionNaming {
       public:
        explicit PartitionNaming(std::string prefix = "");

        [[nodiscard]] std::string format(const std::string& logical, const std::string& version) const;
        // nullopt for names this naming scheme did not produce.
        [[nodiscard]] std::optional<PartitionName> parse(const std::string& name) const;

        [[nodiscard]] static bool is_managed(const std::string& logical);

       private:
        std::string prefix_;
    };
}  // namespace cache::store

#endif
