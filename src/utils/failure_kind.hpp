#ifndef OFFLINE_CACHE_FAILURE_KIND_HPP
#define OFFLINE_CACHE_FAILURE_KIND_HPP

namespace failures {
    enum class FailureKind {
        NETWORK_FAILURE,
        CACHE_MISS,
        EXPIRED_ENTRY,
        QUOTA_EXCEEDED,
        UNRECOGNIZED_COMMAND,
    };

    inline const char* to_string(FailureKind kind) {
        switch (kind) {
            case FailureKind::NETWORK_FAILURE:
                return "network_failure";
            case FailureKind::CACHE_MISS:
                return "cache_miss";
            case FailureKind::EXPIRED_ENTRY:
                return "expired_entry";
            case FailureKind::QUOTA_EXCEEDED:
                return "quota_exceeded";
            case FailureKind::UNRECOGNIZED_COMMAND:
                return "unrecognized_command";
        }
        return "unknown";
    }
}  // namespace failures

#endif
