#include "disk_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

static constexpr const char *BODY_FILE_EXT = ".body";
static constexpr const char *META_FILE_EXT = ".meta";
static constexpr const char *TMP_FILE_EXT = ".tmp";
static constexpr const char *HEADER_META_KEY = "header";
static constexpr const char *DIGEST_META_KEY = "body_digest";

namespace cache::backend {

    DiskBackend::DiskBackend(std::filesystem::path root, size_t quota_bytes) : root_(std::move(root)), quota_bytes_(quota_bytes) {
        std::filesystem::create_directories(root_);
        used_bytes_ = scan_bytes(root_);
    }

    std::filesystem::path DiskBackend::partition_path(const std::string &partition) const { return root_ / partition; }

    std::filesystem::path DiskBackend::create_base_path(const std::string &partition, const std::string &key) const {
        std::hash<std::string> hash_maker;
        size_t hash = hash_maker(key);
        return partition_path(partition) / std::to_string(hash);
    }

    std::vector<std::string> DiskBackend::list_partitions() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> names;
        for (const auto &dir_entry : std::filesystem::directory_iterator(root_)) {
            if (dir_entry.is_directory()) {
                names.push_back(dir_entry.path().filename().string());
            }
        }
        std::ranges::sort(names);
        return names;
    }

    bool DiskBackend::has_partition(const std::string &partition) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::filesystem::is_directory(partition_path(partition));
    }

    void DiskBackend::open_partition(const std::string &partition) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::filesystem::create_directories(partition_path(partition));
    }

    bool DiskBackend::delete_partition(const std::string &partition) {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto path = partition_path(partition);
        if (!std::filesystem::is_directory(path)) {
            return false;
        }
        const size_t freed = scan_bytes(path);
        const auto removed = std::filesystem::remove_all(path);
        used_bytes_ -= std::min(freed, used_bytes_);
        spdlog::debug("Removed {} files under {}", removed, path.string());
        return removed > 0;
    }

    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
    std::optional<cache::entry::CacheEntry> DiskBackend::get(const std::string &partition, const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto base_path = create_base_path(partition, key);
        const auto body_path = string_utils::append_to_path(base_path, BODY_FILE_EXT);
        const auto meta_path = string_utils::append_to_path(base_path, META_FILE_EXT);

        cache::entry::CacheEntry entry;
        std::string digest;
        if (!load_meta(meta_path, entry, &digest) || entry.key_ != key) {
            return std::nullopt;
        }

        std::ifstream body_in(body_path, std::ios::binary);
        if (!body_in) {
            return std::nullopt;
        }

        std::string s;
        body_in.seekg(0, std::ios::end);
        s.resize(static_cast<size_t>(body_in.tellg()));
        body_in.seekg(0, std::ios::beg);
        body_in.read(s.data(), static_cast<std::streamsize>(s.size()));
        if (body_digest(s) != digest) {
            spdlog::debug("Body of {} does not match its meta, treating as absent", key);
            return std::nullopt;
        }
        entry.response_.body_ = std::move(s);

        return entry;
    }

    void DiskBackend::put(const std::string &partition, const cache::entry::CacheEntry &entry) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::filesystem::create_directories(partition_path(partition));

        const auto base_path = create_base_path(partition, entry.key_);
        const auto body_path = string_utils::append_to_path(base_path, BODY_FILE_EXT);
        const auto meta_path = string_utils::append_to_path(base_path, META_FILE_EXT);
        const std::string meta = serialize_meta(entry);

        size_t replaced_bytes = 0;
        for (const auto &p : {body_path, meta_path}) {
            std::error_code ec;
            const auto size = std::filesystem::file_size(p, ec);
            if (!ec) {
                replaced_bytes += static_cast<size_t>(size);
            }
        }

        const size_t incoming_bytes = entry.response_.body_.size() + meta.size();
        const size_t kept_bytes = used_bytes_ - std::min(replaced_bytes, used_bytes_);
        if (quota_bytes_ > 0 && kept_bytes + incoming_bytes > quota_bytes_) {
            throw QuotaExceededError(partition, "Quota exceeded writing " + entry.key_ + " (" + std::to_string(incoming_bytes) + " bytes)");
        }

        try {
            write_atomic(partition, body_path, entry.response_.body_);
            write_atomic(partition, meta_path, meta);
        } catch (const std::exception &) {
            // The body may already be replaced.
            used_bytes_ = scan_bytes(root_);
            throw;
        }
        used_bytes_ = kept_bytes + incoming_bytes;
    }

    std::vector<std::string> DiskBackend::keys(const std::string &partition) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> out;
        const auto path = partition_path(partition);
        if (!std::filesystem::is_directory(path)) {
            return out;
        }

        for (const auto &dir_entry : std::filesystem::directory_iterator(path)) {
            if (dir_entry.path().extension() != META_FILE_EXT) {
                continue;
            }
            cache::entry::CacheEntry entry;
            if (load_meta(dir_entry.path(), entry)) {
                out.push_back(entry.key_);
            }
        }
        std::ranges::sort(out);
        return out;
    }

    size_t DiskBackend::used_bytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_bytes_;
    }

    size_t DiskBackend::scan_bytes(const std::filesystem::path &path) {
        size_t total = 0;
        if (!std::filesystem::is_directory(path)) {
            return total;
        }
        for (const auto &dir_entry : std::filesystem::recursive_directory_iterator(path)) {
            if (dir_entry.is_regular_file()) {
                total += static_cast<size_t>(dir_entry.file_size());
            }
        }
        return total;
    }

    std::string DiskBackend::serialize_meta(const cache::entry::CacheEntry &entry) {
        std::ostringstream oss;
        oss << "key: " << entry.key_ << "\n"
            << "url: " << entry.url_ << "\n"
            << "status: " << entry.response_.status_ << "\n"
            << "status_text: " << entry.response_.status_text_ << "\n"
            << "effective_url: " << entry.response_.effective_url_ << "\n"
            << "stored_at_ms: " << entry.stored_at_ms_ << "\n"
            << "version: " << entry.version_ << "\n"
            << DIGEST_META_KEY << ": " << body_digest(entry.response_.body_) << "\n";
        for (const auto &[name, value] : entry.response_.headers_) {
            oss << HEADER_META_KEY << ": " << name << ": " << value << "\n";
        }
        return oss.str();
    }

    void DiskBackend::write_atomic(const std::string &partition, const std::filesystem::path &p, std::string_view bytes) {
        auto tmp = p;
        tmp += TMP_FILE_EXT;
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            errno = 0;
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                const int write_errno = errno;
                out.close();
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                if (write_errno == ENOSPC || write_errno == EDQUOT) {
                    throw QuotaExceededError(partition, "No space left writing " + p.string());
                }
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }
        std::filesystem::rename(tmp, p);  // atomic on same filesystem
    }

    std::string DiskBackend::body_digest(std::string_view body) {
        return std::to_string(body.size()) + "-" + std::to_string(std::hash<std::string_view>{}(body));
    }

    bool DiskBackend::load_meta(const std::filesystem::path &p, cache::entry::CacheEntry &out, std::string *digest) {
        std::ifstream in(p);
        if (!in) {
            return false;
        }
        std::string line;
        auto as_long = [](const std::string &s, long def = -1L) -> long {
            char *end = nullptr;
            long v = std::strtol(s.c_str(), &end, constants::BASE_10);
            return (end != nullptr && *end == '\0') ? v : def;
        };
        auto as_i64 = [](const std::string &s, std::int64_t def = 0) -> std::int64_t {
            char *end = nullptr;
            long long v = std::strtoll(s.c_str(), &end, constants::BASE_10);
            return (end != nullptr && *end == '\0') ? static_cast<std::int64_t>(v) : def;
        };

        while (std::getline(in, line)) {
            auto pos = line.find(':');
            if (pos == std::string::npos) {
                continue;
            }
            std::string key = string_utils::trim(line.substr(0, pos));
            std::string val = string_utils::trim(line.substr(pos + 1));
            if (key == "key") {
                out.key_ = val;
            } else if (key == "url") {
                out.url_ = val;
            } else if (key == "status") {
                out.response_.status_ = as_long(val, 0);
            } else if (key == "status_text") {
                out.response_.status_text_ = val;
            } else if (key == "effective_url") {
                out.response_.effective_url_ = val;
            } else if (key == "stored_at_ms") {
                out.stored_at_ms_ = as_i64(val, 0);
            } else if (key == "version") {
                out.version_ = val;
            } else if (key == DIGEST_META_KEY) {
                if (digest != nullptr) {
                    *digest = val;
                }
            } else if (key == HEADER_META_KEY) {
                auto header_pos = val.find(':');
                if (header_pos != std::string::npos) {
                    out.response_.headers_[string_utils::trim(val.substr(0, header_pos))] = string_utils::trim(val.substr(header_pos + 1));
                }
            }
        }
        return !out.key_.empty();
    }
}  // namespace cache::backend
