#include "clients.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <string>
#include <vector>

namespace worker {
    void ClientRegistry::register_client(std::string id, std::string url, control::ReplySink mailbox) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = id;
        clients_[key] = Client{.id_ = std::move(id), .url_ = std::move(url), .mailbox_ = std::move(mailbox), .controller_ = ""};
    }

    bool ClientRegistry::unregister_client(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.erase(id) > 0;
    }

    size_t ClientRegistry::claim(const std::string& version) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t claimed = 0;
        for (auto& [id, client] : clients_) {
            if (client.controller_ != version) {
                client.controller_ = version;
                ++claimed;
            }
        }
        spdlog::debug("Claimed {} clients for version {}", claimed, version);
        return claimed;
    }

    bool ClientRegistry::is_controlled(const std::string& id) const { return controller(id).has_value(); }

    std::optional<std::string> ClientRegistry::controller(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(id);
        if (it == clients_.end() || it->second.controller_.empty()) {
            return std::nullopt;
        }
        return it->second.controller_;
    }

    std::vector<std::string> ClientRegistry::ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(clients_.size());
        for (const auto& [id, client] : clients_) {
            out.push_back(id);
        }
        return out;
    }

    bool ClientRegistry::post(const std::string& id, const std::string& message) const {
        control::ReplySink mailbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = clients_.find(id);
            if (it == clients_.end() || it->second.mailbox_ == nullptr) {
                return false;
            }
            mailbox = it->second.mailbox_;
        }

        mailbox(message);
        return true;
    }

    control::ReplySink ClientRegistry::sink_for(const std::string& id) const {
        return [this, id](const std::string& message) {
            if (!post(id, message)) {
                spdlog::debug("Dropping reply for unknown client {}", id);
            }
        };
    }
}  // namespace worker
