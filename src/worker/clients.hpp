#ifndef OFFLINE_CACHE_CLIENTS_HPP
#define OFFLINE_CACHE_CLIENTS_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../control/command.hpp"

namespace worker {
    // An open page talking to the worker.
    struct Client {
        std::string id_;
        std::string url_;
        control::ReplySink mailbox_;
        // Version of the worker controlling this client, empty while uncontrolled.
        std::string controller_;
    };

    class ClientRegistry {
       public:
        void register_client(std::string id, std::string url, control::ReplySink mailbox);
        bool unregister_client(const std::string& id);

        // Makes version the controller of every registered client; returns how many changed.
        size_t claim(const std::string& version);

        [[nodiscard]] bool is_controlled(const std::string& id) const;
        [[nodiscard]] std::optional<std::string> controller(const std::string& id) const;
        [[nodiscard]] std::vector<std::string> ids() const;

        // Delivers message to the client's mailbox; false for an unknown id.
        bool post(const std::string& id, const std::string& message) const;

        // A sink bound to one client, for replies addressed to that sender only.
        [[nodiscard]] control::ReplySink sink_for(const std::string& id) const;

       private:
        mutable std::mutex mutex_;
        std::map<std::string, Client> clients_;
    };
}  // namespace worker

#endif
