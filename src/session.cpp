#include "mcpserve/session.hpp"

namespace mcpserve {

// ---------- SubscriptionTable ----------

bool SubscriptionTable::subscribe(const std::string& uri, const SubscriberId& subscriber) {
    return by_uri_[uri].insert(subscriber).second;
}

bool SubscriptionTable::unsubscribe(const std::string& uri, const SubscriberId& subscriber) {
    auto it = by_uri_.find(uri);
    if (it == by_uri_.end()) return false;
    bool removed = it->second.erase(subscriber) > 0;
    if (it->second.empty()) by_uri_.erase(it);
    return removed;
}

std::vector<std::string> SubscriptionTable::drop_subscriber(const SubscriberId& subscriber) {
    std::vector<std::string> dropped;
    for (auto it = by_uri_.begin(); it != by_uri_.end(); ) {
        if (it->second.erase(subscriber) > 0) {
            dropped.push_back(it->first);
        }
        if (it->second.empty()) {
            it = by_uri_.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

void SubscriptionTable::drop_uri(const std::string& uri) {
    by_uri_.erase(uri);
}

std::vector<SubscriberId> SubscriptionTable::subscribers(const std::string& uri) const {
    auto it = by_uri_.find(uri);
    if (it == by_uri_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

bool SubscriptionTable::has_subscribers(const std::string& uri) const {
    return by_uri_.count(uri) > 0;
}

size_t SubscriptionTable::size() const {
    size_t n = 0;
    for (const auto& [uri, subs] : by_uri_) n += subs.size();
    return n;
}

// ---------- Session ----------

bool Session::mark_initialized() {
    if (state_ == SessionState::Initialized) return false;
    state_ = SessionState::Initialized;
    return true;
}

void Session::record_client(const nlohmann::json& params) {
    if (!params.is_object()) return;
    auto info = params.find("clientInfo");
    if (info != params.end() && info->is_object()) {
        try {
            client_info_ = info->get<Implementation>();
        } catch (const nlohmann::json::exception&) {
            // Malformed clientInfo is tolerated; initialize never rejects.
            client_info_.reset();
        }
    }
    auto caps = params.find("capabilities");
    if (caps != params.end() && caps->is_object()) {
        client_caps_ = *caps;
    }
    auto version = params.find("protocolVersion");
    if (version != params.end() && version->is_string()) {
        requested_version_ = version->get<std::string>();
    }
}

} // namespace mcpserve
