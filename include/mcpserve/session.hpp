#pragma once
#include "types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpserve {

enum class SessionState {
    Uninitialized,
    Initialized
};

/// Identity of a party that can hold subscriptions. The empty string is the
/// default channel of the active transport (stdout, or every open HTTP stream).
using SubscriberId = std::string;

/// Resource uri -> subscribers interested in update notifications.
class SubscriptionTable {
public:
    /// Returns false if the pair was already present.
    bool subscribe(const std::string& uri, const SubscriberId& subscriber);

    /// Returns false if the pair was absent (a no-op).
    bool unsubscribe(const std::string& uri, const SubscriberId& subscriber);

    /// Remove `subscriber` everywhere. Returns the uris it was subscribed to.
    std::vector<std::string> drop_subscriber(const SubscriberId& subscriber);

    /// Remove every subscription to `uri`.
    void drop_uri(const std::string& uri);

    [[nodiscard]] std::vector<SubscriberId> subscribers(const std::string& uri) const;
    [[nodiscard]] bool has_subscribers(const std::string& uri) const;
    [[nodiscard]] size_t size() const;

private:
    std::map<std::string, std::set<SubscriberId>> by_uri_;
};

/// Protocol session. Not internally synchronized: the owning server guards
/// it with the same lock as its registries and subscriptions.
///
/// There is one Session per server, shared by every HTTP connection.
class Session {
public:
    SessionState state() const { return state_; }
    bool initialized() const { return state_ == SessionState::Initialized; }

    /// Fire the uninitialized -> initialized transition. Returns true only
    /// the first time.
    bool mark_initialized();

    /// Record what the client sent with `initialize`.
    void record_client(const nlohmann::json& params);

    const std::optional<Implementation>& client_info() const { return client_info_; }
    const nlohmann::json& client_capabilities() const { return client_caps_; }
    const std::string& requested_protocol_version() const { return requested_version_; }

    SubscriptionTable& subscriptions() { return subscriptions_; }
    const SubscriptionTable& subscriptions() const { return subscriptions_; }

private:
    SessionState state_{SessionState::Uninitialized};
    std::optional<Implementation> client_info_;
    nlohmann::json client_caps_ = nlohmann::json::object();
    std::string requested_version_;
    SubscriptionTable subscriptions_;
};

} // namespace mcpserve
