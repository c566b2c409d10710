#pragma once
#include "http_endpoint.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpserve {

struct AuthOptions {
    /// Expected token. Unset disables the check entirely.
    std::optional<std::string> token;
    /// Header carrying the token, matched case-insensitively.
    std::string header_name = "Authorization";
    /// Path prefixes that are let through without a token.
    std::vector<std::string> exempt_paths;
};

/// Static-token check in front of an HTTP endpoint.
///
/// The header value may be the bare token or "Bearer <token>" (prefix in any
/// case). A failed check answers 401 with a JSON-RPC error whose id is taken
/// from the request body when that body parses; a malformed body yields a
/// null id and never an exception.
class AuthGate {
public:
    AuthGate(AuthOptions opts, HttpEndpoint next);

    HttpOutcome accept(const httplib::Request& req, httplib::Response& res) const;

    [[nodiscard]] bool enabled() const { return opts_.token.has_value(); }
    [[nodiscard]] bool is_exempt(const std::string& path) const;
    [[nodiscard]] bool authorized(const httplib::Request& req) const;

    const AuthOptions& options() const { return opts_; }

    /// Strip an optional case-insensitive "Bearer " prefix.
    static std::string_view strip_bearer(std::string_view value);

private:
    void reject(const httplib::Request& req, httplib::Response& res) const;

    const AuthOptions opts_;
    HttpEndpoint next_;
};

} // namespace mcpserve
