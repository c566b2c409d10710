#include "mcpserve/transport/auth_gate.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/logger.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace mcpserve {

namespace {

constexpr std::string_view BEARER_PREFIX = "bearer ";

bool starts_with_ci(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Compare without an early exit on the first differing byte.
bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // anonymous namespace

AuthGate::AuthGate(AuthOptions opts, HttpEndpoint next)
    : opts_(std::move(opts)), next_(std::move(next)) {
}

std::string_view AuthGate::strip_bearer(std::string_view value) {
    if (!starts_with_ci(value, BEARER_PREFIX)) return value;
    value.remove_prefix(BEARER_PREFIX.size());
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    return value;
}

bool AuthGate::is_exempt(const std::string& path) const {
    return std::any_of(opts_.exempt_paths.begin(), opts_.exempt_paths.end(),
                       [&](const std::string& prefix) {
                           return path.compare(0, prefix.size(), prefix) == 0;
                       });
}

bool AuthGate::authorized(const httplib::Request& req) const {
    if (!opts_.token) return true;
    if (!req.has_header(opts_.header_name)) return false;
    const auto value = req.get_header_value(opts_.header_name);
    return constant_time_equals(strip_bearer(value), *opts_.token);
}

HttpOutcome AuthGate::accept(const httplib::Request& req, httplib::Response& res) const {
    if (enabled() && !is_exempt(req.path) && !authorized(req)) {
        reject(req, res);
        return HttpOutcome::Replied;
    }
    return next_ ? next_(req, res) : HttpOutcome::PassThrough;
}

void AuthGate::reject(const httplib::Request& req, httplib::Response& res) const {
    MCPSERVE_WARN("Rejected unauthenticated request to {}", req.path);

    // Echo the request id when the body is a parsable JSON-RPC envelope.
    nlohmann::json id = nullptr;
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        auto it = body.find("id");
        if (it != body.end()) id = *it;
    }

    nlohmann::json reply = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", error::Unauthorized},
            {"message", "Unauthorized: Invalid or missing authentication token"}
        }}
    };
    res.status = 401;
    res.set_content(reply.dump(), "application/json");
}

} // namespace mcpserve
