#pragma once
#include <functional>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    struct Request;
    struct Response;
}

namespace mcpserve {

/// What an HTTP endpoint did with a request.
enum class HttpOutcome {
    Replied,      ///< `res` holds a complete synchronous reply
    Streaming,    ///< `res` carries a content provider that keeps the socket open
    PassThrough   ///< not ours; hand the request to the wrapped host application
};

using HttpEndpoint = std::function<HttpOutcome(const httplib::Request& req,
                                               httplib::Response& res)>;

/// A plain request handler, as used for the wrapped host application.
using HttpHandler = std::function<void(const httplib::Request& req, httplib::Response& res)>;

} // namespace mcpserve
