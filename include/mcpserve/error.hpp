#pragma once
#include <stdexcept>
#include <string>

namespace mcpserve {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Thrown by a capability when the arguments it was given fail validation.
class McpInvalidArgumentsError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int ServerError      = -32000;
    constexpr int Unauthorized     = ServerError;
    constexpr int MessageTooLarge  = -32001;
} // namespace error

} // namespace mcpserve
