#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mcpserve {

class Codec {
public:
    /// Parse raw JSON bytes into a message.
    /// Throws McpParseError on invalid JSON and McpProtocolError(InvalidRequest)
    /// when the text is JSON but not a JSON-RPC 2.0 envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw JSON text into a document. Throws McpParseError.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Classify a parsed document as request, notification or response.
    /// A null or absent id on a method call makes it a notification.
    [[nodiscard]] static JsonRpcMessage to_message(const nlohmann::json& j);

    /// Best-effort id recovery from a document that failed to_message().
    [[nodiscard]] static std::optional<RequestId> extract_id(const nlohmann::json& j);

    /// Serialize a message to a single line of JSON. The envelope members are
    /// written in the order jsonrpc, id, method, params, result, error.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace mcpserve
