#pragma once

#include <sap_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace sap_mcp {

// Reserved JSON-RPC 2.0 error codes used by the server.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

// ---------------------------------------------------------------------------
// RpcError — the "error" member of a JSON-RPC response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = kInvalidParams;
    std::string message;
    std::optional<nlohmann::json> data;

    static RpcError ParseError();
    static RpcError InvalidRequest(const std::string& detail);
    static RpcError MethodNotFound(const std::string& method);
    // Handler failure or wrong-shaped params; detail goes into "data".
    static RpcError InvalidParams(const std::string& detail);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// Method — the closed set of methods the server understands.
// ---------------------------------------------------------------------------
enum class Method {
    Initialize,
    InitializedNotification,
    ToolsList,
    ToolsCall,
    Unknown,
};

[[nodiscard]] Method ParseMethod(std::string_view name);

// ---------------------------------------------------------------------------
// Request — a decoded request or notification.
// ---------------------------------------------------------------------------
struct Request {
    std::string method;
    Method kind = Method::Unknown;
    // Absent params decode as an empty object; present params are kept as-is,
    // including null and non-object values.
    nlohmann::json params = nlohmann::json::object();
    // nullopt when the id is absent or null.
    std::optional<nlohmann::json> id;

    [[nodiscard]] bool IsNotification() const noexcept { return !id.has_value(); }

    // The id as it appears in a response: the request id, or null.
    [[nodiscard]] nlohmann::json ResponseId() const {
        return id.value_or(nlohmann::json(nullptr));
    }
};

// ---------------------------------------------------------------------------
// Response — exactly one of result or error, tagged with the request id.
// ---------------------------------------------------------------------------
class Response {
public:
    static Response Success(nlohmann::json id, nlohmann::json result);
    static Response Failure(nlohmann::json id, RpcError error);

    [[nodiscard]] const nlohmann::json& Id() const noexcept { return id_; }
    [[nodiscard]] bool IsError() const noexcept { return outcome_.IsErr(); }
    [[nodiscard]] const nlohmann::json& Payload() const& { return outcome_.Value(); }
    [[nodiscard]] const RpcError& Error() const& { return outcome_.Error(); }

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    Response(nlohmann::json id, sap_mcp::Result<nlohmann::json, RpcError> outcome);

    nlohmann::json id_;
    sap_mcp::Result<nlohmann::json, RpcError> outcome_;
};

// Decode one line into a Request. Never throws. Fails with a parse error for
// invalid JSON and an invalid-request error for JSON that is not an object;
// both are answered with a null id.
[[nodiscard]] sap_mcp::Result<Request, RpcError> DecodeRequest(
    std::string_view line);

// Encode a response as a single compact line without the trailing newline.
[[nodiscard]] std::string EncodeResponse(const Response& response);

} // namespace sap_mcp
