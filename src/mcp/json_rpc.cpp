#include <sap_mcp/mcp/json_rpc.hpp>

#include <sap_mcp/core/log.hpp>

#include <utility>

namespace sap_mcp {

// ---------------------------------------------------------------------------
// RpcError
// ---------------------------------------------------------------------------
RpcError RpcError::ParseError() {
    return {kParseError, "Parse error", std::nullopt};
}

RpcError RpcError::InvalidRequest(const std::string& detail) {
    return {kInvalidRequest, "Invalid Request", nlohmann::json(detail)};
}

RpcError RpcError::MethodNotFound(const std::string& method) {
    return {kMethodNotFound, "Method not found: " + method, std::nullopt};
}

RpcError RpcError::InvalidParams(const std::string& detail) {
    return {kInvalidParams, "Invalid request parameters", nlohmann::json(detail)};
}

nlohmann::json RpcError::ToJson() const {
    nlohmann::json j = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        j["data"] = *data;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Method
// ---------------------------------------------------------------------------
Method ParseMethod(std::string_view name) {
    if (name == "initialize") return Method::Initialize;
    if (name == "notifications/initialized") return Method::InitializedNotification;
    if (name == "tools/list") return Method::ToolsList;
    if (name == "tools/call") return Method::ToolsCall;
    return Method::Unknown;
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
Response::Response(nlohmann::json id,
                   sap_mcp::Result<nlohmann::json, RpcError> outcome)
    : id_(std::move(id)), outcome_(std::move(outcome)) {}

Response Response::Success(nlohmann::json id, nlohmann::json result) {
    return Response(std::move(id),
                    sap_mcp::Result<nlohmann::json, RpcError>::Ok(std::move(result)));
}

Response Response::Failure(nlohmann::json id, RpcError error) {
    return Response(std::move(id),
                    sap_mcp::Result<nlohmann::json, RpcError>::Err(std::move(error)));
}

nlohmann::json Response::ToJson() const {
    nlohmann::json j = {{"jsonrpc", "2.0"}, {"id", id_}};
    if (outcome_.IsOk()) {
        j["result"] = outcome_.Value();
    } else {
        j["error"] = outcome_.Error().ToJson();
    }
    return j;
}

// ---------------------------------------------------------------------------
// Codec
// ---------------------------------------------------------------------------
sap_mcp::Result<Request, RpcError> DecodeRequest(std::string_view line) {
    using R = sap_mcp::Result<Request, RpcError>;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        LogWarn("codec", std::string("JSON decode error: ") + e.what());
        return R::Err(RpcError::ParseError());
    }

    if (!message.is_object()) {
        return R::Err(RpcError::InvalidRequest("Request must be a JSON object"));
    }

    Request request;
    auto id_it = message.find("id");
    if (id_it != message.end() && !id_it->is_null()) {
        request.id = *id_it;
    }

    auto jsonrpc_it = message.find("jsonrpc");
    if (jsonrpc_it == message.end() || *jsonrpc_it != "2.0") {
        LogDebug("codec", "Message without jsonrpc \"2.0\" member, processing anyway");
    }

    // A missing or non-string method routes as an unknown method named by
    // its JSON text ("null" when absent).
    auto method_it = message.find("method");
    if (method_it == message.end()) {
        request.method = "null";
    } else if (method_it->is_string()) {
        request.method = method_it->get<std::string>();
        request.kind = ParseMethod(request.method);
    } else {
        request.method = method_it->dump();
    }

    auto params_it = message.find("params");
    if (params_it != message.end()) {
        request.params = *params_it;
    }

    return R::Ok(std::move(request));
}

std::string EncodeResponse(const Response& response) {
    // Compact dump escapes control characters, so the line holds no newline.
    return response.ToJson().dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
}

} // namespace sap_mcp
