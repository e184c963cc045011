#pragma once

#include <sap_mcp/core/result.hpp>
#include <sap_mcp/mcp/json_rpc.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace sap_mcp {

// The only MCP protocol revision this server speaks.
constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// InitializeParams — params of "initialize".
//
// params must be an object (absent params count as {}). All fields are
// optional and only logged; they never change the negotiated result.
//   protocolVersion  default "2024-11-05"
//   capabilities     default {}
//   clientInfo       default {}
// ---------------------------------------------------------------------------
struct InitializeParams {
    std::string protocol_version = kProtocolVersion;
    nlohmann::json capabilities = nlohmann::json::object();
    nlohmann::json client_info = nlohmann::json::object();

    static Result<InitializeParams, RpcError> FromJson(const nlohmann::json& params);
};

// ---------------------------------------------------------------------------
// ToolCallParams — params of "tools/call".
//   name       tool name; a missing or non-string value becomes its JSON
//              text ("null" when absent) and resolves to no tool
//   arguments  optional object, default {} (null counts as absent)
// ---------------------------------------------------------------------------
struct ToolCallParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    static Result<ToolCallParams, RpcError> FromJson(const nlohmann::json& params);
};

} // namespace sap_mcp
