#include <sap_mcp/mcp/mcp_params.hpp>

namespace sap_mcp {

namespace {

std::string TypeName(const nlohmann::json& value) {
    return value.type_name();
}

} // anonymous namespace

Result<InitializeParams, RpcError> InitializeParams::FromJson(
    const nlohmann::json& params) {
    using R = Result<InitializeParams, RpcError>;
    if (!params.is_object()) {
        return R::Err(RpcError::InvalidParams(
            "params must be an object, got " + TypeName(params)));
    }

    InitializeParams out;
    auto version = params.find("protocolVersion");
    if (version != params.end() && version->is_string()) {
        out.protocol_version = version->get<std::string>();
    }
    auto caps = params.find("capabilities");
    if (caps != params.end()) {
        out.capabilities = *caps;
    }
    auto info = params.find("clientInfo");
    if (info != params.end()) {
        out.client_info = *info;
    }
    return R::Ok(std::move(out));
}

Result<ToolCallParams, RpcError> ToolCallParams::FromJson(
    const nlohmann::json& params) {
    using R = Result<ToolCallParams, RpcError>;
    if (!params.is_object()) {
        return R::Err(RpcError::InvalidParams(
            "params must be an object, got " + TypeName(params)));
    }

    ToolCallParams out;
    auto name = params.find("name");
    if (name == params.end()) {
        out.name = "null";
    } else if (name->is_string()) {
        out.name = name->get<std::string>();
    } else {
        out.name = name->dump();
    }

    auto args = params.find("arguments");
    if (args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            return R::Err(RpcError::InvalidParams(
                "'arguments' must be an object, got " + TypeName(*args)));
        }
        out.arguments = *args;
    }
    return R::Ok(std::move(out));
}

} // namespace sap_mcp
