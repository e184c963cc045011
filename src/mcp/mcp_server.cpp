#include <sap_mcp/mcp/mcp_server.hpp>

#include <sap_mcp/core/log.hpp>
#include <sap_mcp/mcp/mcp_params.hpp>
#include <sap_mcp/mcp/stdio_transport.hpp>

#include <exception>
#include <string>
#include <utility>

namespace sap_mcp {

namespace {

constexpr const char* kComponent = "mcp";

// Number of tool names quoted in the unknown-tool message.
constexpr std::size_t kExampleToolCount = 4;

HandlerOutcome Reply(nlohmann::json result) {
    return HandlerOutcome::Ok(std::optional<nlohmann::json>(std::move(result)));
}

HandlerOutcome NoReply() {
    return HandlerOutcome::Ok(std::optional<nlohmann::json>());
}

nlohmann::json TextContent(const std::string& text) {
    return {{"content", nlohmann::json::array({
        {{"type", "text"}, {"text", text}}
    })}};
}

std::string Describe(const Request& request) {
    return request.method + " (id " + request.ResponseId().dump() + ")";
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out,
                     ServerInfo info)
    : registry_(std::move(registry)), in_(in), out_(out), info_(std::move(info)) {
    dispatcher_.Register(Method::Initialize,
        [this](const Request& r) { return HandleInitialize(r); });
    dispatcher_.Register(Method::InitializedNotification,
        [this](const Request& r) { return HandleInitialized(r); });
    dispatcher_.Register(Method::ToolsList,
        [this](const Request& r) { return HandleToolsList(r); });
    dispatcher_.Register(Method::ToolsCall,
        [this](const Request& r) { return HandleToolsCall(r); });
}

void McpServer::Run() {
    LogInfo(kComponent, "SAP MCP server starting (" + info_.name + " " +
                        info_.version + ", " +
                        std::to_string(registry_.Tools().size()) + " tools)");

    LineReader reader(in_);
    ResponseWriter writer(out_);
    std::string line;

    while (!stop_requested_.load() && reader.Next(line)) {
        try {
            auto response = HandleLine(line);
            if (response) {
                writer.Write(*response);
            }
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("Unexpected error: ") + e.what());
        }
    }

    if (stop_requested_.load()) {
        LogInfo(kComponent, "Server interrupted");
    }
    LogInfo(kComponent, "SAP MCP server shutting down after " +
                        std::to_string(writer.LinesWritten()) + " responses");
}

std::optional<Response> McpServer::HandleLine(const std::string& line) {
    LogDebug(kComponent, "Request: " + line);

    auto decoded = DecodeRequest(line);
    if (decoded.IsErr()) {
        return Response::Failure(nullptr, std::move(decoded).Error());
    }
    return HandleRequest(decoded.Value());
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    auto response = HandleLine(message.dump());
    if (!response) {
        return std::nullopt;
    }
    return response->ToJson();
}

std::optional<Response> McpServer::HandleRequest(const Request& request) {
    LogDebug(kComponent, "Method: " + Describe(request));

    auto outcome = RouteGuarded(request);

    if (request.IsNotification()) {
        if (outcome.IsErr()) {
            LogWarn(kComponent, "Notification " + request.method +
                                " failed: " + outcome.Error().message);
        }
        return std::nullopt;
    }

    if (outcome.IsErr()) {
        return Response::Failure(*request.id, std::move(outcome).Error());
    }

    auto result = std::move(outcome).Value();
    if (!result.has_value()) {
        return std::nullopt;
    }
    return Response::Success(*request.id, std::move(*result));
}

// Single error boundary: any exception escaping a handler becomes an
// invalid-params error carrying the exception text.
HandlerOutcome McpServer::RouteGuarded(const Request& request) {
    try {
        auto outcome = dispatcher_.Route(request);
        if (outcome.IsErr()) {
            const auto& error = outcome.Error();
            if (error.code == kMethodNotFound) {
                LogWarn(kComponent, "Unknown method: " + request.method);
            } else {
                LogError(kComponent, "Error handling " + Describe(request) +
                                     ": " + (error.data ? error.data->dump()
                                                        : error.message));
            }
        }
        return outcome;
    } catch (const std::exception& e) {
        LogError(kComponent, "Error handling " + Describe(request) + ": " +
                             e.what());
        return HandlerOutcome::Err(RpcError::InvalidParams(e.what()));
    }
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

HandlerOutcome McpServer::HandleInitialize(const Request& request) {
    auto params = InitializeParams::FromJson(request.params);
    if (params.IsErr()) {
        return HandlerOutcome::Err(params.Error());
    }
    const auto& p = params.Value();

    LogInfo(kComponent, "Initialize: protocolVersion=" + p.protocol_version +
                        " clientInfo=" + p.client_info.dump());
    LogDebug(kComponent, "Client capabilities: " + p.capabilities.dump());
    if (p.protocol_version != kProtocolVersion) {
        LogWarn(kComponent, "Client requested protocol " + p.protocol_version +
                            ", answering with " + kProtocolVersion);
    }

    dispatcher_.MarkInitialized();

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()},
        {"resources", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    return Reply(std::move(result));
}

HandlerOutcome McpServer::HandleInitialized(const Request& request) {
    WarnIfUninitialized(request);
    LogInfo(kComponent, "Received initialized notification");
    return NoReply();
}

HandlerOutcome McpServer::HandleToolsList(const Request& request) {
    WarnIfUninitialized(request);

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return Reply({{"tools", std::move(tools)}});
}

HandlerOutcome McpServer::HandleToolsCall(const Request& request) {
    WarnIfUninitialized(request);

    auto params = ToolCallParams::FromJson(request.params);
    if (params.IsErr()) {
        return HandlerOutcome::Err(params.Error());
    }
    const auto& call = params.Value();

    if (!registry_.HasTool(call.name)) {
        LogWarn(kComponent, "Unknown tool: " + call.name);
        return Reply(TextContent(UnknownToolText(call.name)));
    }

    LogInfo(kComponent, "Executing tool: " + call.name +
                        " with args: " + call.arguments.dump());
    return Reply(TextContent(registry_.Invoke(call.name, call.arguments)));
}

void McpServer::WarnIfUninitialized(const Request& request) const {
    if (dispatcher_.State() == LifecycleState::Uninitialized) {
        LogWarn(kComponent, request.method + " received before initialize");
    }
}

std::string McpServer::UnknownToolText(const std::string& name) const {
    std::string text = "Unknown tool: " + name + ".";
    auto examples = registry_.ExampleNames(kExampleToolCount);
    if (examples.empty()) {
        return text + " No tools are available.";
    }
    text += " Available tools: ";
    for (const auto& example : examples) {
        text += example + ", ";
    }
    return text + "etc.";
}

} // namespace sap_mcp
