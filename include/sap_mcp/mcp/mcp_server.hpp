#pragma once

#include <sap_mcp/core/version.hpp>
#include <sap_mcp/mcp/dispatcher.hpp>
#include <sap_mcp/mcp/json_rpc.hpp>
#include <sap_mcp/mcp/tool_registry.hpp>

#include <atomic>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sap_mcp {

// Identity reported in the initialize result.
struct ServerInfo {
    std::string name = "sap-automation";
    std::string version = kVersion;
};

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - notifications/initialized (never answered)
//   - tools/list
//   - tools/call
//
// Requests are handled strictly one at a time, in input order. Every request
// carrying an id gets exactly one response line; notifications get none.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout,
                       ServerInfo info = ServerInfo{});

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop. Blocks until end of input or RequestStop().
    void Run();

    // Ask Run() to return before reading the next line. Async-signal-safe.
    void RequestStop() noexcept { stop_requested_.store(true); }

    // Decode and handle one raw input line.
    // Returns nullopt when nothing must be written.
    [[nodiscard]] std::optional<Response> HandleLine(const std::string& line);

    // Route a decoded request and convert every failure into an error
    // response. Returns nullopt for notifications.
    [[nodiscard]] std::optional<Response> HandleRequest(const Request& request);

    // Process a single JSON-RPC message and return the response (if any).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] LifecycleState State() const noexcept {
        return dispatcher_.State();
    }

private:
    HandlerOutcome RouteGuarded(const Request& request);

    HandlerOutcome HandleInitialize(const Request& request);
    HandlerOutcome HandleInitialized(const Request& request);
    HandlerOutcome HandleToolsList(const Request& request);
    HandlerOutcome HandleToolsCall(const Request& request);

    void WarnIfUninitialized(const Request& request) const;
    std::string UnknownToolText(const std::string& name) const;

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    ServerInfo info_;
    Dispatcher dispatcher_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace sap_mcp
