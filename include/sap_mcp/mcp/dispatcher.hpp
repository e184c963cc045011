#pragma once

#include <sap_mcp/core/result.hpp>
#include <sap_mcp/mcp/json_rpc.hpp>

#include <functional>
#include <map>
#include <optional>

#include <nlohmann/json.hpp>

namespace sap_mcp {

// ---------------------------------------------------------------------------
// LifecycleState — MCP handshake state of one server session.
// Uninitialized -> Initialized on the first successful initialize; never
// reset for the rest of the session.
// ---------------------------------------------------------------------------
enum class LifecycleState {
    Uninitialized,
    Initialized,
};

const char* LifecycleStateName(LifecycleState state);

// A handler yields a result payload, nothing (for notification-only methods),
// or an RpcError.
using HandlerOutcome = Result<std::optional<nlohmann::json>, RpcError>;
using MethodHandler = std::function<HandlerOutcome(const Request& request)>;

// ---------------------------------------------------------------------------
// Dispatcher — method table plus session lifecycle state.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    // Bind a handler to a method. Registering Method::Unknown has no effect:
    // unknown methods always route to a method-not-found error.
    void Register(Method method, MethodHandler handler);

    // Invoke the handler for request.kind, or return a method-not-found error.
    // Exceptions thrown by the handler propagate to the caller.
    [[nodiscard]] HandlerOutcome Route(const Request& request);

    [[nodiscard]] LifecycleState State() const noexcept { return state_; }
    void MarkInitialized() noexcept { state_ = LifecycleState::Initialized; }

private:
    std::map<Method, MethodHandler> handlers_;
    LifecycleState state_ = LifecycleState::Uninitialized;
};

} // namespace sap_mcp
