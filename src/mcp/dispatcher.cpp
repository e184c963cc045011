#include <sap_mcp/mcp/dispatcher.hpp>

#include <utility>

namespace sap_mcp {

const char* LifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::Initialized:   return "initialized";
    }
    return "unknown";
}

void Dispatcher::Register(Method method, MethodHandler handler) {
    if (method == Method::Unknown) {
        return;
    }
    handlers_[method] = std::move(handler);
}

HandlerOutcome Dispatcher::Route(const Request& request) {
    auto it = handlers_.find(request.kind);
    if (it == handlers_.end()) {
        return HandlerOutcome::Err(RpcError::MethodNotFound(request.method));
    }
    return it->second(request);
}

} // namespace sap_mcp
