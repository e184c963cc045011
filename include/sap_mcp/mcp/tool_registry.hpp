#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sap_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor — what tools/list reports for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"name", name},
                {"description", description},
                {"inputSchema", input_schema}};
    }
};

// A tool handler takes the call's arguments object and returns result text.
// Handlers may throw; the server turns the exception into an error response.
using ToolHandler = std::function<std::string(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — ordered registry of MCP tools.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Throws std::invalid_argument if a tool with the same name exists.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    // Descriptors in registration order.
    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    // Exact-match lookup; nullptr if no such tool.
    [[nodiscard]] const ToolDescriptor* ByName(const std::string& name) const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Run a tool. Throws std::out_of_range for an unknown name.
    [[nodiscard]] std::string Invoke(const std::string& name,
                                     const nlohmann::json& arguments) const;

    // Names quoted when a caller asks for an unknown tool. Unregistered
    // names are skipped by ExampleNames().
    void SetExampleNames(std::vector<std::string> names);

    // Up to `count` example names: the configured ones, or else the first
    // tools in registration order.
    [[nodiscard]] std::vector<std::string> ExampleNames(std::size_t count) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
    std::vector<std::string> example_names_;
};

} // namespace sap_mcp
