#include <sap_mcp/mcp/tool_registry.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sap_mcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) > 0) {
        throw std::invalid_argument("Tool already registered: " + name);
    }
    descriptors_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

const ToolDescriptor* ToolRegistry::ByName(const std::string& name) const {
    auto it = std::find_if(descriptors_.begin(), descriptors_.end(),
                           [&](const ToolDescriptor& d) { return d.name == name; });
    return it == descriptors_.end() ? nullptr : &*it;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

std::string ToolRegistry::Invoke(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw std::out_of_range("Unknown tool: " + name);
    }
    return it->second(arguments);
}

void ToolRegistry::SetExampleNames(std::vector<std::string> names) {
    example_names_ = std::move(names);
}

std::vector<std::string> ToolRegistry::ExampleNames(std::size_t count) const {
    std::vector<std::string> names;
    if (!example_names_.empty()) {
        for (const auto& name : example_names_) {
            if (names.size() == count) break;
            if (HasTool(name)) {
                names.push_back(name);
            }
        }
        return names;
    }
    for (const auto& d : descriptors_) {
        if (names.size() == count) break;
        names.push_back(d.name);
    }
    return names;
}

} // namespace sap_mcp
