#pragma once

#include <sap_mcp/mcp/tool_registry.hpp>

namespace sap_mcp {

// Register the SAP GUI automation tool catalog (22 tools) with the registry.
// The tools are simulations: each returns text built from its arguments and
// never contacts an SAP system. Absent or wrongly-typed arguments fall back
// to per-argument defaults.
void RegisterSapTools(ToolRegistry& registry);

} // namespace sap_mcp
