#pragma once

#include <sap_mcp/config/app_config.hpp>
#include <sap_mcp/core/result.hpp>

#include <string_view>

namespace sap_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into the set of explicit overrides.
// --help and --version print and exit.
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of a base config (YAML file or defaults).
// Every field set in cli_overrides replaces the base value.
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli_overrides);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Decide whether log output gets ANSI colors: an explicit setting wins,
// NO_COLOR disables, otherwise color only when writing to a stderr terminal.
bool ResolveLogColor(const LogConfig& log, bool stderr_is_tty, bool no_color_env);

} // namespace sap_mcp
