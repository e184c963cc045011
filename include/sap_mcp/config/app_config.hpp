#pragma once

#include <sap_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace sap_mcp {

constexpr const char* kDefaultServerName = "sap-automation";

struct ServerConfig {
    std::string name = kDefaultServerName;  // reported as serverInfo.name
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;                       // JSON lines instead of console text
    std::optional<std::string> file;         // default: stderr
    std::optional<bool> color;               // default: auto-detect
};

struct AppConfig {
    ServerConfig server;
    LogConfig log;
    std::optional<std::string> config_path;  // -c/--config
};

// Settings given on the command line. Unset fields keep the value from the
// YAML file or the default.
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> server_name;
    std::optional<LogLevel> log_level;
    bool log_json = false;                   // --log-json only switches on
    std::optional<std::string> log_file;
    std::optional<bool> log_color;
};

} // namespace sap_mcp
