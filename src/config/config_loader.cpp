#include <sap_mcp/config/config_loader.hpp>

#include <sap_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>
#include <string>

namespace sap_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

Result<LogLevel, Error> ParseLevelSetting(const std::string& value,
                                          const std::string& source) {
    auto level = ParseLogLevel(value);
    if (!level) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            "Invalid " + source + ": '" + value +
            "' (expected debug, info, warn or error)"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

Result<bool, Error> ParseFormatSetting(const std::string& value) {
    if (value == "console") {
        return Result<bool, Error>::Ok(false);
    }
    if (value == "json") {
        return Result<bool, Error>::Ok(true);
    }
    return Result<bool, Error>::Err(MakeConfigError(
        "Invalid log.format: '" + value + "' (expected console or json)"));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_path = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Server --
        if (root["server"]) {
            const auto& server = root["server"];
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
        }

        // -- Logging --
        if (root["log"]) {
            const auto& log = root["log"];
            if (log["level"]) {
                auto level = ParseLevelSetting(log["level"].as<std::string>(),
                                               "log.level");
                if (level.IsErr()) {
                    return Result<AppConfig, Error>::Err(level.Error());
                }
                config.log.level = level.Value();
            }
            if (log["format"]) {
                auto json = ParseFormatSetting(log["format"].as<std::string>());
                if (json.IsErr()) {
                    return Result<AppConfig, Error>::Err(json.Error());
                }
                config.log.json = json.Value();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
            if (log["color"]) {
                config.log.color = log["color"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("sap-mcp", kVersion);
    program.add_description(
        "MCP server for SAP GUI automation over stdin/stdout (JSON-RPC 2.0).");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--server-name")
        .help("Server name reported to MCP clients");

    // Logging (always stderr or a file; stdout carries the protocol)
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    program.add_argument("--log-json")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append log output to this file instead of stderr");
    program.add_argument("--verbose")
        .help("Shorthand for --log-level info")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Shorthand for --log-level debug")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOverrides cli;

    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present("--server-name")) {
        cli.server_name = *val;
    }

    // Logging: --debug beats --verbose; an explicit --log-level beats both.
    if (program.get<bool>("--verbose")) {
        cli.log_level = LogLevel::Info;
    }
    if (program.get<bool>("--debug")) {
        cli.log_level = LogLevel::Debug;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLevelSetting(*val, "--log-level");
        if (level.IsErr()) {
            return Result<CliOverrides, Error>::Err(level.Error());
        }
        cli.log_level = level.Value();
    }
    cli.log_json = program.get<bool>("--log-json");
    if (auto val = program.present("--log-file")) {
        cli.log_file = *val;
    }

    bool force_color = program.get<bool>("--color");
    bool force_no_color = program.get<bool>("--no-color");
    if (force_color && force_no_color) {
        return Result<CliOverrides, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    if (force_color) {
        cli.log_color = true;
    } else if (force_no_color) {
        cli.log_color = false;
    }

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli_overrides) {
    AppConfig merged = base;

    if (cli_overrides.server_name.has_value()) {
        merged.server.name = *cli_overrides.server_name;
    }

    if (cli_overrides.log_level.has_value()) {
        merged.log.level = *cli_overrides.log_level;
    }
    if (cli_overrides.log_json) {
        merged.log.json = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log.file = cli_overrides.log_file;
    }
    if (cli_overrides.log_color.has_value()) {
        merged.log.color = cli_overrides.log_color;
    }
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Server name must not be empty"));
    }
    if (config.log.file.has_value() && config.log.file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Log file path must not be empty"));
    }
    return Result<void, Error>::Ok();
}

bool ResolveLogColor(const LogConfig& log, bool stderr_is_tty, bool no_color_env) {
    if (log.color.has_value()) {
        return *log.color;
    }
    if (no_color_env || log.json || log.file.has_value()) {
        return false;
    }
    return stderr_is_tty;
}

} // namespace sap_mcp
