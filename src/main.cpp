#include <sap_mcp/config/config_loader.hpp>
#include <sap_mcp/core/log.hpp>
#include <sap_mcp/core/terminal.hpp>
#include <sap_mcp/core/version.hpp>
#include <sap_mcp/mcp/mcp_server.hpp>
#include <sap_mcp/tools/sap_tools.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

// Server currently in Run(); the signal handler only touches its atomic flag.
sap_mcp::McpServer* g_server = nullptr;

extern "C" void OnStopSignal(int /*signo*/) {
    if (g_server != nullptr) {
        g_server->RequestStop();
    }
}

// SIGINT/SIGTERM stop the loop. Without SA_RESTART the blocking read on
// stdin fails with EINTR, so Run() returns without waiting for more input.
void InstallSignalHandlers() {
#ifdef _WIN32
    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);
#else
    struct sigaction action {};
    action.sa_handler = OnStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // A vanished client shows up as a failed write, not a fatal signal.
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

void PrintError(const sap_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Apply the CLI flags on top of the YAML file named by -c/--config, or on
// top of the defaults when there is none.
sap_mcp::Result<sap_mcp::AppConfig, sap_mcp::Error> ApplyConfigFile(
    sap_mcp::CliOverrides cli) {
    using R = sap_mcp::Result<sap_mcp::AppConfig, sap_mcp::Error>;
    if (!cli.config_path.has_value()) {
        return R::Ok(sap_mcp::MergeConfigs(sap_mcp::AppConfig{}, cli));
    }
    auto yaml = sap_mcp::LoadFromYaml(*cli.config_path);
    if (yaml.IsErr()) {
        return yaml;
    }
    return R::Ok(sap_mcp::MergeConfigs(yaml.Value(), cli));
}

sap_mcp::Result<sap_mcp::AppConfig, sap_mcp::Error> Validated(
    sap_mcp::AppConfig config) {
    using R = sap_mcp::Result<sap_mcp::AppConfig, sap_mcp::Error>;
    auto valid = sap_mcp::ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(config));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace sap_mcp;

    auto loaded = LoadFromCli(argc, argv)
                      .AndThen(ApplyConfigFile)
                      .AndThen(Validated);
    if (loaded.IsErr()) {
        PrintError(loaded.Error());
        return loaded.Error().ExitCode();
    }
    const auto config = std::move(loaded).Value();

    // Logging goes to stderr or a file. stdout belongs to the protocol.
    std::ofstream log_file;
    std::ostream* log_out = &std::cerr;
    if (config.log.file.has_value()) {
        log_file.open(*config.log.file, std::ios::app);
        if (!log_file) {
            Error error{"OpenLogFile", "Cannot open log file: " + *config.log.file,
                        ErrorCategory::Io};
            PrintError(error);
            return error.ExitCode();
        }
        log_out = &log_file;
    }

    if (config.log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(*log_out), config.log.level);
    } else if (ResolveLogColor(config.log, IsStderrTty(), NoColorEnvSet())) {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(true, *log_out),
                         config.log.level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(*log_out), config.log.level);
    }

    if (config.config_path.has_value()) {
        LogInfo("main", "Loaded config from " + *config.config_path);
    }

    ToolRegistry registry;
    RegisterSapTools(registry);

    ServerInfo info;
    info.name = config.server.name;
    info.version = kVersion;

    McpServer server(std::move(registry), std::cin, std::cout, std::move(info));
    g_server = &server;
    InstallSignalHandlers();

    server.Run();

    g_server = nullptr;
    return kExitSuccess;
}
