#include <catch2/catch_test_macros.hpp>

#include <sap_mcp/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace sap_mcp;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests are run from the build directory; testdata lives in the source tree.
// Use __FILE__ to get the absolute path of this test file and derive it.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOverrides, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "sap-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == "sap-automation-dev");
    CHECK(config.log.level == LogLevel::Debug);
    CHECK(config.log.json);
    REQUIRE(config.log.file.has_value());
    CHECK(*config.log.file == "/tmp/sap-mcp-test.log");
    REQUIRE(config.log.color.has_value());
    CHECK_FALSE(*config.log.color);
    REQUIRE(config.config_path.has_value());
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == kDefaultServerName);
    CHECK(config.log.level == LogLevel::Warn);
    CHECK_FALSE(config.log.json);
    CHECK_FALSE(config.log.file.has_value());
    CHECK_FALSE(config.log.color.has_value());
}

TEST_CASE("LoadFromYaml: invalid log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("loud") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid log format", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_format.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("log.format") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags sets no overrides", "[config][cli]") {
    auto result = ParseCli({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();

    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.server_name.has_value());
    CHECK_FALSE(cli.log_level.has_value());
    CHECK_FALSE(cli.log_json);
    CHECK_FALSE(cli.log_file.has_value());
    CHECK_FALSE(cli.log_color.has_value());
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseCli({"-c", "server.yaml", "--server-name", "sap-qas",
                            "--log-level", "error", "--log-json",
                            "--log-file", "mcp.log", "--no-color"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();

    REQUIRE(cli.config_path.has_value());
    CHECK(*cli.config_path == "server.yaml");
    REQUIRE(cli.server_name.has_value());
    CHECK(*cli.server_name == "sap-qas");
    REQUIRE(cli.log_level.has_value());
    CHECK(*cli.log_level == LogLevel::Error);
    CHECK(cli.log_json);
    REQUIRE(cli.log_file.has_value());
    CHECK(*cli.log_file == "mcp.log");
    REQUIRE(cli.log_color.has_value());
    CHECK_FALSE(*cli.log_color);
}

TEST_CASE("LoadFromCli: --verbose and --debug set the level", "[config][cli]") {
    CHECK(ParseCli({"--verbose"}).Value().log_level == LogLevel::Info);
    CHECK(ParseCli({"--debug"}).Value().log_level == LogLevel::Debug);
    CHECK(ParseCli({"--verbose", "--debug"}).Value().log_level == LogLevel::Debug);
    CHECK(ParseCli({"--debug", "--log-level", "warn"}).Value().log_level ==
          LogLevel::Warn);
}

TEST_CASE("LoadFromCli: default values given explicitly are overrides",
          "[config][cli]") {
    auto cli = ParseCli({"--log-level", "warn", "--server-name", "sap-automation"});
    REQUIRE(cli.IsOk());
    CHECK(cli.Value().log_level == LogLevel::Warn);
    CHECK(cli.Value().server_name == std::string("sap-automation"));
}

TEST_CASE("LoadFromCli: invalid --log-level", "[config][cli]") {
    auto result = ParseCli({"--log-level", "chatty"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--log-level") != std::string::npos);
}

TEST_CASE("LoadFromCli: --color with --no-color is rejected", "[config][cli]") {
    auto result = ParseCli({"--color", "--no-color"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: unknown flag is a parse error", "[config][cli]") {
    auto result = ParseCli({"--no-such-flag"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI values override YAML values", "[config][merge]") {
    AppConfig yaml;
    yaml.server.name = "from-yaml";
    yaml.log.level = LogLevel::Debug;
    yaml.log.file = "yaml.log";

    CliOverrides cli;
    cli.server_name = "from-cli";
    cli.log_level = LogLevel::Error;
    cli.log_color = true;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.server.name == "from-cli");
    CHECK(merged.log.level == LogLevel::Error);
    REQUIRE(merged.log.file.has_value());
    CHECK(*merged.log.file == "yaml.log");
    REQUIRE(merged.log.color.has_value());
    CHECK(*merged.log.color);
}

TEST_CASE("MergeConfigs: CLI default values still override YAML values",
          "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    REQUIRE(yaml.Value().log.level == LogLevel::Debug);

    auto cli = ParseCli({"--log-level", "warn", "--server-name", "sap-automation"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.log.level == LogLevel::Warn);
    CHECK(merged.server.name == "sap-automation");
}

TEST_CASE("MergeConfigs: no overrides keep YAML values", "[config][merge]") {
    AppConfig yaml;
    yaml.server.name = "from-yaml";
    yaml.log.level = LogLevel::Debug;
    yaml.log.json = true;

    auto merged = MergeConfigs(yaml, CliOverrides{});
    CHECK(merged.server.name == "from-yaml");
    CHECK(merged.log.level == LogLevel::Debug);
    CHECK(merged.log.json);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: default config is valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: empty server name", "[config][validate]") {
    AppConfig config;
    config.server.name = "";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Server name") != std::string::npos);
}

TEST_CASE("ValidateConfig: empty log file path", "[config][validate]") {
    AppConfig config;
    config.log.file = "";
    CHECK(ValidateConfig(config).IsErr());
}

// ===========================================================================
// ResolveLogColor
// ===========================================================================

TEST_CASE("ResolveLogColor: explicit setting wins", "[config][color]") {
    LogConfig log;
    log.color = true;
    CHECK(ResolveLogColor(log, false, true));
    log.color = false;
    CHECK_FALSE(ResolveLogColor(log, true, false));
}

TEST_CASE("ResolveLogColor: auto-detect", "[config][color]") {
    LogConfig log;
    CHECK(ResolveLogColor(log, true, false));
    CHECK_FALSE(ResolveLogColor(log, false, false));
    CHECK_FALSE(ResolveLogColor(log, true, true));   // NO_COLOR

    log.file = "mcp.log";
    CHECK_FALSE(ResolveLogColor(log, true, false));  // file output
}
