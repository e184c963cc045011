#include <catch2/catch_test_macros.hpp>

#include <sap_mcp/mcp/tool_registry.hpp>

#include <stdexcept>
#include <string>

using namespace sap_mcp;

namespace {

nlohmann::json EmptySchema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

std::string Echo(const nlohmann::json& args) {
    return args.value("message", std::string("(none)"));
}

} // anonymous namespace

TEST_CASE("ToolRegistry: empty registry", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK(registry.Tools().empty());
    CHECK_FALSE(registry.HasTool("echo"));
    CHECK(registry.ByName("echo") == nullptr);
    CHECK(registry.ExampleNames(4).empty());
}

TEST_CASE("ToolRegistry: Register and lookup", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo the message", EmptySchema(), Echo);

    REQUIRE(registry.HasTool("echo"));
    const auto* descriptor = registry.ByName("echo");
    REQUIRE(descriptor != nullptr);
    CHECK(descriptor->name == "echo");
    CHECK(descriptor->description == "Echo the message");
    CHECK(descriptor->input_schema["type"] == "object");
}

TEST_CASE("ToolRegistry: lookup is exact", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo", EmptySchema(), Echo);
    CHECK_FALSE(registry.HasTool("Echo"));
    CHECK_FALSE(registry.HasTool("echo "));
}

TEST_CASE("ToolRegistry: keeps registration order", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("zeta", "z", EmptySchema(), Echo);
    registry.Register("alpha", "a", EmptySchema(), Echo);
    registry.Register("mid", "m", EmptySchema(), Echo);

    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "zeta");
    CHECK(tools[1].name == "alpha");
    CHECK(tools[2].name == "mid");

    auto examples = registry.ExampleNames(2);
    REQUIRE(examples.size() == 2);
    CHECK(examples[0] == "zeta");
    CHECK(examples[1] == "alpha");
    CHECK(registry.ExampleNames(10).size() == 3);
}

TEST_CASE("ToolRegistry: configured example names", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("zeta", "z", EmptySchema(), Echo);
    registry.Register("alpha", "a", EmptySchema(), Echo);
    registry.Register("mid", "m", EmptySchema(), Echo);
    registry.SetExampleNames({"mid", "missing", "zeta", "alpha"});

    auto examples = registry.ExampleNames(4);
    REQUIRE(examples.size() == 3);
    CHECK(examples[0] == "mid");
    CHECK(examples[1] == "zeta");
    CHECK(examples[2] == "alpha");

    auto first = registry.ExampleNames(1);
    REQUIRE(first.size() == 1);
    CHECK(first[0] == "mid");
}

TEST_CASE("ToolRegistry: duplicate name throws", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo", EmptySchema(), Echo);
    CHECK_THROWS_AS(registry.Register("echo", "Again", EmptySchema(), Echo),
                    std::invalid_argument);
    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolRegistry: Invoke runs the handler", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo", EmptySchema(), Echo);

    CHECK(registry.Invoke("echo", {{"message", "hi"}}) == "hi");
    CHECK(registry.Invoke("echo", nlohmann::json::object()) == "(none)");
}

TEST_CASE("ToolRegistry: Invoke unknown tool throws", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK_THROWS_AS(registry.Invoke("missing", nlohmann::json::object()),
                    std::out_of_range);
}

TEST_CASE("ToolDescriptor: ToJson uses inputSchema", "[mcp][registry]") {
    ToolDescriptor d{"echo", "Echo", EmptySchema()};
    auto j = d.ToJson();
    CHECK(j["name"] == "echo");
    CHECK(j["description"] == "Echo");
    CHECK(j["inputSchema"]["type"] == "object");
    CHECK_FALSE(j.contains("input_schema"));
}
