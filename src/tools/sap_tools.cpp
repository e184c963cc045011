#include <sap_mcp/tools/sap_tools.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace sap_mcp {

namespace {

constexpr const char* kDefaultSession = "default";

// Upper bound on simulated rows returned by sap_get_table_data.
constexpr int kMaxTableRows = 1000;

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// Get an optional text argument. Numbers and booleans are rendered as JSON
// (a client of 100 prints as "100"); other types fall back to the default.
std::string OptString(const nlohmann::json& args, const std::string& key,
                      const std::string& default_val = "") {
    auto it = args.find(key);
    if (it == args.end()) {
        return default_val;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number() || it->is_boolean()) {
        return it->dump();
    }
    return default_val;
}

// Get an optional int argument with a default value. Integers outside the
// int range fall back to the default.
int OptInt(const nlohmann::json& args, const std::string& key,
           int default_val) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number_integer()) {
        return default_val;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return default_val;
        }
        return static_cast<int>(value);
    }
    auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        return default_val;
    }
    return static_cast<int>(value);
}

bool OptBool(const nlohmann::json& args, const std::string& key,
             bool default_val) {
    auto it = args.find(key);
    if (it != args.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return default_val;
}

std::string SessionId(const nlohmann::json& args) {
    return OptString(args, "session_id", kDefaultSession);
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json StringProp(const std::string& desc, const std::string& def) {
    return {{"type", "string"}, {"description", desc}, {"default", def}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc, int def) {
    return {{"type", "integer"}, {"description", desc}, {"default", def}};
}

nlohmann::json SessionProp() {
    return StringProp("Session ID", kDefaultSession);
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json NoRequired() {
    return nlohmann::json::array();
}

// ---------------------------------------------------------------------------
// Connection & session management
// ---------------------------------------------------------------------------

std::string HandleConnect(const nlohmann::json& args) {
    return "Successfully connected to SAP system " +
           OptString(args, "system_id", "DEV") + " client " +
           OptString(args, "client", "100") + " on server " +
           OptString(args, "server", "localhost") + " with language " +
           OptString(args, "language", "EN");
}

std::string HandleDisconnect(const nlohmann::json& args) {
    return "Successfully disconnected from SAP session " + SessionId(args);
}

std::string HandleGetSessions(const nlohmann::json&) {
    return "Active SAP sessions: Session[0] - DEV/100, Session[1] - QAS/100";
}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

std::string HandleNavigate(const nlohmann::json& args) {
    return "Successfully navigated to transaction " +
           OptString(args, "transaction_code", "UNKNOWN") +
           " in session " + SessionId(args);
}

std::string HandleNavigateBack(const nlohmann::json& args) {
    return "Navigated back (F3) in session " + SessionId(args);
}

std::string HandleNavigateExit(const nlohmann::json& args) {
    return "Exited transaction (F15) in session " + SessionId(args);
}

// ---------------------------------------------------------------------------
// Fields, buttons, menus, keys
// ---------------------------------------------------------------------------

std::string HandleInputField(const nlohmann::json& args) {
    return "Successfully input '" + OptString(args, "value") +
           "' into field '" + OptString(args, "field_id", "FIELD") +
           "' in session " + SessionId(args);
}

std::string HandleGetFieldValue(const nlohmann::json& args) {
    auto field_id = OptString(args, "field_id", "FIELD");
    return "Field '" + field_id + "' value: 'VALUE_FROM_" + field_id +
           "' in session " + SessionId(args);
}

std::string HandleClearField(const nlohmann::json& args) {
    return "Successfully cleared field '" +
           OptString(args, "field_id", "FIELD") + "' in session " +
           SessionId(args);
}

std::string HandlePressButton(const nlohmann::json& args) {
    return "Successfully pressed button '" +
           OptString(args, "button_id", "BUTTON") + "' in session " +
           SessionId(args);
}

std::string HandleSelectMenu(const nlohmann::json& args) {
    return "Successfully selected menu '" +
           OptString(args, "menu_path", "Menu->Item") + "' in session " +
           SessionId(args);
}

std::string HandleSendKey(const nlohmann::json& args) {
    return "Successfully sent key '" + OptString(args, "key", "Enter") +
           "' in session " + SessionId(args);
}

// ---------------------------------------------------------------------------
// Tables
// ---------------------------------------------------------------------------

std::vector<std::string> TableColumns(const nlohmann::json& args) {
    auto it = args.find("columns");
    if (it == args.end() || !it->is_array()) {
        return {"COL1", "COL2", "COL3"};
    }
    std::vector<std::string> columns;
    for (const auto& col : *it) {
        if (col.is_string()) {
            columns.push_back(col.get<std::string>());
        }
    }
    return columns;
}

std::string HandleGetTableData(const nlohmann::json& args) {
    auto table_id = OptString(args, "table_id", "TABLE");
    auto row_start = OptInt(args, "row_start", 0);
    auto row_count = std::clamp(OptInt(args, "row_count", 10), 0, kMaxTableRows);
    auto columns = TableColumns(args);

    // ordered_json keeps the requested column order in each row.
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    const long long row_end = static_cast<long long>(row_start) + row_count;
    for (long long i = row_start; i < row_end; ++i) {
        nlohmann::ordered_json row = nlohmann::ordered_json::object();
        for (const auto& col : columns) {
            row[col] = col + "_VALUE_" + std::to_string(i);
        }
        rows.push_back(std::move(row));
    }

    return "Extracted " + std::to_string(rows.size()) + " rows from table '" +
           table_id + "': " + rows.dump();
}

std::string HandleSetTableCell(const nlohmann::json& args) {
    return "Set cell [" + std::to_string(OptInt(args, "row", 0)) + "][" +
           OptString(args, "column", "COL1") + "] = '" +
           OptString(args, "value") + "' in table '" +
           OptString(args, "table_id", "TABLE") + "' in session " +
           SessionId(args);
}

std::string HandleSelectTableRow(const nlohmann::json& args) {
    return "Selected row " + std::to_string(OptInt(args, "row", 0)) +
           " in table '" + OptString(args, "table_id", "TABLE") +
           "' (multi: " + (OptBool(args, "multi_select", false) ? "true" : "false") +
           ") in session " + SessionId(args);
}

// ---------------------------------------------------------------------------
// Screen information
// ---------------------------------------------------------------------------

std::string HandleGetScreenInfo(const nlohmann::json& args) {
    nlohmann::ordered_json info = {
        {"program", "SAPMV45A"},
        {"screen", "4001"},
        {"transaction", "VA01"},
        {"title", "Create Sales Order"},
    };
    return "Screen info for session " + SessionId(args) + ": " + info.dump();
}

std::string HandleGetStatusMessage(const nlohmann::json& args) {
    return "Status message in session " + SessionId(args) +
           ": 'Document saved successfully'";
}

std::string HandleScreenshot(const nlohmann::json& args) {
    return "Screenshot saved as '" +
           OptString(args, "filename", "sap_screenshot.png") +
           "' from session " + SessionId(args);
}

// ---------------------------------------------------------------------------
// Multi-step operations
// ---------------------------------------------------------------------------

std::string HandleExecuteTransaction(const nlohmann::json& args) {
    auto tcode = OptString(args, "transaction_code", "VA01");

    nlohmann::json steps = nlohmann::json::array();
    auto it = args.find("steps");
    if (it != args.end()) {
        if (!it->is_array()) {
            throw std::invalid_argument("'steps' must be an array");
        }
        steps = *it;
    }

    std::string executed;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        if (!step.is_object()) {
            throw std::invalid_argument("step " + std::to_string(i + 1) +
                                        " must be an object");
        }
        if (i > 0) {
            executed += "; ";
        }
        executed += "Step " + std::to_string(i + 1) + ": " +
                    OptString(step, "action", "unknown") + " on " +
                    OptString(step, "target", "unknown") + " with '" +
                    OptString(step, "value") + "'";
    }

    return "Executed transaction " + tcode + " with " +
           std::to_string(steps.size()) + " steps: " + executed;
}

std::string HandleWaitForScreen(const nlohmann::json& args) {
    return "Successfully waited for screen '" +
           OptString(args, "screen_id", "SCREEN") + "' (timeout: " +
           std::to_string(OptInt(args, "timeout", 30)) + "s) in session " +
           SessionId(args);
}

// ---------------------------------------------------------------------------
// Export & import
// ---------------------------------------------------------------------------

std::string HandleExportData(const nlohmann::json& args) {
    return "Exported data from '" + OptString(args, "data_source", "TABLE") +
           "' to '" + OptString(args, "filename", "export.csv") + "' in " +
           OptString(args, "format", "csv") + " format from session " +
           SessionId(args);
}

std::string HandleImportData(const nlohmann::json& args) {
    auto mapping = nlohmann::json::object();
    auto it = args.find("mapping");
    if (it != args.end() && it->is_object()) {
        mapping = *it;
    }
    return "Imported data from '" + OptString(args, "filename", "import.csv") +
           "' to '" + OptString(args, "target", "TABLE") + "' with mapping " +
           mapping.dump() + " in session " + SessionId(args);
}

} // anonymous namespace

void RegisterSapTools(ToolRegistry& registry) {
    // -- Connection & session management ------------------------------------

    registry.Register("sap_connect", "Connect to SAP system with credentials",
        MakeSchema({{"system_id", StringProp("SAP system ID")},
                    {"client", StringProp("SAP client number")},
                    {"username", StringProp("Username")},
                    {"password", StringProp("Password")},
                    {"server", StringProp("SAP server address")},
                    {"instance", StringProp("Instance number", "00")},
                    {"language", StringProp("Login language", "EN")}},
                   {"system_id", "client", "username", "password", "server"}),
        HandleConnect);

    registry.Register("sap_disconnect", "Disconnect from SAP system",
        MakeSchema({{"session_id", StringProp("Session ID to disconnect")}},
                   NoRequired()),
        HandleDisconnect);

    registry.Register("sap_get_sessions", "Get list of active SAP sessions",
        MakeSchema(nlohmann::json::object(), NoRequired()),
        HandleGetSessions);

    // -- Navigation ---------------------------------------------------------

    registry.Register("sap_navigate", "Navigate to SAP transaction",
        MakeSchema({{"transaction_code",
                     StringProp("Transaction code (e.g., VA01, MM01, SE80)")},
                    {"session_id", SessionProp()}},
                   {"transaction_code"}),
        HandleNavigate);

    registry.Register("sap_navigate_back", "Navigate back in SAP (F3 equivalent)",
        MakeSchema({{"session_id", SessionProp()}}, NoRequired()),
        HandleNavigateBack);

    registry.Register("sap_navigate_exit",
        "Exit current transaction (F15 equivalent)",
        MakeSchema({{"session_id", SessionProp()}}, NoRequired()),
        HandleNavigateExit);

    // -- Field operations ---------------------------------------------------

    registry.Register("sap_input_field", "Input data into a specific SAP field",
        MakeSchema({{"field_id", StringProp("Field ID or name")},
                    {"value", StringProp("Value to input")},
                    {"session_id", SessionProp()}},
                   {"field_id", "value"}),
        HandleInputField);

    registry.Register("sap_get_field_value", "Get value from a specific SAP field",
        MakeSchema({{"field_id", StringProp("Field ID or name")},
                    {"session_id", SessionProp()}},
                   {"field_id"}),
        HandleGetFieldValue);

    registry.Register("sap_clear_field", "Clear a specific SAP field",
        MakeSchema({{"field_id", StringProp("Field ID or name")},
                    {"session_id", SessionProp()}},
                   {"field_id"}),
        HandleClearField);

    // -- Buttons, menus, keys -----------------------------------------------

    registry.Register("sap_press_button", "Press a button in SAP GUI",
        MakeSchema({{"button_id", StringProp("Button ID or name")},
                    {"session_id", SessionProp()}},
                   {"button_id"}),
        HandlePressButton);

    registry.Register("sap_select_menu", "Select menu item in SAP GUI",
        MakeSchema({{"menu_path", StringProp(
                        "Menu path (e.g., 'System->User Profile->Own Data')")},
                    {"session_id", SessionProp()}},
                   {"menu_path"}),
        HandleSelectMenu);

    registry.Register("sap_send_key", "Send function key or key combination",
        MakeSchema({{"key", StringProp("Key to send (F1-F24, Enter, Escape, etc.)")},
                    {"session_id", SessionProp()}},
                   {"key"}),
        HandleSendKey);

    // -- Tables -------------------------------------------------------------

    registry.Register("sap_get_table_data", "Extract data from SAP table/grid",
        MakeSchema({{"table_id", StringProp("Table/grid ID")},
                    {"row_start", IntProp("Starting row (0-based)", 0)},
                    {"row_count", IntProp("Number of rows to extract", 10)},
                    {"columns", {{"type", "array"},
                                 {"items", {{"type", "string"}}},
                                 {"description",
                                  "Specific columns to extract (optional)"}}},
                    {"session_id", SessionProp()}},
                   {"table_id"}),
        HandleGetTableData);

    registry.Register("sap_set_table_cell", "Set value in specific table cell",
        MakeSchema({{"table_id", StringProp("Table/grid ID")},
                    {"row", IntProp("Row number (0-based)")},
                    {"column", StringProp("Column name or ID")},
                    {"value", StringProp("Value to set")},
                    {"session_id", SessionProp()}},
                   {"table_id", "row", "column", "value"}),
        HandleSetTableCell);

    registry.Register("sap_select_table_row", "Select row(s) in SAP table",
        MakeSchema({{"table_id", StringProp("Table/grid ID")},
                    {"row", IntProp("Row number (0-based)")},
                    {"multi_select", {{"type", "boolean"},
                                      {"description", "Allow multiple selection"},
                                      {"default", false}}},
                    {"session_id", SessionProp()}},
                   {"table_id", "row"}),
        HandleSelectTableRow);

    // -- Screen information -------------------------------------------------

    registry.Register("sap_get_screen_info", "Get current screen information",
        MakeSchema({{"session_id", SessionProp()}}, NoRequired()),
        HandleGetScreenInfo);

    registry.Register("sap_get_status_message", "Get current status bar message",
        MakeSchema({{"session_id", SessionProp()}}, NoRequired()),
        HandleGetStatusMessage);

    registry.Register("sap_screenshot", "Take screenshot of SAP screen",
        MakeSchema({{"filename", StringProp("Output filename", "sap_screenshot.png")},
                    {"session_id", SessionProp()}},
                   NoRequired()),
        HandleScreenshot);

    // -- Multi-step operations ----------------------------------------------

    nlohmann::json step_schema = {
        {"type", "object"},
        {"properties", {
            {"action", StringProp("Action type (input, button, key)")},
            {"target", StringProp("Target field/button ID")},
            {"value", StringProp("Value (for input actions)")}
        }}
    };
    registry.Register("sap_execute_transaction",
        "Execute complete transaction with multiple steps",
        MakeSchema({{"transaction_code", StringProp("Transaction to execute")},
                    {"steps", {{"type", "array"},
                               {"items", step_schema},
                               {"description", "List of steps to execute"}}},
                    {"session_id", SessionProp()}},
                   {"transaction_code", "steps"}),
        HandleExecuteTransaction);

    registry.Register("sap_wait_for_screen", "Wait for specific screen to load",
        MakeSchema({{"screen_id", StringProp("Screen ID to wait for")},
                    {"timeout", IntProp("Timeout in seconds", 30)},
                    {"session_id", SessionProp()}},
                   {"screen_id"}),
        HandleWaitForScreen);

    // -- Export & import ----------------------------------------------------

    registry.Register("sap_export_data", "Export SAP data to file",
        MakeSchema({{"data_source", StringProp("Data source (table, screen, etc.)")},
                    {"format", {{"type", "string"},
                                {"description", "Export format"},
                                {"enum", {"csv", "xlsx", "txt", "xml"}}}},
                    {"filename", StringProp("Output filename")},
                    {"session_id", SessionProp()}},
                   {"data_source", "format", "filename"}),
        HandleExportData);

    registry.Register("sap_import_data", "Import data into SAP from file",
        MakeSchema({{"filename", StringProp("Input filename")},
                    {"target", StringProp("Target field or table")},
                    {"mapping", {{"type", "object"},
                                 {"description", "Field mapping configuration"}}},
                    {"session_id", SessionProp()}},
                   {"filename", "target"}),
        HandleImportData);

    registry.SetExampleNames({"sap_connect", "sap_navigate", "sap_input_field",
                              "sap_get_table_data"});
}

} // namespace sap_mcp
