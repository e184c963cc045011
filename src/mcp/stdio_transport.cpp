#include <sap_mcp/mcp/stdio_transport.hpp>

#include <sap_mcp/core/log.hpp>

namespace sap_mcp {

namespace {

constexpr const char* kWhitespace = " \t\r\n\v\f";

} // anonymous namespace

std::string TrimWhitespace(const std::string& s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

// ---------------------------------------------------------------------------
// LineReader
// ---------------------------------------------------------------------------
LineReader::LineReader(std::istream& in) : in_(in) {}

bool LineReader::Next(std::string& line) {
    std::string raw;
    while (std::getline(in_, raw)) {
        line = TrimWhitespace(raw);
        if (!line.empty()) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// ResponseWriter
// ---------------------------------------------------------------------------
ResponseWriter::ResponseWriter(std::ostream& out) : out_(out) {}

void ResponseWriter::Write(const Response& response) {
    auto line = EncodeResponse(response);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        LogError("transport", "Failed to write response to output stream");
        out_.clear();
        return;
    }
    ++lines_written_;
    LogDebug("transport", "Response: " + line);
}

} // namespace sap_mcp
