#pragma once

#include <sap_mcp/mcp/json_rpc.hpp>

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace sap_mcp {

// ---------------------------------------------------------------------------
// LineReader — yields trimmed, non-blank lines from an input stream.
// Finite: Next() returns false once the stream is exhausted or fails.
// ---------------------------------------------------------------------------
class LineReader {
public:
    explicit LineReader(std::istream& in);

    // Read the next non-blank line into `line`. Returns false at end of stream.
    bool Next(std::string& line);

private:
    std::istream& in_;
};

// ---------------------------------------------------------------------------
// ResponseWriter — writes one response per line and flushes immediately.
// ---------------------------------------------------------------------------
class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out);

    void Write(const Response& response);

    [[nodiscard]] std::size_t LinesWritten() const noexcept { return lines_written_; }

private:
    std::ostream& out_;
    std::size_t lines_written_ = 0;
};

// Strip leading and trailing whitespace (spaces, tabs, CR, LF, VT, FF).
[[nodiscard]] std::string TrimWhitespace(const std::string& s);

} // namespace sap_mcp
