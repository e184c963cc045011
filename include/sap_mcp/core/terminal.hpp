#pragma once

namespace sap_mcp {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace sap_mcp
