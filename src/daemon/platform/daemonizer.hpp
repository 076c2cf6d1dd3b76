#pragma once

#include <string>

namespace platform {

// Detach from the controlling terminal. Returns only in the daemon process,
// with cwd "/" and stderr appended to `log_path` (or /dev/null if empty).
// Callers must resolve relative paths first.
void daemonize(const std::string& log_path);

} // namespace platform
