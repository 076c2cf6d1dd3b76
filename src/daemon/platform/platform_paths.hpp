#pragma once

#include <string>

namespace platform {

// Per-user config directory, empty if it cannot be determined.
std::string config_dir();

// Per-user data directory (history database), empty if unknown.
std::string data_dir();

// Address the daemon listens on and the client connects to.
std::string ipc_endpoint();

// Where a detached daemon's stderr goes. Empty if no data directory.
std::string daemon_log_path();

} // namespace platform
