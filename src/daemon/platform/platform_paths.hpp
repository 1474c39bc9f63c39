#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty if it cannot be determined.
std::string config_dir();

// Per-user data directory (whisper bundle lives here by default).
std::string data_dir();

std::string ipc_endpoint();

// Base directory for private scratch locations holding raw audio.
std::string temp_root();

} // namespace platform
