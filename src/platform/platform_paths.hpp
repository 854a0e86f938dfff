#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if no home directory is known.
std::string config_dir();

// Directory for per-attempt scratch files (transcoder input and output).
std::string scratch_dir();

} // namespace platform
