#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty if neither $XDG_CONFIG_HOME nor
// $HOME is set.
std::string config_dir();

} // namespace platform
