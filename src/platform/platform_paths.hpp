#pragma once

#include <string>

namespace platform {

// Empty string when neither XDG nor HOME is set.
std::string config_dir();
std::string data_dir();

} // namespace platform
