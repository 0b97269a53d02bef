#pragma once

#include <string>

namespace platform {

// Maps "auto" to "gpu" or "cpu" from the device nodes present; other values
// pass through unchanged.
std::string resolve_compute_device(const std::string& requested);

} // namespace platform
