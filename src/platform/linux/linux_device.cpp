#include "platform/compute_device.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace platform {

std::string resolve_compute_device(const std::string& requested) {
    if (requested != "auto") return requested;

    std::error_code ec;
    if (fs::exists("/dev/nvidiactl", ec) || fs::exists("/dev/dri/renderD128", ec)) {
        return "gpu";
    }
    return "cpu";
}

} // namespace platform
