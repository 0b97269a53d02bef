#include "platform/linux/exec_decoder_probe.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

ExecDecoderProbe::ExecDecoderProbe(std::string executable)
    : executable_(std::move(executable)) {}

std::expected<void, std::string> ExecDecoderProbe::check() {
    if (executable_.empty()) {
        return std::unexpected("decoder path is not configured");
    }

    // Explicit paths are checked up front; bare names are left to execvp's PATH lookup.
    if (executable_.find('/') != std::string::npos) {
        std::error_code ec;
        if (!fs::exists(executable_, ec)) {
            return std::unexpected("decoder not found at " + executable_);
        }
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execlp(executable_.c_str(), executable_.c_str(), "-version", nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected(executable_ + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected("decoder could not be executed: " + executable_);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(executable_ + " -version exited with code " +
                               std::to_string(WEXITSTATUS(status)));
    }

    return {};
}
