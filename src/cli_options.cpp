#include "cli_options.hpp"

#include <cstdlib>

std::expected<CliOptions, std::string> parse_cli(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::unexpected(arg + " needs a path");
            opts.config_path = argv[++i];
        } else if (arg == "--history") {
            opts.show_history = true;
            if (i + 1 < argc && std::atoi(argv[i + 1]) > 0) opts.history_limit = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::unexpected("Unknown option: " + arg);
        } else if (!opts.audio_path.empty()) {
            return std::unexpected("Unexpected argument: " + arg + " (only one audio file per run)");
        } else {
            opts.audio_path = arg;
        }
    }

    return opts;
}
