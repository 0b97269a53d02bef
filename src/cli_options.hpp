#pragma once

#include <expected>
#include <string>

struct CliOptions {
    bool verbose = false;
    bool help = false;
    bool show_history = false;
    int history_limit = 10;
    std::string config_path;
    std::string audio_path; // empty when not given
};

// Error holds the message to print before the usage text.
std::expected<CliOptions, std::string> parse_cli(int argc, const char* const argv[]);
