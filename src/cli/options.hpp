#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

struct CliOptions {
    std::string config_path;
    std::optional<std::string> state_path;
    std::optional<std::string> log_file;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

// Parse argv (without argv[0]). --help and --version short-circuit the
// --config requirement.
Result<CliOptions> parse_cli_options(const std::vector<std::string>& args);
