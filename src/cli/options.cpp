#include "options.hpp"

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        // --flag=value form
        std::string flag = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        auto take_value = [&](std::string& out) -> bool {
            if (inline_value) { out = *inline_value; return !out.empty(); }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (flag == "--help" || flag == "-h") {
            opts.show_help = true;
        } else if (flag == "--version") {
            opts.show_version = true;
        } else if (flag == "--verbose" || flag == "-v") {
            opts.verbose = true;
        } else if (flag == "--config" || flag == "-c") {
            if (!take_value(opts.config_path)) return Result<CliOptions>::Err("--config needs a path");
        } else if (flag == "--state" || flag == "-s") {
            std::string v;
            if (!take_value(v)) return Result<CliOptions>::Err("--state needs a path");
            opts.state_path = v;
        } else if (flag == "--log-file") {
            std::string v;
            if (!take_value(v)) return Result<CliOptions>::Err("--log-file needs a path");
            opts.log_file = v;
        } else {
            return Result<CliOptions>::Err("Unknown argument: " + arg);
        }
    }

    if (!opts.show_help && !opts.show_version && opts.config_path.empty()) {
        return Result<CliOptions>::Err("the following arguments are required: --config");
    }
    return Result<CliOptions>::Ok(opts);
}
