#include <iostream>
#include <string>
#include <vector>
#include "cli/options.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"
#include "core/errors.hpp"
#include "core/run_log.hpp"
#include "ssh/sftp_store.hpp"
#include "sync/sync_runner.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << "    sftpfetch --config <path> [--state <path>]\n\n";
    std::cout << theme::kv("-c, --config", "Run config (JSON, or YAML by extension)");
    std::cout << theme::kv("-s, --state", "Ledger file for incremental_mode");
    std::cout << theme::kv("--log-file", "Also append log lines to this file");
    std::cout << theme::kv("-v, --verbose", "Include debug lines");
    std::cout << theme::kv("--version", "Show version");
    std::cout << theme::kv("-h, --help", "Show this help");
    std::cout << "\n";
}

static void print_report(const SyncReport& report, int warnings) {
    std::cout << theme::section("Sync complete");
    std::cout << theme::kv("downloaded", std::to_string(report.downloaded));
    if (report.skipped > 0) std::cout << theme::kv("over cap", std::to_string(report.skipped));
    std::cout << theme::kv("remote deleted", std::to_string(report.remote_deleted));
    if (report.left_behind > 0) std::cout << theme::kv("left on remote", std::to_string(report.left_behind));
    if (report.kept > 0 || report.discarded > 0) {
        std::cout << theme::kv("kept", std::to_string(report.kept));
        std::cout << theme::kv("already synced", std::to_string(report.discarded));
    }
    if (warnings > 0) std::cout << theme::kv("warnings", std::to_string(warnings));
    std::cout << "\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_cli_options(args);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error);
        print_usage();
        return EXIT_USAGE;
    }
    const CliOptions& opts = parsed.value;

    if (opts.show_version) {
        std::cout << SFTPFETCH_NAME << " version " << SFTPFETCH_VERSION << "\n";
        return 0;
    }
    if (opts.show_help) {
        print_usage();
        return 0;
    }

    RunLog log(std::cerr, opts.verbose);
    if (opts.log_file && !log.add_file(*opts.log_file)) {
        std::cerr << theme::fail("Cannot open log file: " + *opts.log_file);
        return EXIT_USAGE;
    }

    try {
        SyncRunner runner(&SftpStore::connect, log);
        std::optional<fs::path> state;
        if (opts.state_path) state = fs::path(*opts.state_path);

        auto report = runner.run_file(opts.config_path, state);
        print_report(report, log.warnings());
        return 0;
    } catch (const ConfigurationError& e) {
        log.error(std::string("Configuration error: ") + e.what());
        std::cerr << theme::fail(e.what());
        return EXIT_RUN_FAILED;
    } catch (const std::exception& e) {
        log.error(e.what());
        std::cerr << theme::fail(e.what());
        return EXIT_RUN_FAILED;
    }
}
