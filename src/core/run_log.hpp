#pragma once

#include <string>
#include <fstream>
#include <ostream>
#include <fmt/format.h>
#include "types.hpp"

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

const char* log_level_name(LogLevel level);

// Logging context for one process invocation. Created in main() and passed
// by reference to every component that reports progress; there is no global logger.
//
// Line format: "2026-01-15T10:00:00 - sftpfetch - INFO - message"
class RunLog {
public:
    // Writes to `out` (stderr in main). DEBUG lines are dropped unless verbose.
    explicit RunLog(std::ostream& out, bool verbose = false);

    // Also append every emitted line to a file. Returns false if it can't be opened.
    bool add_file(const std::string& path);

    void log(LogLevel level, const std::string& msg);

    void debug(const std::string& msg)   { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)    { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg)   { log(LogLevel::ERROR, msg); }

    template <typename Arg, typename... Args>
    void info(fmt::format_string<Arg, Args...> f, Arg&& arg, Args&&... args) {
        info(fmt::format(f, std::forward<Arg>(arg), std::forward<Args>(args)...));
    }

    template <typename Arg, typename... Args>
    void debug(fmt::format_string<Arg, Args...> f, Arg&& arg, Args&&... args) {
        if (verbose_) debug(fmt::format(f, std::forward<Arg>(arg), std::forward<Args>(args)...));
    }

    template <typename Arg, typename... Args>
    void warning(fmt::format_string<Arg, Args...> f, Arg&& arg, Args&&... args) {
        warning(fmt::format(f, std::forward<Arg>(arg), std::forward<Args>(args)...));
    }

    // Adapter for layers that report progress through a StatusCallback.
    StatusCallback status(LogLevel level = LogLevel::DEBUG);

    int warnings() const { return warnings_; }

private:
    std::ostream& out_;
    std::ofstream file_;
    bool verbose_;
    int warnings_ = 0;
};
