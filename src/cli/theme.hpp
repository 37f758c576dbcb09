#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Colors only when stdout is a terminal; summaries are often piped to files
inline bool use_color() {
    static const bool tty = isatty(STDOUT_FILENO) != 0;
    return tty;
}

inline std::string paint(const std::string& c, const std::string& s) {
    return use_color() ? c + s + color::RESET : s;
}

// Section header, padded by blank lines
inline std::string section(const std::string& title) {
    return "\n" + paint(color::BLUE + color::BOLD, "  " + title) + "\n\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "    x ") + msg + "\n";
}

// Key-value row for the run summary
inline std::string kv(const std::string& key, const std::string& value) {
    return paint(color::DIM, fmt::format("    {:<16}", key)) + value + "\n";
}

} // namespace theme
