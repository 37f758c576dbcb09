#include "run_log.hpp"
#include "constants.hpp"
#include "utils.hpp"

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::WARNING: return "WARNING";
    case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

RunLog::RunLog(std::ostream& out, bool verbose)
    : out_(out), verbose_(verbose) {
}

bool RunLog::add_file(const std::string& path) {
    file_.open(path, std::ios::app);
    return static_cast<bool>(file_);
}

void RunLog::log(LogLevel level, const std::string& msg) {
    if (level == LogLevel::DEBUG && !verbose_) return;
    if (level == LogLevel::WARNING) warnings_++;

    std::string line = fmt::format("{} - {} - {} - {}\n",
                                   now_iso(), SFTPFETCH_NAME, log_level_name(level), msg);
    out_ << line;
    out_.flush();
    if (file_) {
        file_ << line;
        file_.flush();
    }
}

StatusCallback RunLog::status(LogLevel level) {
    return [this, level](const std::string& msg) { log(level, msg); };
}
