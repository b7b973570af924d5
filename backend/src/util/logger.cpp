#include "logger.hpp"

#include <iostream>

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

void StderrLogger::log(LogLevel level, std::string_view tag, std::string_view msg) {
    if (level < min_level_) return;

    std::lock_guard<std::mutex> lk(m_);
    std::ostream& os = (level >= LogLevel::Warn || !info_to_stdout_) ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if (level == LogLevel::Warn) os << "warning: ";
    if (level == LogLevel::Error) os << "error: ";
    os << msg << std::endl;
}

std::shared_ptr<ILogger> default_logger() {
    static std::shared_ptr<ILogger> logger = std::make_shared<StderrLogger>();
    return logger;
}
