#pragma once
#include <memory>
#include <mutex>
#include <string_view>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* to_string(LogLevel level);

// Logging sink handed to every provider, stream session and feed.
// Lines are tagged by component ("alpaca-rest", "alpaca-ws", "stream", ...).
struct ILogger {
    virtual ~ILogger() = default;
    virtual void log(LogLevel level, std::string_view tag, std::string_view msg) = 0;

    void debug(std::string_view tag, std::string_view msg) { log(LogLevel::Debug, tag, msg); }
    void info(std::string_view tag, std::string_view msg)  { log(LogLevel::Info, tag, msg); }
    void warn(std::string_view tag, std::string_view msg)  { log(LogLevel::Warn, tag, msg); }
    void error(std::string_view tag, std::string_view msg) { log(LogLevel::Error, tag, msg); }
};

// "[tag] message" lines; info and below to stdout, warnings and errors to stderr.
// With info_to_stdout == false every line goes to stderr (stdout carries data).
class StderrLogger final : public ILogger {
public:
    explicit StderrLogger(LogLevel min_level = LogLevel::Info, bool info_to_stdout = true)
        : min_level_(min_level), info_to_stdout_(info_to_stdout) {}

    void log(LogLevel level, std::string_view tag, std::string_view msg) override;

private:
    LogLevel min_level_;
    bool info_to_stdout_;
    std::mutex m_;
};

class NullLogger final : public ILogger {
public:
    void log(LogLevel, std::string_view, std::string_view) override {}
};

// Process-wide StderrLogger used when a caller does not inject one.
std::shared_ptr<ILogger> default_logger();
