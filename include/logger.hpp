// File: logger.hpp
#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel
{
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

std::string ToString(LogLevel level);

// Process-wide log sink. Each record is one JSON line. Messages follow the
// "Class::method: [streamId] text" convention; the class/method and the
// stream id are lifted into their own fields so a stream can be followed
// with a single filter.
class Logger
{
public:
    // Appends to filePath, creating its directory. Falls back to stderr only on failure.
    static void InitLogFile(const std::string &filePath);
    static void CloseLogFile();

    static void Log(LogLevel level, const std::string &msg);

    // Accepts TRACE, DEBUG, INFO, WARN/WARNING, ERROR, FATAL (case-insensitive). Throws on anything else.
    static LogLevel ParseLogLevel(const std::string &value);

    static void SetLogLevel(LogLevel level) { minLevel_ = level; }
    static LogLevel GetLogLevel() { return minLevel_; }

    // Echo every record to stderr
    static void SetDebug(bool debug) { echo_ = debug; }

    // {"timestamp","level","component","stream","message"}; component and stream only when present
    static nlohmann::json FormatRecord(LogLevel level, const std::string &msg);

private:
    static std::ofstream sink_;
    static std::mutex mutex_;
    static LogLevel minLevel_;
    static bool echo_;
};
