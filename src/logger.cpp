// File: logger.cpp
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::ofstream Logger::sink_;
std::mutex Logger::mutex_;
LogLevel Logger::minLevel_ = LogLevel::INFO;
bool Logger::echo_ = false;

std::string ToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::FATAL:
        return "FATAL";
    }
    return "UNKNOWN";
}

namespace
{
    // UTC, millisecond precision: 2024-05-01T12:00:00.123Z
    std::string utcTimestamp()
    {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return oss.str();
    }

    bool isComponent(const std::string &text)
    {
        if (text.find("::") == std::string::npos)
            return false;
        return std::all_of(text.begin(), text.end(), [](unsigned char c)
                           { return std::isalnum(c) || c == '_' || c == ':' || c == '~'; });
    }
}

nlohmann::json Logger::FormatRecord(LogLevel level, const std::string &msg)
{
    nlohmann::json record;
    record["timestamp"] = utcTimestamp();
    record["level"] = ToString(level);

    std::string rest = msg;
    auto colon = rest.find(": ");
    if (colon != std::string::npos && isComponent(rest.substr(0, colon)))
    {
        record["component"] = rest.substr(0, colon);
        rest = rest.substr(colon + 2);
    }

    if (rest.size() > 2 && rest.front() == '[')
    {
        auto close = rest.find("] ");
        if (close != std::string::npos && close > 1)
        {
            record["stream"] = rest.substr(1, close - 1);
            rest = rest.substr(close + 2);
        }
    }

    record["message"] = rest;
    return record;
}

void Logger::InitLogFile(const std::string &filePath)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_.is_open())
    {
        sink_.close();
    }

    std::error_code ec;
    auto directory = std::filesystem::path(filePath).parent_path();
    if (!directory.empty())
    {
        std::filesystem::create_directories(directory, ec);
    }

    sink_.open(filePath, std::ios::app);
    if (!sink_.good())
    {
        std::cerr << "[ERROR] Logger::InitLogFile: Could not open " << filePath
                  << (ec ? " (" + ec.message() + ")" : std::string()) << std::endl;
    }
}

void Logger::CloseLogFile()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_.is_open())
    {
        sink_.flush();
        sink_.close();
    }
}

LogLevel Logger::ParseLogLevel(const std::string &value)
{
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR")
        return LogLevel::ERROR;
    if (upper == "FATAL")
        return LogLevel::FATAL;

    throw std::runtime_error("Unknown log level: " + value);
}

void Logger::Log(LogLevel level, const std::string &msg)
{
    if (level < minLevel_)
    {
        return;
    }

    // Request targets are client-controlled and may not be valid UTF-8
    std::string line = FormatRecord(level, msg).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    if (echo_)
    {
        std::cerr << "[" << ToString(level) << "] " << msg << std::endl;
    }
    if (sink_.is_open())
    {
        sink_ << line << '\n';
        if (level >= LogLevel::WARN)
        {
            sink_.flush();
        }
    }
}
