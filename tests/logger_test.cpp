#include <gtest/gtest.h>
#include "logger.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace swarmstream::tests {

#define TEST_CLASS Logger

    TEST(TEST_CLASS, LiftsComponentAndStreamId) {
        auto record = ::Logger::FormatRecord(LogLevel::WARN, "StreamSession::onInactivityTimeout: [1700000000000-4] No data for 15000ms.");

        EXPECT_EQ(record["level"], "WARN");
        EXPECT_EQ(record["component"], "StreamSession::onInactivityTimeout");
        EXPECT_EQ(record["stream"], "1700000000000-4");
        EXPECT_EQ(record["message"], "No data for 15000ms.");
        EXPECT_TRUE(record["timestamp"].get<std::string>().ends_with("Z"));
    }

    TEST(TEST_CLASS, PlainMessagesStayWhole) {
        auto record = ::Logger::FormatRecord(LogLevel::INFO, "swarmstream starting...");

        EXPECT_FALSE(record.contains("component"));
        EXPECT_FALSE(record.contains("stream"));
        EXPECT_EQ(record["message"], "swarmstream starting...");

        // A colon inside free text is not a component
        auto url = ::Logger::FormatRecord(LogLevel::INFO, "Fetching http://host/a.torrent: done");
        EXPECT_FALSE(url.contains("component"));
    }

    TEST(TEST_CLASS, ParsesLevels) {
        EXPECT_EQ(::Logger::ParseLogLevel("debug"), LogLevel::DEBUG);
        EXPECT_EQ(::Logger::ParseLogLevel("Warning"), LogLevel::WARN);
        EXPECT_THROW(::Logger::ParseLogLevel("verbose"), std::runtime_error);
    }

    TEST(TEST_CLASS, WritesJsonLinesAboveLevel) {
        auto path = std::filesystem::temp_directory_path() / ("swarmstream-log-" + std::to_string(::getpid())) / "test.log";
        std::filesystem::remove_all(path.parent_path());

        auto previous = ::Logger::GetLogLevel();
        ::Logger::InitLogFile(path.string());
        ::Logger::SetLogLevel(LogLevel::INFO);
        ::Logger::Log(LogLevel::DEBUG, "HttpSession::onRead: dropped");
        ::Logger::Log(LogLevel::INFO, "HttpServer::init: Listening on 127.0.0.1:8080");
        ::Logger::CloseLogFile();
        ::Logger::SetLogLevel(previous);

        std::ifstream in(path);
        std::string line;
        ASSERT_TRUE(std::getline(in, line));
        auto record = nlohmann::json::parse(line);
        EXPECT_EQ(record["component"], "HttpServer::init");
        EXPECT_EQ(record["message"], "Listening on 127.0.0.1:8080");
        EXPECT_FALSE(std::getline(in, line));

        std::filesystem::remove_all(path.parent_path());
    }
}
