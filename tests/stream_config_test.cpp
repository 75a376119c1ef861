#include <gtest/gtest.h>
#include "stream_config.hpp"
#include <stdexcept>

namespace swarmstream::tests {

#define TEST_CLASS StreamConfig

    TEST(TEST_CLASS, DefaultsMatchStandardProfile) {
        ServerConfig config;

        EXPECT_EQ(config.port, "8080");
        EXPECT_EQ(config.stream.maxChunkSize, 1024u * 1024u);
        EXPECT_EQ(config.stream.streamTimeout, std::chrono::milliseconds(15000));
        EXPECT_EQ(config.stream.globalTimeout, std::chrono::milliseconds(60000));
        EXPECT_EQ(config.stream.resolverTimeout, std::chrono::milliseconds(5000));
        EXPECT_EQ(config.stream.priorityPieces, 3u);
        EXPECT_TRUE(config.stream.prioritizeSeeks);
        EXPECT_FALSE(config.stream.rejectUnsatisfiableRanges);
        EXPECT_NO_THROW(config.stream.validate());
    }

    TEST(TEST_CLASS, LowResourceProfile) {
        ::StreamConfig stream;
        stream.applyProfile("low-resource");

        EXPECT_EQ(stream.maxChunkSize, 256u * 1024u);
        EXPECT_EQ(stream.streamTimeout, std::chrono::milliseconds(20000));
        EXPECT_TRUE(stream.rejectUnsatisfiableRanges);

        stream.applyProfile("standard");
        EXPECT_EQ(stream.maxChunkSize, 1024u * 1024u);
        EXPECT_FALSE(stream.rejectUnsatisfiableRanges);

        EXPECT_THROW(stream.applyProfile("turbo"), std::runtime_error);
    }

    TEST(TEST_CLASS, DocumentOverridesDefaults) {
        ServerConfig config;
        loadConfigFromString(R"({
            "host": "127.0.0.1",
            "port": 9090,
            "logLevel": "debug",
            "streaming": {
                "profile": "low-resource",
                "maxChunkSize": 524288,
                "resolverTimeoutMs": 2500
            },
            "torrent": {
                "savePath": "/tmp/swarm",
                "pieceDeadlineMs": 500,
                "trackers": ["udp://tracker.example:1337/announce"]
            }
        })", config);

        EXPECT_EQ(config.host, "127.0.0.1");
        EXPECT_EQ(config.port, "9090");
        EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
        // Explicit keys win over the profile
        EXPECT_EQ(config.stream.maxChunkSize, 524288u);
        EXPECT_EQ(config.stream.streamTimeout, std::chrono::milliseconds(20000));
        EXPECT_TRUE(config.stream.rejectUnsatisfiableRanges);
        EXPECT_EQ(config.stream.resolverTimeout, std::chrono::milliseconds(2500));
        EXPECT_EQ(config.torrent.savePath, "/tmp/swarm");
        EXPECT_EQ(config.torrent.pieceDeadlineMs, 500);
        ASSERT_EQ(config.torrent.trackers.size(), 1u);
        EXPECT_EQ(config.torrent.trackers[0], "udp://tracker.example:1337/announce");
    }

    TEST(TEST_CLASS, SourceReclaimAndPortMappingSwitches) {
        ServerConfig config;
        EXPECT_TRUE(config.stream.reclaimIdleSources);
        EXPECT_TRUE(config.torrent.enablePortMapping);

        loadConfigFromString(R"({
            "streaming": { "reclaimIdleSources": false, "sourceIdleThresholdMs": 60000 },
            "torrent": { "enableDht": false, "enablePortMapping": false }
        })", config);

        EXPECT_FALSE(config.stream.reclaimIdleSources);
        EXPECT_EQ(config.stream.sourceIdleThreshold, std::chrono::milliseconds(60000));
        EXPECT_FALSE(config.torrent.enableDht);
        EXPECT_FALSE(config.torrent.enablePortMapping);
    }

    TEST(TEST_CLASS, PortAsString) {
        ServerConfig config;
        loadConfigFromString(R"({"port": "7000"})", config);

        EXPECT_EQ(config.port, "7000");
    }

    TEST(TEST_CLASS, RejectsBadDocuments) {
        ServerConfig config;

        EXPECT_THROW(loadConfigFromString("{not json", config), std::runtime_error);
        EXPECT_THROW(loadConfigFromString(R"({"streaming": {"profile": "turbo"}})", config), std::runtime_error);
        EXPECT_THROW(loadConfigFromString(R"({"streaming": {"maxChunkSize": "big"}})", config), std::runtime_error);
        EXPECT_THROW(loadConfigFromString(R"({"streaming": {"maxChunkSize": 0}})", config), std::runtime_error);
        EXPECT_THROW(loadConfigFromString(R"({"logLevel": "loud"})", config), std::runtime_error);
    }

    TEST(TEST_CLASS, MissingFileThrows) {
        ServerConfig config;

        EXPECT_THROW(loadConfig("/nonexistent/swarmstream.json", config), std::runtime_error);
    }

    TEST(TEST_CLASS, ValidateRejectsNonPositiveValues) {
        ::StreamConfig stream;
        stream.readChunkSize = 0;
        EXPECT_THROW(stream.validate(), std::runtime_error);

        stream = ::StreamConfig();
        stream.globalTimeout = std::chrono::milliseconds(0);
        EXPECT_THROW(stream.validate(), std::runtime_error);

        stream = ::StreamConfig();
        stream.priorityPieces = 0;
        EXPECT_THROW(stream.validate(), std::runtime_error);

        stream.prioritizeSeeks = false;
        EXPECT_NO_THROW(stream.validate());
    }
}
