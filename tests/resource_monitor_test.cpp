#include <gtest/gtest.h>
#include "resource_monitor.hpp"
#include <boost/asio/io_context.hpp>
#include <string>
#include <vector>

namespace swarmstream::tests {

#define TEST_CLASS ResourceMonitor

    namespace {
        using namespace std::chrono_literals;
    }

    TEST(TEST_CLASS, CheckNowReportsStaleStreams) {
        boost::asio::io_context ioc;
        ResourceRegistry registry(50ms, 30min);
        auto monitor = std::make_shared<::ResourceMonitor>(ioc, registry, 1s);

        StreamSnapshot stream;
        stream.streamId = "s1";
        stream.sourceId = "abc";
        stream.fileName = "movie.mp4";
        stream.startedAt = RegistryClock::now() - 1s;
        stream.lastActivity = stream.startedAt;
        registry.registerStream(stream);

        auto snapshot = monitor->checkNow();

        EXPECT_EQ(snapshot.open, 1u);
        ASSERT_EQ(snapshot.leakCandidates.size(), 1u);
        EXPECT_EQ(snapshot.leakCandidates[0].streamId, "s1");
        // Reporting never closes the stream
        EXPECT_TRUE(registry.contains("s1"));
    }

    TEST(TEST_CLASS, ReclaimsIdleSourcesWithoutOpenStreams) {
        boost::asio::io_context ioc;
        ResourceRegistry registry(2min, 10ms);
        auto monitor = std::make_shared<::ResourceMonitor>(ioc, registry, 1s);

        auto past = RegistryClock::now() - 1s;
        registry.recordSourceActivity("old", "Old Show", past);
        registry.recordSourceActivity("kept", "Kept Show", past);

        // Stalled stream: its source looks idle but is in use
        StreamSnapshot stream;
        stream.streamId = "s1";
        stream.sourceId = "busy";
        stream.sourceName = "Busy Show";
        stream.fileName = "movie.mp4";
        stream.startedAt = past;
        stream.lastActivity = past;
        registry.registerStream(stream);

        std::vector<std::string> offered;
        monitor->setReclaimer([&offered](const std::vector<std::string> &sourceIds) {
            offered = sourceIds;
            // "kept" is refused, as a session does for a source with a pending resolve
            return std::vector<std::string>{"old"};
        });

        auto snapshot = monitor->checkNow();
        EXPECT_EQ(snapshot.idleSources.size(), 3u);
        EXPECT_EQ(offered, (std::vector<std::string>{"kept", "old"}));

        auto after = registry.snapshot();
        std::vector<std::string> idle;
        for (const auto &source : after.idleSources) {
            idle.push_back(source.sourceId);
        }
        EXPECT_EQ(idle, (std::vector<std::string>{"busy", "kept"}));
        EXPECT_TRUE(registry.contains("s1"));
    }

    TEST(TEST_CLASS, NoReclaimerOnlyReports) {
        boost::asio::io_context ioc;
        ResourceRegistry registry(2min, 10ms);
        auto monitor = std::make_shared<::ResourceMonitor>(ioc, registry, 1s);
        registry.recordSourceActivity("old", "Old Show", RegistryClock::now() - 1s);

        EXPECT_EQ(monitor->checkNow().idleSources.size(), 1u);
        EXPECT_EQ(monitor->checkNow().idleSources.size(), 1u);
    }

    TEST(TEST_CLASS, PeriodicCheckStopsOnRequest) {
        boost::asio::io_context ioc;
        ResourceRegistry registry(2min, 30min);
        auto monitor = std::make_shared<::ResourceMonitor>(ioc, registry, 10ms);

        monitor->start();
        ioc.run_for(50ms);
        monitor->stop();

        // Pending wait is cancelled, nothing else keeps the loop alive
        ioc.restart();
        ioc.run_for(1s);
        EXPECT_TRUE(ioc.stopped());
    }
}
