#include <gtest/gtest.h>
#include "resource_tracker.hpp"

namespace swarmstream::tests {

#define TEST_CLASS ResourceRegistry

    namespace {
        using namespace std::chrono_literals;

        StreamSnapshot makeStream(const std::string &id, RegistryClock::time_point at, const std::string &sourceId = "abc")
        {
            StreamSnapshot snapshot;
            snapshot.streamId = id;
            snapshot.sourceId = sourceId;
            snapshot.sourceName = "Some Movie";
            snapshot.fileName = "movie.mp4";
            snapshot.startedAt = at;
            snapshot.lastActivity = at;
            return snapshot;
        }
    }

    TEST(TEST_CLASS, TracksOpenStreamsAndOutcomes) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();

        registry.registerStream(makeStream("s1", now));
        registry.registerStream(makeStream("s2", now));
        registry.registerStream(makeStream("s3", now));
        EXPECT_EQ(registry.openCount(), 3u);
        EXPECT_TRUE(registry.contains("s2"));

        EXPECT_TRUE(registry.unregisterStream("s1", StreamState::COMPLETED));
        EXPECT_TRUE(registry.unregisterStream("s2", StreamState::DISCONNECTED));
        EXPECT_TRUE(registry.unregisterStream("s3", StreamState::TIMED_OUT));
        EXPECT_FALSE(registry.unregisterStream("s3", StreamState::ERRORED));

        auto snapshot = registry.snapshot(now);
        EXPECT_EQ(snapshot.open, 0u);
        EXPECT_EQ(snapshot.opened, 3u);
        EXPECT_EQ(snapshot.closed, 3u);
        EXPECT_EQ(snapshot.completed, 1u);
        EXPECT_EQ(snapshot.disconnected, 1u);
        EXPECT_EQ(snapshot.timedOut, 1u);
        EXPECT_EQ(snapshot.errored, 0u);
    }

    TEST(TEST_CLASS, TouchAccumulatesBytes) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();
        registry.registerStream(makeStream("s1", now));

        registry.touch("s1", 1000, now + 1s);
        registry.touch("s1", 500, now + 2s);
        registry.touch("unknown", 99, now + 2s);

        auto snapshot = registry.snapshot(now + 2s);
        ASSERT_EQ(snapshot.active.size(), 1u);
        EXPECT_EQ(snapshot.active[0].bytesRead, 1500u);
        EXPECT_TRUE(snapshot.active[0].lastActivity == now + 2s);
        EXPECT_EQ(snapshot.bytesServed, 1500u);
    }

    TEST(TEST_CLASS, IdleStreamsAreLeakCandidatesCountedOnce) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();
        registry.registerStream(makeStream("stale", now));
        registry.registerStream(makeStream("fresh", now));
        registry.touch("fresh", 10, now + 3min);

        auto first = registry.snapshot(now + 3min);
        ASSERT_EQ(first.leakCandidates.size(), 1u);
        EXPECT_EQ(first.leakCandidates[0].streamId, "stale");
        EXPECT_EQ(first.leaked, 1u);

        auto second = registry.snapshot(now + 4min);
        EXPECT_EQ(second.leakCandidates.size(), 1u);
        EXPECT_EQ(second.leaked, 1u);

        // The registry only observes
        EXPECT_TRUE(registry.contains("stale"));
    }

    TEST(TEST_CLASS, ReportsIdleSources) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();
        registry.recordSourceActivity("old", "Old Show", now);
        registry.recordSourceActivity("new", "New Show", now + 25min);

        auto snapshot = registry.snapshot(now + 31min);
        ASSERT_EQ(snapshot.idleSources.size(), 1u);
        EXPECT_EQ(snapshot.idleSources[0].sourceId, "old");
        EXPECT_EQ(snapshot.idleSources[0].name, "Old Show");
    }

    TEST(TEST_CLASS, ForgottenSourceIsNoLongerReported) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();
        registry.recordSourceActivity("old", "Old Show", now);

        EXPECT_TRUE(registry.forgetSource("old"));
        EXPECT_FALSE(registry.forgetSource("old"));
        EXPECT_TRUE(registry.snapshot(now + 31min).idleSources.empty());

        // Streaming it again brings it back
        registry.recordSourceActivity("old", "Old Show", now + 40min);
        EXPECT_EQ(registry.snapshot(now + 80min).idleSources.size(), 1u);
    }

    TEST(TEST_CLASS, StreamActivityKeepsSourceAlive) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();
        registry.registerStream(makeStream("s1", now, "src"));
        registry.touch("s1", 10, now + 29min);

        EXPECT_TRUE(registry.snapshot(now + 40min).idleSources.empty());
        EXPECT_EQ(registry.snapshot(now + 60min).idleSources.size(), 1u);
    }

    TEST(TEST_CLASS, RendersJson) {
        ::ResourceRegistry registry(2min, 30min);
        auto now = RegistryClock::now();
        registry.registerStream(makeStream("s1", now));
        registry.touch("s1", 42, now);

        auto json = registry.snapshot(now + 1s).toJson();

        EXPECT_EQ(json["streams"]["open"], 1);
        EXPECT_EQ(json["streams"]["bytesServed"], 42);
        ASSERT_EQ(json["active"].size(), 1u);
        EXPECT_EQ(json["active"][0]["id"], "s1");
        EXPECT_EQ(json["active"][0]["idleMs"], 1000);
        EXPECT_TRUE(json["leakCandidates"].is_array());
        EXPECT_TRUE(json["idleSources"].is_array());
    }
}
