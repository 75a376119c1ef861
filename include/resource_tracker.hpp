// File: resource_tracker.hpp
#pragma once
#include "stream_state.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using RegistryClock = std::chrono::steady_clock;

struct StreamSnapshot
{
    std::string streamId;
    std::string sourceId;
    std::string sourceName;
    std::string fileName;
    RegistryClock::time_point startedAt;
    RegistryClock::time_point lastActivity;
    uint64_t bytesRead = 0;
};

struct SourceActivity
{
    std::string sourceId;
    std::string name;
    RegistryClock::time_point lastActivity;
};

struct RegistrySnapshot
{
    RegistryClock::time_point takenAt;
    size_t open = 0;
    uint64_t opened = 0;
    uint64_t closed = 0;
    uint64_t leaked = 0;
    uint64_t completed = 0;
    uint64_t timedOut = 0;
    uint64_t errored = 0;
    uint64_t disconnected = 0;
    uint64_t bytesServed = 0;
    std::vector<StreamSnapshot> active;
    std::vector<StreamSnapshot> leakCandidates;
    std::vector<SourceActivity> idleSources;

    nlohmann::json toJson() const;
};

// Process-wide registry of active streams. Observes only: it never closes a
// stream, stale entries are reported as leak candidates.
class ResourceRegistry
{
public:
    ResourceRegistry(std::chrono::milliseconds leakIdleThreshold, std::chrono::milliseconds sourceIdleThreshold);

    ResourceRegistry(const ResourceRegistry &) = delete;
    ResourceRegistry &operator=(const ResourceRegistry &) = delete;

    void registerStream(StreamSnapshot snapshot);
    void touch(const std::string &streamId, uint64_t bytes, RegistryClock::time_point now = RegistryClock::now());
    // Returns false if the stream was not registered.
    bool unregisterStream(const std::string &streamId, StreamState outcome);

    void recordSourceActivity(const std::string &sourceId, const std::string &name, RegistryClock::time_point now = RegistryClock::now());
    // Drops a source that no longer exists. Returns false if it was unknown.
    bool forgetSource(const std::string &sourceId);

    RegistrySnapshot snapshot(RegistryClock::time_point now = RegistryClock::now());

    bool contains(const std::string &streamId) const;
    size_t openCount() const;

private:
    struct Entry
    {
        StreamSnapshot snapshot;
        bool reportedLeak = false;
    };

    void touchSourceLocked(const std::string &sourceId, const std::string &name, RegistryClock::time_point now);

    const std::chrono::milliseconds leakIdleThreshold_;
    const std::chrono::milliseconds sourceIdleThreshold_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> streams_;
    std::map<std::string, SourceActivity> sources_;

    uint64_t opened_ = 0;
    uint64_t closed_ = 0;
    uint64_t leaked_ = 0;
    uint64_t completed_ = 0;
    uint64_t timedOut_ = 0;
    uint64_t errored_ = 0;
    uint64_t disconnected_ = 0;
    uint64_t bytesServed_ = 0;
};
