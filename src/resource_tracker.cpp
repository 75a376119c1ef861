// File: resource_tracker.cpp
#include "resource_tracker.hpp"
#include "logger.hpp"

namespace
{
    int64_t ageMs(RegistryClock::time_point now, RegistryClock::time_point then)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - then).count();
    }

    nlohmann::json streamJson(const StreamSnapshot &s, RegistryClock::time_point now)
    {
        return {
            {"id", s.streamId},
            {"sourceId", s.sourceId},
            {"fileName", s.fileName},
            {"bytesRead", s.bytesRead},
            {"ageMs", ageMs(now, s.startedAt)},
            {"idleMs", ageMs(now, s.lastActivity)}};
    }
}

ResourceRegistry::ResourceRegistry(std::chrono::milliseconds leakIdleThreshold, std::chrono::milliseconds sourceIdleThreshold)
    : leakIdleThreshold_(leakIdleThreshold), sourceIdleThreshold_(sourceIdleThreshold) {}

void ResourceRegistry::registerStream(StreamSnapshot snapshot)
{
    std::lock_guard<std::mutex> lock(mutex_);
    touchSourceLocked(snapshot.sourceId, snapshot.sourceName, snapshot.lastActivity);

    std::string id = snapshot.streamId;
    auto [it, inserted] = streams_.insert_or_assign(id, Entry{std::move(snapshot), false});
    (void)it;
    if (inserted)
    {
        ++opened_;
    }
    else
    {
        Logger::Log(LogLevel::WARN, "ResourceRegistry::registerStream: Stream " + id + " registered twice, entry replaced.");
    }
}

void ResourceRegistry::touch(const std::string &streamId, uint64_t bytes, RegistryClock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(streamId);
    if (it == streams_.end())
    {
        return;
    }

    it->second.snapshot.bytesRead += bytes;
    it->second.snapshot.lastActivity = now;
    bytesServed_ += bytes;

    auto source = sources_.find(it->second.snapshot.sourceId);
    if (source != sources_.end())
    {
        source->second.lastActivity = now;
    }
}

bool ResourceRegistry::unregisterStream(const std::string &streamId, StreamState outcome)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(streamId);
    if (it == streams_.end())
    {
        return false;
    }

    streams_.erase(it);
    ++closed_;

    switch (outcome)
    {
    case StreamState::COMPLETED:
        ++completed_;
        break;
    case StreamState::TIMED_OUT:
        ++timedOut_;
        break;
    case StreamState::ERRORED:
        ++errored_;
        break;
    case StreamState::DISCONNECTED:
        ++disconnected_;
        break;
    default:
        Logger::Log(LogLevel::WARN, "ResourceRegistry::unregisterStream: Stream " + streamId + " closed in non-terminal state " + ToString(outcome));
        break;
    }

    return true;
}

void ResourceRegistry::recordSourceActivity(const std::string &sourceId, const std::string &name, RegistryClock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    touchSourceLocked(sourceId, name, now);
}

bool ResourceRegistry::forgetSource(const std::string &sourceId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.erase(sourceId) > 0;
}

void ResourceRegistry::touchSourceLocked(const std::string &sourceId, const std::string &name, RegistryClock::time_point now)
{
    if (sourceId.empty())
    {
        return;
    }

    auto &source = sources_[sourceId];
    source.sourceId = sourceId;
    if (source.name.empty())
    {
        source.name = name;
    }
    source.lastActivity = now;
}

RegistrySnapshot ResourceRegistry::snapshot(RegistryClock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    RegistrySnapshot result;
    result.takenAt = now;
    result.open = streams_.size();

    for (auto &[id, entry] : streams_)
    {
        result.active.push_back(entry.snapshot);
        if (now - entry.snapshot.lastActivity > leakIdleThreshold_)
        {
            result.leakCandidates.push_back(entry.snapshot);
            if (!entry.reportedLeak)
            {
                entry.reportedLeak = true;
                ++leaked_;
            }
        }
    }

    for (const auto &[id, source] : sources_)
    {
        if (now - source.lastActivity > sourceIdleThreshold_)
        {
            result.idleSources.push_back(source);
        }
    }

    result.opened = opened_;
    result.closed = closed_;
    result.leaked = leaked_;
    result.completed = completed_;
    result.timedOut = timedOut_;
    result.errored = errored_;
    result.disconnected = disconnected_;
    result.bytesServed = bytesServed_;
    return result;
}

bool ResourceRegistry::contains(const std::string &streamId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.count(streamId) != 0;
}

size_t ResourceRegistry::openCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.size();
}

nlohmann::json RegistrySnapshot::toJson() const
{
    nlohmann::json streams = {
        {"open", open},
        {"opened", opened},
        {"closed", closed},
        {"leaked", leaked},
        {"completed", completed},
        {"timedOut", timedOut},
        {"errored", errored},
        {"disconnected", disconnected},
        {"bytesServed", bytesServed}};

    nlohmann::json active = nlohmann::json::array();
    for (const auto &s : this->active)
    {
        active.push_back(streamJson(s, takenAt));
    }

    nlohmann::json leaks = nlohmann::json::array();
    for (const auto &s : leakCandidates)
    {
        leaks.push_back(streamJson(s, takenAt));
    }

    nlohmann::json idle = nlohmann::json::array();
    for (const auto &s : idleSources)
    {
        idle.push_back({{"sourceId", s.sourceId},
                        {"name", s.name},
                        {"idleMs", ageMs(takenAt, s.lastActivity)}});
    }

    return {
        {"streams", streams},
        {"active", active},
        {"leakCandidates", leaks},
        {"idleSources", idle}};
}
