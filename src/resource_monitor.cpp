// File: resource_monitor.cpp
#include "resource_monitor.hpp"
#include "logger.hpp"
#include <boost/asio/error.hpp>
#include <set>

ResourceMonitor::ResourceMonitor(boost::asio::io_context &ioc, ResourceRegistry &registry, std::chrono::milliseconds interval)
    : registry_(registry), interval_(interval), timer_(ioc) {}

void ResourceMonitor::start()
{
    if (running_)
        return;

    running_ = true;
    Logger::Log(LogLevel::DEBUG, "ResourceMonitor::start: Checking every " + std::to_string(interval_.count()) + "ms.");
    scheduleNext();
}

void ResourceMonitor::stop()
{
    running_ = false;
    timer_.cancel();
}

void ResourceMonitor::scheduleNext()
{
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec)
                      {
                          if (ec == boost::asio::error::operation_aborted || !self->running_)
                              return;
                          self->checkNow();
                          self->scheduleNext(); });
}

RegistrySnapshot ResourceMonitor::checkNow()
{
    auto now = RegistryClock::now();
    RegistrySnapshot snapshot = registry_.snapshot(now);

    for (const auto &stream : snapshot.leakCandidates)
    {
        auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - stream.lastActivity).count();
        Logger::Log(LogLevel::WARN, "ResourceMonitor::checkNow: Possible leaked stream " + stream.streamId + " (" +
                                        stream.fileName + ") idle for " + std::to_string(idle) + "s, " +
                                        std::to_string(stream.bytesRead) + " bytes read.");
    }

    for (const auto &source : snapshot.idleSources)
    {
        auto idle = std::chrono::duration_cast<std::chrono::minutes>(now - source.lastActivity).count();
        Logger::Log(LogLevel::INFO, "ResourceMonitor::checkNow: Source " + source.name + " (" + source.sourceId +
                                        ") idle for " + std::to_string(idle) + " minutes.");
    }

    if (reclaimer_)
    {
        reclaim(snapshot);
    }

    Logger::Log(LogLevel::DEBUG, "ResourceMonitor::checkNow: " + std::to_string(snapshot.open) + " open, " +
                                     std::to_string(snapshot.closed) + " closed, " + std::to_string(snapshot.leaked) +
                                     " leaked, " + std::to_string(snapshot.bytesServed) + " bytes served.");
    return snapshot;
}

void ResourceMonitor::reclaim(const RegistrySnapshot &snapshot)
{
    // A stalled stream leaves its source idle but still in use
    std::set<std::string> streaming;
    for (const auto &stream : snapshot.active)
    {
        streaming.insert(stream.sourceId);
    }

    std::vector<std::string> candidates;
    for (const auto &source : snapshot.idleSources)
    {
        if (!streaming.count(source.sourceId))
        {
            candidates.push_back(source.sourceId);
        }
    }
    if (candidates.empty())
    {
        return;
    }

    for (const auto &id : reclaimer_(candidates))
    {
        registry_.forgetSource(id);
        Logger::Log(LogLevel::INFO, "ResourceMonitor::reclaim: Removed idle source " + id);
    }
}
