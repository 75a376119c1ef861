// File: resource_monitor.hpp
#pragma once
#include "resource_tracker.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Periodically logs leak candidates and idle sources from the registry.
// With a reclaimer installed, idle sources without open streams are handed to
// it and the ones it removed are forgotten by the registry.
class ResourceMonitor : public std::enable_shared_from_this<ResourceMonitor>
{
public:
    // Receives idle source ids, returns the ones actually removed
    using IdleSourceReclaimer = std::function<std::vector<std::string>(const std::vector<std::string> &sourceIds)>;

    ResourceMonitor(boost::asio::io_context &ioc, ResourceRegistry &registry, std::chrono::milliseconds interval);

    void setReclaimer(IdleSourceReclaimer reclaimer) { reclaimer_ = std::move(reclaimer); }

    void start();
    void stop();

    // One report, returns the snapshot it was built from
    RegistrySnapshot checkNow();

private:
    void scheduleNext();
    void reclaim(const RegistrySnapshot &snapshot);

    ResourceRegistry &registry_;
    std::chrono::milliseconds interval_;
    boost::asio::steady_timer timer_;
    IdleSourceReclaimer reclaimer_;
    bool running_ = false;
};
