// File: stream_config.cpp
#include "stream_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

void StreamConfig::applyProfile(const std::string &profile)
{
    if (profile == "standard")
    {
        maxChunkSize = 1024 * 1024;
        streamTimeout = std::chrono::milliseconds(15000);
        rejectUnsatisfiableRanges = false;
    }
    else if (profile == "low-resource")
    {
        maxChunkSize = 256 * 1024;
        streamTimeout = std::chrono::milliseconds(20000);
        rejectUnsatisfiableRanges = true;
    }
    else
    {
        throw std::runtime_error("Unknown streaming profile: " + profile);
    }
}

void StreamConfig::validate() const
{
    if (maxChunkSize == 0)
        throw std::runtime_error("maxChunkSize must be greater than zero");
    if (readChunkSize == 0)
        throw std::runtime_error("readChunkSize must be greater than zero");
    if (streamTimeout.count() <= 0 || globalTimeout.count() <= 0 || resolverTimeout.count() <= 0)
        throw std::runtime_error("timeouts must be positive");
    if (priorityPieces == 0 && prioritizeSeeks)
        throw std::runtime_error("priorityPieces must be at least 1 when prioritizeSeeks is enabled");
    if (monitorInterval.count() <= 0)
        throw std::runtime_error("monitorIntervalMs must be positive");
}

static std::chrono::milliseconds millis(const json &node, const char *key, std::chrono::milliseconds fallback)
{
    return std::chrono::milliseconds(node.value(key, static_cast<int64_t>(fallback.count())));
}

static void applyJson(const json &config, ServerConfig &out)
{
    out.host = config.value("host", out.host);
    if (config.contains("port"))
    {
        // Accept both "8080" and 8080
        const auto &port = config["port"];
        out.port = port.is_number() ? std::to_string(port.get<int>()) : port.get<std::string>();
    }
    out.logFile = config.value("logFile", out.logFile);
    if (config.contains("logLevel"))
    {
        out.logLevel = Logger::ParseLogLevel(config["logLevel"].get<std::string>());
    }
    out.debug = config.value("debug", out.debug);

    if (config.contains("streaming") && config["streaming"].is_object())
    {
        const auto &s = config["streaming"];
        StreamConfig &stream = out.stream;

        // Profile first so that explicit keys override it
        if (s.contains("profile"))
        {
            stream.applyProfile(s["profile"].get<std::string>());
        }

        stream.maxChunkSize = s.value("maxChunkSize", stream.maxChunkSize);
        stream.readChunkSize = s.value("readChunkSize", stream.readChunkSize);
        stream.streamTimeout = millis(s, "streamTimeoutMs", stream.streamTimeout);
        stream.globalTimeout = millis(s, "globalTimeoutMs", stream.globalTimeout);
        stream.resolverTimeout = millis(s, "resolverTimeoutMs", stream.resolverTimeout);
        stream.priorityPieces = s.value("priorityPieces", stream.priorityPieces);
        stream.prioritizeSeeks = s.value("prioritizeSeeks", stream.prioritizeSeeks);
        stream.rejectUnsatisfiableRanges = s.value("rejectUnsatisfiableRanges", stream.rejectUnsatisfiableRanges);
        stream.defaultMimeType = s.value("defaultMimeType", stream.defaultMimeType);
        stream.leakIdleThreshold = millis(s, "leakIdleThresholdMs", stream.leakIdleThreshold);
        stream.sourceIdleThreshold = millis(s, "sourceIdleThresholdMs", stream.sourceIdleThreshold);
        stream.monitorInterval = millis(s, "monitorIntervalMs", stream.monitorInterval);
        stream.reclaimIdleSources = s.value("reclaimIdleSources", stream.reclaimIdleSources);
    }

    if (config.contains("torrent") && config["torrent"].is_object())
    {
        const auto &t = config["torrent"];
        TorrentConfig &torrent = out.torrent;
        torrent.savePath = t.value("savePath", torrent.savePath);
        torrent.listenInterfaces = t.value("listenInterfaces", torrent.listenInterfaces);
        torrent.downloadLimit = t.value("downloadLimit", torrent.downloadLimit);
        torrent.uploadLimit = t.value("uploadLimit", torrent.uploadLimit);
        torrent.minUploadLimit = t.value("minUploadLimit", torrent.minUploadLimit);
        torrent.pieceDeadlineMs = t.value("pieceDeadlineMs", torrent.pieceDeadlineMs);
        torrent.enableDht = t.value("enableDht", torrent.enableDht);
        torrent.enablePortMapping = t.value("enablePortMapping", torrent.enablePortMapping);

        if (t.contains("trackers") && t["trackers"].is_array())
        {
            torrent.trackers.clear();
            for (const auto &tracker : t["trackers"])
            {
                torrent.trackers.push_back(tracker.get<std::string>());
            }
        }
    }

    out.stream.validate();
}

void loadConfig(const std::string &configPath, ServerConfig &config)
{
    std::ifstream configFile(configPath);
    if (!configFile.is_open())
    {
        throw std::runtime_error("Failed to open config file: " + configPath);
    }

    try
    {
        json document;
        configFile >> document;
        applyJson(document, config);
    }
    catch (const json::exception &e)
    {
        throw std::runtime_error("Invalid config file " + configPath + ": " + e.what());
    }
}

void loadConfigFromString(const std::string &document, ServerConfig &config)
{
    try
    {
        applyJson(json::parse(document), config);
    }
    catch (const json::exception &e)
    {
        throw std::runtime_error(std::string("Invalid config document: ") + e.what());
    }
}
