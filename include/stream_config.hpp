// File: stream_config.hpp
#pragma once
#include "logger.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Engine knobs. The two historical handler variants are kept as named
// profiles ("standard" and "low-resource") rather than separate code paths.
struct StreamConfig
{
    uint64_t maxChunkSize = 1024 * 1024;
    size_t readChunkSize = 64 * 1024;
    std::chrono::milliseconds streamTimeout{15000};
    std::chrono::milliseconds globalTimeout{60000};
    std::chrono::milliseconds resolverTimeout{5000};
    uint32_t priorityPieces = 3;
    bool prioritizeSeeks = true;
    bool rejectUnsatisfiableRanges = false;
    std::string defaultMimeType = "application/octet-stream";

    std::chrono::milliseconds leakIdleThreshold{120000};
    std::chrono::milliseconds sourceIdleThreshold{1800000};
    std::chrono::milliseconds monitorInterval{300000};
    // Remove idle sources with no open stream from the torrent session
    bool reclaimIdleSources = true;

    void applyProfile(const std::string &profile);
    void validate() const;
};

struct TorrentConfig
{
    std::string savePath = "./downloads";
    std::string listenInterfaces = "0.0.0.0:6881";
    int downloadLimit = -1;
    int uploadLimit = -1;
    int minUploadLimit = 5000;
    int pieceDeadlineMs = 1000;
    bool enableDht = true;
    // UPnP and NAT-PMP
    bool enablePortMapping = true;
    std::vector<std::string> trackers{
        "udp://tracker.opentrackr.org:1337/announce",
        "udp://open.demonii.com:1337/announce",
        "udp://tracker.openbittorrent.com:6969/announce",
        "udp://exodus.desync.com:6969/announce",
        "udp://tracker.torrent.eu.org:451/announce"};
};

struct ServerConfig
{
    std::string host = "0.0.0.0";
    std::string port = "8080";
    std::string logFile = "/var/log/swarmstream/swarmstream.log";
    LogLevel logLevel = LogLevel::INFO;
    bool debug = false;

    StreamConfig stream;
    TorrentConfig torrent;
};

// Reads a JSON config file over the defaults already in `config`.
// Throws std::runtime_error if the file cannot be opened or parsed.
void loadConfig(const std::string &configPath, ServerConfig &config);

// Same as loadConfig but from an in-memory JSON document.
void loadConfigFromString(const std::string &document, ServerConfig &config);
