// File: main.cpp
#include "async_curl_client.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "resource_monitor.hpp"
#include "resource_tracker.hpp"
#include "stream_config.hpp"
#include "torrent_session.hpp"
#include "utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static void printUsage()
{
    std::cout << "Usage: ./swarmstream [options]\n"
              << "--config <path>             Path to the configuration file (default /etc/swarmstream/config.json)\n"
              << "--host <host>               Address to listen on\n"
              << "--port <port>               Port to listen on\n"
              << "--log-level <level>         Set log level (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)\n"
              << "--debug                     Enable debug mode (equivalent to --log-level DEBUG)\n"
              << "--log-file <path>           Log file path\n"
              << "--save-path <path>          Directory torrents are downloaded to\n"
              << "--profile <name>            Streaming profile (standard, low-resource)\n"
              << "--max-chunk <bytes>         Largest window served for an open or missing range\n"
              << "--stream-timeout <ms>       Inactivity timeout of a stream\n"
              << "--global-timeout <ms>       Maximum duration of a stream request\n";
}

static uint64_t numericArg(const std::string &flag, const std::string &value)
{
    auto parsed = parse_u64(value);
    if (!parsed)
    {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    return *parsed;
}

static void applyArguments(int argc, char *argv[], ServerConfig &config)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--config" && hasValue)
        {
            ++i; // already consumed
        }
        else if (arg == "--debug")
        {
            config.debug = true;
            config.logLevel = LogLevel::DEBUG;
        }
        else if (arg == "--log-level" && hasValue)
        {
            config.logLevel = Logger::ParseLogLevel(argv[++i]);
        }
        else if (arg == "--host" && hasValue)
        {
            config.host = argv[++i];
        }
        else if (arg == "--port" && hasValue)
        {
            config.port = argv[++i];
        }
        else if (arg == "--log-file" && hasValue)
        {
            config.logFile = argv[++i];
        }
        else if (arg == "--save-path" && hasValue)
        {
            config.torrent.savePath = argv[++i];
        }
        else if (arg == "--profile" && hasValue)
        {
            config.stream.applyProfile(argv[++i]);
        }
        else if (arg == "--max-chunk" && hasValue)
        {
            config.stream.maxChunkSize = numericArg(arg, argv[++i]);
        }
        else if (arg == "--stream-timeout" && hasValue)
        {
            config.stream.streamTimeout = std::chrono::milliseconds(numericArg(arg, argv[++i]));
        }
        else if (arg == "--global-timeout" && hasValue)
        {
            config.stream.globalTimeout = std::chrono::milliseconds(numericArg(arg, argv[++i]));
        }
        else
        {
            throw std::runtime_error("Unknown or incomplete argument: " + arg);
        }
    }
}

int main(int argc, char *argv[])
{
    std::string configFilePath = "/etc/swarmstream/config.json";
    bool explicitConfig = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help")
        {
            printUsage();
            return 0;
        }
        if (arg == "--config" && i + 1 < argc)
        {
            configFilePath = argv[++i];
            explicitConfig = true;
        }
    }

    ServerConfig config;
    try
    {
        if (explicitConfig || std::filesystem::exists(configFilePath))
        {
            loadConfig(configFilePath, config);
        }
        applyArguments(argc, argv, config);
        config.stream.validate();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Initialize Logger
    Logger::InitLogFile(config.logFile);
    Logger::SetLogLevel(config.logLevel);
    Logger::SetDebug(config.debug);
    Logger::Log(LogLevel::INFO, "swarmstream starting...");
    Logger::Log(LogLevel::INFO, "Streaming: max chunk " + std::to_string(config.stream.maxChunkSize) + " bytes, stream timeout " +
                                    std::to_string(config.stream.streamTimeout.count()) + "ms, global timeout " +
                                    std::to_string(config.stream.globalTimeout.count()) + "ms");

    // Declared before the io_context: handlers destroyed with it may still reference them
    ResourceRegistry registry(config.stream.leakIdleThreshold, config.stream.sourceIdleThreshold);
    std::unique_ptr<TorrentSession> torrents;
    boost::asio::io_context ioc;

    try
    {
        torrents = std::make_unique<TorrentSession>(ioc, config.torrent, std::make_shared<AsyncCurlClient>());
        torrents->start();

        StreamServices services{ioc, config.stream, *torrents, registry};
        auto server = std::make_shared<HttpServer>(services, config.host, config.port);
        server->init();
        server->run();

        auto monitor = std::make_shared<ResourceMonitor>(ioc, registry, config.stream.monitorInterval);
        if (config.stream.reclaimIdleSources)
        {
            TorrentSession *session = torrents.get();
            monitor->setReclaimer([session](const std::vector<std::string> &sourceIds)
                                  { return session->removeIdle(sourceIds); });
        }
        monitor->start();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &ec, int signal)
                           {
                               if (ec)
                                   return;
                               Logger::Log(LogLevel::INFO, "Signal " + std::to_string(signal) + " received, shutting down.");
                               server->stop();
                               monitor->stop();
                               torrents->stop();
                               ioc.stop(); });

        ioc.run();
    }
    catch (const std::exception &e)
    {
        Logger::Log(LogLevel::FATAL, "swarmstream failed: " + std::string(e.what()));
        if (torrents)
        {
            torrents->stop();
        }
        Logger::CloseLogFile();
        return 1;
    }

    Logger::Log(LogLevel::INFO, "swarmstream exited cleanly.");
    Logger::CloseLogFile();
    return 0;
}
