#pragma once
#include "fakes.hpp"
#include "torrent_source.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/bencode.hpp>
#include <libtorrent/create_torrent.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace swarmstream::tests {

    // Scratch directory removed on destruction
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("swarmstream-test-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "-" +
                     std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

        std::filesystem::path write(const std::string &relative, const std::vector<char> &bytes) const
        {
            auto file = path_ / relative;
            std::filesystem::create_directories(file.parent_path());
            std::ofstream out(file, std::ios::binary);
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            return file;
        }

    private:
        std::filesystem::path path_;
    };

    // Two-file torrent "pack" (a.bin 20000 bytes, b.bin 40000 bytes) with 16 KiB pieces,
    // so b.bin starts inside piece 1. Payload bytes are makeBytes(60000) across both files.
    struct PackTorrent
    {
        static constexpr int PieceLength = 16384;
        static constexpr size_t FirstSize = 20000;
        static constexpr size_t SecondSize = 40000;

        explicit PackTorrent(const TempDir &dir)
            : payload(makeBytes(FirstSize + SecondSize))
        {
            dir.write("pack/a.bin", std::vector<char>(payload.begin(), payload.begin() + FirstSize));
            dir.write("pack/b.bin", std::vector<char>(payload.begin() + FirstSize, payload.end()));

            lt::file_storage fs;
            fs.add_file("pack/a.bin", static_cast<std::int64_t>(FirstSize));
            fs.add_file("pack/b.bin", static_cast<std::int64_t>(SecondSize));

            lt::create_torrent creator(fs, PieceLength, lt::create_torrent::v1_only);
            lt::set_piece_hashes(creator, dir.path().string());
            lt::bencode(std::back_inserter(bytes), creator.generate());

            info = std::make_shared<lt::torrent_info>(lt::span<char const>(bytes.data(), static_cast<std::ptrdiff_t>(bytes.size())), lt::from_span);
            id = infoHashHex(info->info_hashes());
        }

        std::vector<char> payload;
        std::vector<char> bytes;
        std::shared_ptr<const lt::torrent_info> info;
        std::string id;
    };

    // Settings for a session that never leaves the loopback interface
    inline lt::settings_pack offlineSettings()
    {
        lt::settings_pack pack;
        pack.set_int(lt::settings_pack::alert_mask, lt::alert_category::error | lt::alert_category::status | lt::alert_category::storage);
        pack.set_str(lt::settings_pack::listen_interfaces, "127.0.0.1:0");
        pack.set_bool(lt::settings_pack::enable_dht, false);
        pack.set_bool(lt::settings_pack::enable_lsd, false);
        pack.set_bool(lt::settings_pack::enable_upnp, false);
        pack.set_bool(lt::settings_pack::enable_natpmp, false);
        return pack;
    }

    inline TorrentConfig offlineTorrentConfig(const TempDir &dir)
    {
        TorrentConfig config;
        config.savePath = dir.path().string();
        config.listenInterfaces = "127.0.0.1:0";
        config.enableDht = false;
        config.enablePortMapping = false;
        config.trackers.clear();
        return config;
    }

    // Runs the io_context in slices until the predicate holds or the timeout passes
    template <typename Predicate>
    bool runUntil(boost::asio::io_context &ioc, Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        auto guard = boost::asio::make_work_guard(ioc);
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            ioc.restart();
            ioc.run_for(std::chrono::milliseconds(10));
        }
        return true;
    }
}
