// File: torrent_session.hpp
#pragma once
#include "i_http_fetcher.hpp"
#include "source_handle.hpp"
#include "stream_config.hpp"
#include "torrent_source.hpp"
#include <boost/asio/io_context.hpp>
#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert.hpp>
#include <libtorrent/session.hpp>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Owns the libtorrent session and resolves stream identifiers to torrents.
// Accepted identifiers: 40 hex info hash, magnet URI, http(s) URL of a .torrent.
class TorrentSession : public ISourceResolver
{
public:
    TorrentSession(boost::asio::io_context &ioc, const TorrentConfig &config, std::shared_ptr<IHttpFetcher> fetcher);
    ~TorrentSession() override;

    TorrentSession(const TorrentSession &) = delete;
    TorrentSession &operator=(const TorrentSession &) = delete;

    // Throws std::runtime_error if the session cannot be created
    void start();
    void stop();

    uint64_t asyncResolve(const std::string &identifier, ResolveHandler handler) override;
    void cancel(uint64_t ticket) override;

    // Removes the given sources unless a stream or a resolve still uses them.
    // Returns the ids that were removed.
    std::vector<std::string> removeIdle(const std::vector<std::string> &sourceIds);

    // Torrents added or being added
    size_t torrentCount() const { return sources_.size() + adding_.size(); }

private:
    struct PendingResolve
    {
        std::string sourceId;
        ResolveHandler handler;
        uint64_t fetchId = 0;
    };

    void resolveParams(lt::add_torrent_params params, uint64_t ticket);
    void onTorrentFile(uint64_t ticket, FetchResult result);

    void popAlerts();
    void handleAlert(lt::alert *alert);

    bool isWanted(const std::string &sourceId) const;
    bool releaseIfUnwanted(const std::string &sourceId);

    void completeWaiting(const std::string &sourceId);
    void failWaiting(const std::string &sourceId, const boost::system::error_code &ec);
    void postResult(uint64_t ticket, const boost::system::error_code &ec, std::shared_ptr<ISourceHandle> source);

    boost::asio::io_context &ioc_;
    TorrentConfig config_;
    std::shared_ptr<IHttpFetcher> fetcher_;
    std::unique_ptr<lt::session> session_;
    std::shared_ptr<PieceDispatcher> dispatcher_;

    std::map<std::string, std::shared_ptr<TorrentSource>> sources_;
    std::set<std::string> adding_;
    // Removed from sources_, torrent_removed_alert not seen yet
    std::set<std::string> removing_;
    // Resolves that arrived while the same torrent was being removed
    std::map<std::string, lt::add_torrent_params> readd_;
    std::map<uint64_t, PendingResolve> pending_;
    uint64_t nextTicket_ = 1;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
