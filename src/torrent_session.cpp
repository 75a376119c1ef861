// File: torrent_session.cpp
#include "torrent_session.hpp"
#include "logger.hpp"
#include "stream_errors.hpp"
#include "utils.hpp"
#include <boost/asio/post.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace
{
    bool isInfoHash(const std::string &value)
    {
        return value.size() == 40 && std::all_of(value.begin(), value.end(), [](unsigned char c)
                                                 { return std::isxdigit(c) != 0; });
    }

    std::string sourceIdOf(const lt::add_torrent_params &params)
    {
        if (params.ti)
        {
            return infoHashHex(params.ti->info_hashes());
        }
        return infoHashHex(params.info_hashes);
    }
}

TorrentSession::TorrentSession(boost::asio::io_context &ioc, const TorrentConfig &config, std::shared_ptr<IHttpFetcher> fetcher)
    : ioc_(ioc), config_(config), fetcher_(std::move(fetcher)), dispatcher_(std::make_shared<PieceDispatcher>()) {}

TorrentSession::~TorrentSession()
{
    stop();
}

void TorrentSession::start()
{
    if (session_)
    {
        return;
    }

    lt::settings_pack pack;
    pack.set_int(lt::settings_pack::alert_mask, lt::alert_category::error | lt::alert_category::status | lt::alert_category::storage);
    pack.set_str(lt::settings_pack::listen_interfaces, config_.listenInterfaces);
    pack.set_str(lt::settings_pack::user_agent, "swarmstream/1.0");
    pack.set_bool(lt::settings_pack::enable_dht, config_.enableDht);
    pack.set_bool(lt::settings_pack::enable_lsd, config_.enableDht);
    pack.set_bool(lt::settings_pack::enable_upnp, config_.enablePortMapping);
    pack.set_bool(lt::settings_pack::enable_natpmp, config_.enablePortMapping);
    pack.set_int(lt::settings_pack::download_rate_limit, std::max(0, config_.downloadLimit));
    pack.set_int(lt::settings_pack::upload_rate_limit, std::max(0, config_.uploadLimit));

    try
    {
        session_ = std::make_unique<lt::session>(pack);
    }
    catch (const std::exception &e)
    {
        throw std::runtime_error("TorrentSession::start: " + std::string(e.what()));
    }

    std::weak_ptr<bool> alive = alive_;
    boost::asio::io_context &ioc = ioc_;
    // Called from a libtorrent thread; alerts are popped on the io_context
    session_->set_alert_notify([this, alive, &ioc]()
                               { boost::asio::post(ioc, [this, alive]()
                                                   {
                                                       if (alive.expired())
                                                           return;
                                                       popAlerts(); }); });

    Logger::Log(LogLevel::INFO, "TorrentSession::start: Listening on " + config_.listenInterfaces + ", saving to " + config_.savePath);
}

void TorrentSession::stop()
{
    if (!session_)
    {
        return;
    }

    Logger::Log(LogLevel::INFO, "TorrentSession::stop: Shutting down " + std::to_string(sources_.size()) + " torrents.");
    session_->set_alert_notify([] {});
    alive_.reset();

    for (const auto &[id, source] : sources_)
    {
        dispatcher_->failSource(id, make_error_code(StreamErrc::transfer_failed));
    }
    sources_.clear();
    adding_.clear();
    removing_.clear();
    readd_.clear();
    pending_.clear();
    session_.reset();
    fetcher_.reset();
}

uint64_t TorrentSession::asyncResolve(const std::string &identifier, ResolveHandler handler)
{
    uint64_t ticket = nextTicket_++;
    pending_[ticket] = PendingResolve{"", std::move(handler)};

    if (!session_)
    {
        postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
        return ticket;
    }

    std::string value = trim(identifier);
    lt::error_code ec;

    if (isInfoHash(value))
    {
        lt::add_torrent_params params = lt::parse_magnet_uri("magnet:?xt=urn:btih:" + to_lower(value), ec);
        if (ec)
        {
            Logger::Log(LogLevel::WARN, "TorrentSession::asyncResolve: Bad info hash " + value + ": " + ec.message());
            postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
            return ticket;
        }
        params.trackers = config_.trackers;
        resolveParams(std::move(params), ticket);
        return ticket;
    }

    if (value.starts_with("magnet:"))
    {
        lt::add_torrent_params params = lt::parse_magnet_uri(value, ec);
        if (ec)
        {
            Logger::Log(LogLevel::WARN, "TorrentSession::asyncResolve: Bad magnet URI: " + ec.message());
            postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
            return ticket;
        }
        resolveParams(std::move(params), ticket);
        return ticket;
    }

    if (value.starts_with("http://") || value.starts_with("https://"))
    {
        if (!fetcher_)
        {
            postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
            return ticket;
        }

        std::weak_ptr<bool> alive = alive_;
        boost::asio::io_context &ioc = ioc_;
        uint64_t fetchId = fetcher_->fetchAsync(value, [this, alive, &ioc, ticket](FetchResult result)
                                                { boost::asio::post(ioc, [this, alive, ticket, result = std::move(result)]() mutable
                                                                    {
                                                                        if (alive.expired())
                                                                            return;
                                                                        onTorrentFile(ticket, std::move(result)); }); });
        pending_[ticket].fetchId = fetchId;
        return ticket;
    }

    Logger::Log(LogLevel::WARN, "TorrentSession::asyncResolve: Unsupported identifier " + value);
    postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
    return ticket;
}

void TorrentSession::cancel(uint64_t ticket)
{
    auto it = pending_.find(ticket);
    if (it == pending_.end())
    {
        return;
    }

    std::string sourceId = std::move(it->second.sourceId);
    uint64_t fetchId = it->second.fetchId;
    pending_.erase(it);
    Logger::Log(LogLevel::DEBUG, "TorrentSession::cancel: Resolve " + std::to_string(ticket) + " abandoned.");

    if (fetchId != 0 && fetcher_)
    {
        fetcher_->cancel(fetchId);
    }

    if (sourceId.empty() || isWanted(sourceId))
    {
        return;
    }

    if (readd_.erase(sourceId) > 0)
    {
        adding_.erase(sourceId);
        return;
    }

    // A source still looking for metadata would keep searching the swarm with nobody waiting.
    // Sources with metadata are left to the idle reclaim.
    auto source = sources_.find(sourceId);
    if (source != sources_.end() && !source->second->hasMetadata())
    {
        releaseIfUnwanted(sourceId);
    }
}

std::vector<std::string> TorrentSession::removeIdle(const std::vector<std::string> &sourceIds)
{
    std::vector<std::string> removed;
    for (const auto &id : sourceIds)
    {
        if (releaseIfUnwanted(id))
        {
            removed.push_back(id);
        }
    }
    return removed;
}

bool TorrentSession::isWanted(const std::string &sourceId) const
{
    return std::any_of(pending_.begin(), pending_.end(), [&sourceId](const auto &entry)
                       { return entry.second.sourceId == sourceId; });
}

bool TorrentSession::releaseIfUnwanted(const std::string &sourceId)
{
    auto it = sources_.find(sourceId);
    if (!session_ || it == sources_.end() || isWanted(sourceId))
    {
        return false;
    }

    // Open streams and posted resolve results hold their own reference
    if (it->second.use_count() > 1)
    {
        return false;
    }

    Logger::Log(LogLevel::INFO, "TorrentSession::releaseIfUnwanted: Removing torrent " + it->second->name() + " (" + sourceId + ")");
    session_->remove_torrent(it->second->handle());
    removing_.insert(sourceId);
    sources_.erase(it);
    dispatcher_->failSource(sourceId, make_error_code(StreamErrc::transfer_failed));
    return true;
}

void TorrentSession::onTorrentFile(uint64_t ticket, FetchResult result)
{
    if (pending_.find(ticket) == pending_.end())
    {
        return;
    }

    if (!result.ok)
    {
        postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
        return;
    }

    lt::error_code ec;
    auto info = std::make_shared<lt::torrent_info>(lt::span<char const>(result.body.data(), static_cast<std::ptrdiff_t>(result.body.size())), ec, lt::from_span);
    if (ec)
    {
        Logger::Log(LogLevel::WARN, "TorrentSession::onTorrentFile: Invalid .torrent: " + ec.message());
        postResult(ticket, make_error_code(StreamErrc::resolution_failed), nullptr);
        return;
    }

    lt::add_torrent_params params;
    params.ti = std::move(info);
    resolveParams(std::move(params), ticket);
}

void TorrentSession::resolveParams(lt::add_torrent_params params, uint64_t ticket)
{
    auto pending = pending_.find(ticket);
    if (pending == pending_.end())
    {
        return;
    }

    std::string id = sourceIdOf(params);
    pending->second.sourceId = id;

    auto existing = sources_.find(id);
    if (existing != sources_.end())
    {
        // Without metadata the waiter is completed by metadata_received_alert
        if (existing->second->hasMetadata())
        {
            postResult(ticket, {}, existing->second);
        }
        return;
    }

    if (!adding_.insert(id).second)
    {
        return;
    }

    params.save_path = config_.savePath;
    params.flags &= ~lt::torrent_flags::paused;
    params.flags &= ~lt::torrent_flags::auto_managed;

    if (removing_.count(id))
    {
        // Added again once torrent_removed_alert arrives
        readd_[id] = std::move(params);
        return;
    }

    Logger::Log(LogLevel::INFO, "TorrentSession::resolveParams: Adding torrent " + id);
    session_->async_add_torrent(std::move(params));
}

void TorrentSession::postResult(uint64_t ticket, const boost::system::error_code &ec, std::shared_ptr<ISourceHandle> source)
{
    std::weak_ptr<bool> alive = alive_;
    boost::asio::post(ioc_, [this, alive, ticket, ec, source = std::move(source)]()
                      {
                          if (alive.expired())
                              return;
                          auto it = pending_.find(ticket);
                          if (it == pending_.end())
                              return;
                          ResolveHandler handler = std::move(it->second.handler);
                          pending_.erase(it);
                          handler(ec, source); });
}

void TorrentSession::completeWaiting(const std::string &sourceId)
{
    auto source = sources_.find(sourceId);
    if (source == sources_.end())
    {
        return;
    }

    for (auto &[ticket, pending] : pending_)
    {
        if (pending.sourceId == sourceId)
        {
            postResult(ticket, {}, source->second);
        }
    }
}

void TorrentSession::failWaiting(const std::string &sourceId, const boost::system::error_code &ec)
{
    for (auto &[ticket, pending] : pending_)
    {
        if (pending.sourceId == sourceId)
        {
            postResult(ticket, ec, nullptr);
        }
    }
}

void TorrentSession::popAlerts()
{
    if (!session_)
    {
        return;
    }

    std::vector<lt::alert *> alerts;
    session_->pop_alerts(&alerts);
    for (lt::alert *alert : alerts)
    {
        handleAlert(alert);
    }
}

void TorrentSession::handleAlert(lt::alert *alert)
{
    if (auto *added = lt::alert_cast<lt::add_torrent_alert>(alert))
    {
        std::string id = sourceIdOf(added->params);
        adding_.erase(id);

        if (added->error)
        {
            Logger::Log(LogLevel::ERROR, "TorrentSession::handleAlert: Adding " + id + " failed: " + added->error.message());
            failWaiting(id, make_error_code(StreamErrc::resolution_failed));
            return;
        }

        auto source = std::make_shared<TorrentSource>(ioc_, added->handle, id, dispatcher_, config_);
        sources_[id] = source;
        if (!isWanted(id))
        {
            Logger::Log(LogLevel::DEBUG, "TorrentSession::handleAlert: Nobody waits for " + id + " anymore.");
            source.reset();
            releaseIfUnwanted(id);
            return;
        }

        if (added->handle.torrent_file())
        {
            source->onMetadata();
            completeWaiting(id);
        }
        else
        {
            Logger::Log(LogLevel::INFO, "TorrentSession::handleAlert: Waiting for metadata of " + id);
        }
        return;
    }

    if (auto *metadata = lt::alert_cast<lt::metadata_received_alert>(alert))
    {
        std::string id = infoHashHex(metadata->handle.info_hashes());
        auto it = sources_.find(id);
        if (it != sources_.end())
        {
            it->second->onMetadata();
            completeWaiting(id);
        }
        return;
    }

    if (auto *piece = lt::alert_cast<lt::read_piece_alert>(alert))
    {
        dispatcher_->onReadPiece(infoHashHex(piece->handle.info_hashes()), *piece);
        return;
    }

    if (auto *failed = lt::alert_cast<lt::metadata_failed_alert>(alert))
    {
        std::string id = infoHashHex(failed->handle.info_hashes());
        Logger::Log(LogLevel::WARN, "TorrentSession::handleAlert: Metadata of " + id + " invalid: " + failed->error.message());
        failWaiting(id, make_error_code(StreamErrc::resolution_failed));
        return;
    }

    if (auto *error = lt::alert_cast<lt::torrent_error_alert>(alert))
    {
        std::string id = infoHashHex(error->handle.info_hashes());
        Logger::Log(LogLevel::ERROR, "TorrentSession::handleAlert: " + id + ": " + error->message());
        dispatcher_->failSource(id, make_error_code(StreamErrc::transfer_failed));
        return;
    }

    if (auto *removed = lt::alert_cast<lt::torrent_removed_alert>(alert))
    {
        std::string id = infoHashHex(removed->info_hashes);
        if (removing_.erase(id) == 0)
        {
            sources_.erase(id);
            dispatcher_->failSource(id, make_error_code(StreamErrc::transfer_failed));
            return;
        }

        auto readd = readd_.find(id);
        if (readd != readd_.end())
        {
            lt::add_torrent_params params = std::move(readd->second);
            readd_.erase(readd);
            Logger::Log(LogLevel::INFO, "TorrentSession::handleAlert: Adding torrent " + id + " again");
            session_->async_add_torrent(std::move(params));
        }
        return;
    }

    if (alert->category() & lt::alert_category::error)
    {
        Logger::Log(LogLevel::WARN, "TorrentSession::handleAlert: " + alert->message());
    }
}
