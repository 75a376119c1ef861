// File: torrent_source.cpp
#include "torrent_source.hpp"
#include "logger.hpp"
#include "stream_errors.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <libtorrent/download_priority.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

std::string infoHashHex(const lt::info_hash_t &hashes)
{
    std::ostringstream os;
    os << hashes.get_best();
    return os.str();
}

uint64_t PieceDispatcher::request(const std::string &sourceId, lt::torrent_handle handle, lt::piece_index_t piece, int deadlineMs, PieceHandler handler)
{
    Key key{sourceId, static_cast<int>(piece)};
    uint64_t id = nextId_++;

    auto &list = waiters_[key];
    bool first = list.empty();
    list.push_back(Waiter{id, std::move(handler)});
    keys_[id] = key;

    if (first)
    {
        try
        {
            // Delivers a read_piece_alert as soon as the piece is on disk, immediately if it already is
            handle.set_piece_deadline(piece, deadlineMs, lt::torrent_handle::alert_when_available);
        }
        catch (const std::exception &e)
        {
            // Invalid handle: the torrent was removed underneath the stream
            Logger::Log(LogLevel::WARN, "PieceDispatcher::request: Piece " + std::to_string(static_cast<int>(piece)) +
                                            " of " + sourceId + " unavailable: " + e.what());
            waiters_.erase(key);
            keys_.erase(id);
            return 0;
        }
    }

    return id;
}

void PieceDispatcher::cancel(uint64_t waiterId)
{
    auto keyIt = keys_.find(waiterId);
    if (keyIt == keys_.end())
    {
        return;
    }

    auto listIt = waiters_.find(keyIt->second);
    keys_.erase(keyIt);
    if (listIt == waiters_.end())
    {
        return;
    }

    auto &list = listIt->second;
    list.erase(std::remove_if(list.begin(), list.end(), [waiterId](const Waiter &w)
                              { return w.id == waiterId; }),
               list.end());
    if (list.empty())
    {
        waiters_.erase(listIt);
    }
}

void PieceDispatcher::onReadPiece(const std::string &sourceId, const lt::read_piece_alert &alert)
{
    auto it = waiters_.find(Key{sourceId, static_cast<int>(alert.piece)});
    if (it == waiters_.end())
    {
        return;
    }

    // Handlers may cancel or request again, so the list is detached first.
    // Keys stay registered until each handler runs so a cancel from an earlier handler still counts.
    std::vector<Waiter> ready = std::move(it->second);
    waiters_.erase(it);

    boost::system::error_code ec;
    std::shared_ptr<const std::vector<char>> data;
    if (alert.error)
    {
        Logger::Log(LogLevel::WARN, "PieceDispatcher::onReadPiece: Reading piece " + std::to_string(static_cast<int>(alert.piece)) +
                                        " of " + sourceId + " failed: " + alert.error.message());
        ec = make_error_code(StreamErrc::transfer_failed);
    }
    else
    {
        data = std::make_shared<const std::vector<char>>(alert.buffer.get(), alert.buffer.get() + alert.size);
    }

    for (auto &waiter : ready)
    {
        if (keys_.erase(waiter.id) == 0)
        {
            continue;
        }
        waiter.handler(ec, data);
    }
}

void PieceDispatcher::failSource(const std::string &sourceId, const boost::system::error_code &ec)
{
    std::vector<Waiter> failed;
    for (auto it = waiters_.begin(); it != waiters_.end();)
    {
        if (it->first.first == sourceId)
        {
            for (auto &waiter : it->second)
            {
                failed.push_back(std::move(waiter));
            }
            it = waiters_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (auto &waiter : failed)
    {
        if (keys_.erase(waiter.id) == 0)
        {
            continue;
        }
        waiter.handler(ec, nullptr);
    }
}

TorrentReadStream::TorrentReadStream(boost::asio::io_context &ioc, lt::torrent_handle handle, std::shared_ptr<const lt::torrent_info> info,
                                     std::string sourceId, int fileIndex, uint64_t start, uint64_t end,
                                     std::shared_ptr<PieceDispatcher> dispatcher, int deadlineMs)
    : ioc_(ioc), handle_(std::move(handle)), info_(std::move(info)), sourceId_(std::move(sourceId)),
      fileIndex_(fileIndex), position_(start), end_(end), dispatcher_(std::move(dispatcher)), deadlineMs_(deadlineMs) {}

TorrentReadStream::~TorrentReadStream()
{
    close();
}

void TorrentReadStream::asyncRead(size_t maxBytes, ReadHandler handler)
{
    if (closed_)
    {
        return;
    }

    if (position_ > end_)
    {
        post(std::move(handler), boost::asio::error::eof, nullptr);
        return;
    }

    lt::peer_request request = info_->map_file(lt::file_index_t(fileIndex_), static_cast<std::int64_t>(position_), 1);
    int piece = static_cast<int>(request.piece);

    if (cached_ && cachedPiece_ == piece)
    {
        deliver(request.start, maxBytes, std::move(handler));
        return;
    }

    cached_.reset();
    cachedPiece_ = -1;
    pending_ = std::move(handler);
    pendingMax_ = maxBytes;
    pendingOffset_ = request.start;

    std::weak_ptr<bool> alive = alive_;
    waiterId_ = dispatcher_->request(sourceId_, handle_, request.piece, deadlineMs_,
                                     [this, alive, piece](const boost::system::error_code &ec, std::shared_ptr<const std::vector<char>> data)
                                     {
                                         if (alive.expired())
                                             return;
                                         onPiece(piece, ec, std::move(data));
                                     });
    if (waiterId_ == 0 && pending_)
    {
        ReadHandler failed = std::move(pending_);
        pending_ = nullptr;
        post(std::move(failed), make_error_code(StreamErrc::transfer_failed), nullptr);
    }
}

void TorrentReadStream::onPiece(int piece, const boost::system::error_code &ec, std::shared_ptr<const std::vector<char>> data)
{
    waiterId_ = 0;
    if (closed_ || !pending_)
    {
        return;
    }

    ReadHandler handler = std::move(pending_);
    pending_ = nullptr;

    if (ec || !data)
    {
        post(std::move(handler), ec ? ec : make_error_code(StreamErrc::transfer_failed), nullptr);
        return;
    }

    cachedPiece_ = piece;
    cached_ = std::move(data);
    deliver(pendingOffset_, pendingMax_, std::move(handler));
}

void TorrentReadStream::deliver(int offsetInPiece, size_t maxBytes, ReadHandler handler)
{
    if (offsetInPiece < 0 || static_cast<size_t>(offsetInPiece) >= cached_->size())
    {
        Logger::Log(LogLevel::ERROR, "TorrentReadStream::deliver: Offset " + std::to_string(offsetInPiece) +
                                         " outside piece " + std::to_string(cachedPiece_) + " of " + sourceId_);
        post(std::move(handler), make_error_code(StreamErrc::transfer_failed), nullptr);
        return;
    }

    uint64_t n = std::min<uint64_t>({static_cast<uint64_t>(maxBytes),
                                     cached_->size() - static_cast<size_t>(offsetInPiece),
                                     end_ - position_ + 1});
    auto begin = cached_->begin() + offsetInPiece;
    auto chunk = std::make_shared<const std::vector<char>>(begin, begin + static_cast<std::ptrdiff_t>(n));
    position_ += n;

    post(std::move(handler), {}, std::move(chunk));
}

void TorrentReadStream::post(ReadHandler handler, const boost::system::error_code &ec, ByteChunk chunk)
{
    std::weak_ptr<bool> alive = alive_;
    boost::asio::post(ioc_, [this, alive, handler = std::move(handler), ec, chunk = std::move(chunk)]()
                      {
                          if (alive.expired() || closed_)
                              return;
                          handler(ec, chunk); });
}

void TorrentReadStream::close()
{
    if (closed_)
    {
        return;
    }
    closed_ = true;

    if (waiterId_ != 0)
    {
        dispatcher_->cancel(waiterId_);
        waiterId_ = 0;
    }
    pending_ = nullptr;
    cached_.reset();
}

TorrentFile::TorrentFile(boost::asio::io_context &ioc, lt::torrent_handle handle, std::shared_ptr<const lt::torrent_info> info,
                         std::string sourceId, int index, std::shared_ptr<PieceDispatcher> dispatcher, int deadlineMs)
    : ioc_(ioc), handle_(std::move(handle)), info_(std::move(info)), sourceId_(std::move(sourceId)), index_(index),
      dispatcher_(std::move(dispatcher)), deadlineMs_(deadlineMs)
{
    const lt::file_storage &files = info_->files();
    lt::file_index_t fileIndex(index_);

    name_ = files.file_path(fileIndex);
    length_ = static_cast<uint64_t>(files.file_size(fileIndex));
    offset_ = static_cast<uint64_t>(files.file_offset(fileIndex));
    pieceLength_ = static_cast<uint64_t>(info_->piece_length());

    uint64_t maxPiece = info_->num_pieces() > 0 ? static_cast<uint64_t>(info_->num_pieces() - 1) : 0;
    firstPiece_ = static_cast<uint32_t>(std::min(offset_ / pieceLength_, maxPiece));
    lastPiece_ = static_cast<uint32_t>(std::min((offset_ + std::max<uint64_t>(length_, 1) - 1) / pieceLength_, maxPiece));
}

void TorrentFile::select()
{
    handle_.file_priority(lt::file_index_t(index_), lt::default_priority);
}

void TorrentFile::prioritizePieces(uint32_t firstPiece, uint32_t count)
{
    for (uint32_t i = 0; i < count; ++i)
    {
        lt::piece_index_t piece(static_cast<int>(firstPiece + i));
        handle_.piece_priority(piece, lt::top_priority);
        handle_.set_piece_deadline(piece, deadlineMs_ * static_cast<int>(i + 1));
    }
}

std::unique_ptr<IReadStream> TorrentFile::openReadStream(uint64_t start, uint64_t end)
{
    if (start > end || end >= length_)
    {
        throw std::out_of_range("TorrentFile::openReadStream: [" + std::to_string(start) + ", " + std::to_string(end) +
                                "] outside " + name_);
    }

    return std::make_unique<TorrentReadStream>(ioc_, handle_, info_, sourceId_, index_, start, end, dispatcher_, deadlineMs_);
}

TorrentSource::TorrentSource(boost::asio::io_context &ioc, lt::torrent_handle handle, std::string id,
                             std::shared_ptr<PieceDispatcher> dispatcher, const TorrentConfig &config)
    : ioc_(ioc), handle_(std::move(handle)), id_(std::move(id)), name_(id_), dispatcher_(std::move(dispatcher)),
      minUploadLimit_(config.minUploadLimit), pieceDeadlineMs_(config.pieceDeadlineMs) {}

size_t TorrentSource::fileCount() const
{
    return info_ ? static_cast<size_t>(info_->num_files()) : 0;
}

std::shared_ptr<ISourceFile> TorrentSource::file(size_t index)
{
    if (index >= fileCount())
    {
        return nullptr;
    }

    if (!files_[index])
    {
        files_[index] = std::make_shared<TorrentFile>(ioc_, handle_, info_, id_, static_cast<int>(index), dispatcher_, pieceDeadlineMs_);
    }
    return files_[index];
}

void TorrentSource::activate()
{
    handle_.resume();

    // Minimum upload rate while streaming
    int limit = handle_.upload_limit();
    if (limit > 0 && limit < minUploadLimit_)
    {
        handle_.set_upload_limit(minUploadLimit_);
        Logger::Log(LogLevel::DEBUG, "TorrentSource::activate: Raised upload limit of " + name_ + " to " + std::to_string(minUploadLimit_));
    }
}

void TorrentSource::onMetadata()
{
    if (info_)
    {
        return;
    }

    info_ = handle_.torrent_file();
    if (!info_)
    {
        return;
    }

    name_ = info_->name();
    files_.assign(static_cast<size_t>(info_->num_files()), nullptr);

    // Only files that are streamed get downloaded
    handle_.prioritize_files(std::vector<lt::download_priority_t>(files_.size(), lt::dont_download));

    Logger::Log(LogLevel::INFO, "TorrentSource::onMetadata: " + name_ + " (" + id_ + ") has " +
                                    std::to_string(files_.size()) + " files, piece length " + std::to_string(info_->piece_length()));
}
