// File: torrent_source.hpp
#pragma once
#include "source_handle.hpp"
#include "stream_config.hpp"
#include <boost/asio/io_context.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lt = libtorrent;

std::string infoHashHex(const lt::info_hash_t &hashes);

// Fans read_piece_alert results out to the read streams waiting for a piece.
// Readers of the same piece share one deadline request and one result.
class PieceDispatcher
{
public:
    using PieceHandler = std::function<void(const boost::system::error_code &ec, std::shared_ptr<const std::vector<char>> piece)>;

    // Returns 0 and drops the handler if the piece cannot be requested
    uint64_t request(const std::string &sourceId, lt::torrent_handle handle, lt::piece_index_t piece, int deadlineMs, PieceHandler handler);
    void cancel(uint64_t waiterId);

    void onReadPiece(const std::string &sourceId, const lt::read_piece_alert &alert);
    // Fails every waiter of a source (torrent error or removal)
    void failSource(const std::string &sourceId, const boost::system::error_code &ec);

    size_t waiterCount() const { return keys_.size(); }

private:
    using Key = std::pair<std::string, int>;
    struct Waiter
    {
        uint64_t id;
        PieceHandler handler;
    };

    std::map<Key, std::vector<Waiter>> waiters_;
    std::map<uint64_t, Key> keys_;
    uint64_t nextId_ = 1;
};

class TorrentReadStream : public IReadStream
{
public:
    TorrentReadStream(boost::asio::io_context &ioc, lt::torrent_handle handle, std::shared_ptr<const lt::torrent_info> info,
                      std::string sourceId, int fileIndex, uint64_t start, uint64_t end,
                      std::shared_ptr<PieceDispatcher> dispatcher, int deadlineMs);
    ~TorrentReadStream() override;

    void asyncRead(size_t maxBytes, ReadHandler handler) override;
    void close() override;

private:
    void onPiece(int piece, const boost::system::error_code &ec, std::shared_ptr<const std::vector<char>> data);
    void deliver(int offsetInPiece, size_t maxBytes, ReadHandler handler);
    void post(ReadHandler handler, const boost::system::error_code &ec, ByteChunk chunk);

    boost::asio::io_context &ioc_;
    lt::torrent_handle handle_;
    std::shared_ptr<const lt::torrent_info> info_;
    std::string sourceId_;
    int fileIndex_;
    uint64_t position_;
    const uint64_t end_;
    std::shared_ptr<PieceDispatcher> dispatcher_;
    int deadlineMs_;

    int cachedPiece_ = -1;
    std::shared_ptr<const std::vector<char>> cached_;

    ReadHandler pending_;
    size_t pendingMax_ = 0;
    int pendingOffset_ = 0;
    uint64_t waiterId_ = 0;
    bool closed_ = false;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

class TorrentFile : public ISourceFile, public IPrioritizable
{
public:
    TorrentFile(boost::asio::io_context &ioc, lt::torrent_handle handle, std::shared_ptr<const lt::torrent_info> info,
                std::string sourceId, int index, std::shared_ptr<PieceDispatcher> dispatcher, int deadlineMs);

    const std::string &name() const override { return name_; }
    uint64_t length() const override { return length_; }
    uint64_t offset() const override { return offset_; }
    uint64_t pieceLength() const override { return pieceLength_; }
    uint32_t firstPiece() const override { return firstPiece_; }
    uint32_t lastPiece() const override { return lastPiece_; }

    void select() override;
    IPrioritizable *prioritizable() override { return this; }
    void prioritizePieces(uint32_t firstPiece, uint32_t count) override;

    std::unique_ptr<IReadStream> openReadStream(uint64_t start, uint64_t end) override;

private:
    boost::asio::io_context &ioc_;
    lt::torrent_handle handle_;
    std::shared_ptr<const lt::torrent_info> info_;
    std::string sourceId_;
    int index_;
    std::shared_ptr<PieceDispatcher> dispatcher_;
    int deadlineMs_;

    std::string name_;
    uint64_t length_ = 0;
    uint64_t offset_ = 0;
    uint64_t pieceLength_ = 0;
    uint32_t firstPiece_ = 0;
    uint32_t lastPiece_ = 0;
};

class TorrentSource : public ISourceHandle
{
public:
    TorrentSource(boost::asio::io_context &ioc, lt::torrent_handle handle, std::string id,
                  std::shared_ptr<PieceDispatcher> dispatcher, const TorrentConfig &config);

    const std::string &id() const override { return id_; }
    const std::string &name() const override { return name_; }
    size_t fileCount() const override;
    std::shared_ptr<ISourceFile> file(size_t index) override;
    void activate() override;

    bool hasMetadata() const { return info_ != nullptr; }
    // Loads the torrent_info once metadata is known and deselects every file
    void onMetadata();

    const lt::torrent_handle &handle() const { return handle_; }

private:
    boost::asio::io_context &ioc_;
    lt::torrent_handle handle_;
    std::string id_;
    std::string name_;
    std::shared_ptr<const lt::torrent_info> info_;
    std::shared_ptr<PieceDispatcher> dispatcher_;
    int minUploadLimit_;
    int pieceDeadlineMs_;
    std::vector<std::shared_ptr<TorrentFile>> files_;
};
