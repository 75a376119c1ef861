// File: source_handle.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Contract between the streaming engine and the swarm engine that owns the data.

using ByteChunk = std::shared_ptr<const std::vector<char>>;
using ReadHandler = std::function<void(const boost::system::error_code &ec, ByteChunk chunk)>;

// Sequential reader over [start, end] of one file. The end of the range is
// reported as boost::asio::error::eof.
class IReadStream
{
public:
    // At most one read may be outstanding. The chunk is never larger than maxBytes.
    virtual void asyncRead(size_t maxBytes, ReadHandler handler) = 0;

    // Idempotent. A pending handler is dropped, never invoked after close().
    virtual void close() = 0;

    virtual ~IReadStream() = default;
};

// Optional capability of a source file: piece-level download hints.
class IPrioritizable
{
public:
    virtual void prioritizePieces(uint32_t firstPiece, uint32_t count) = 0;
    virtual ~IPrioritizable() = default;
};

class ISourceFile
{
public:
    virtual const std::string &name() const = 0;
    virtual uint64_t length() const = 0;
    // Byte offset of the file inside the swarm item
    virtual uint64_t offset() const = 0;
    virtual uint64_t pieceLength() const = 0;
    virtual uint32_t firstPiece() const = 0;
    virtual uint32_t lastPiece() const = 0;

    // Marks the file as wanted. Safe to call from several streams.
    virtual void select() = 0;

    // nullptr when the source cannot take piece hints
    virtual IPrioritizable *prioritizable()
    {
        return nullptr;
    }

    virtual std::unique_ptr<IReadStream> openReadStream(uint64_t start, uint64_t end) = 0;

    virtual ~ISourceFile() = default;
};

class ISourceHandle
{
public:
    virtual const std::string &id() const = 0;
    virtual const std::string &name() const = 0;
    virtual size_t fileCount() const = 0;
    // nullptr when index is out of range
    virtual std::shared_ptr<ISourceFile> file(size_t index) = 0;
    // Resumes the transfer. Idempotent.
    virtual void activate() = 0;

    virtual ~ISourceHandle() = default;
};

using ResolveHandler = std::function<void(const boost::system::error_code &ec, std::shared_ptr<ISourceHandle> source)>;

class ISourceResolver
{
public:
    // Returns a ticket usable with cancel(). The handler runs on the caller's io_context.
    virtual uint64_t asyncResolve(const std::string &identifier, ResolveHandler handler) = 0;

    // Abandons a pending resolution; its handler is never invoked.
    virtual void cancel(uint64_t ticket) = 0;

    virtual ~ISourceResolver() = default;
};
