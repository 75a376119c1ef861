// File: transfer_pipe.hpp
#pragma once
#include "response_writer.hpp"
#include "source_handle.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <memory>

// Moves the bytes of one window from a source read stream to the client.
// Pull loop: a chunk is read only after the previous one was drained, so at
// most one chunk is ever held between the source and the transport.
class TransferPipe : public std::enable_shared_from_this<TransferPipe>
{
public:
    struct Callbacks
    {
        std::function<void(size_t bytes)> onChunk;
        std::function<void()> onDrain;
        std::function<void()> onEnd;
        std::function<void(const boost::system::error_code &ec)> onError;
    };

    // `source` may be null only when expectedBytes is zero.
    TransferPipe(std::unique_ptr<IReadStream> source, std::shared_ptr<IResponseWriter> writer,
                 uint64_t expectedBytes, size_t readChunkSize, Callbacks callbacks);
    ~TransferPipe();

    TransferPipe(const TransferPipe &) = delete;
    TransferPipe &operator=(const TransferPipe &) = delete;

    void start();

    // Idempotent. Closes the source; no callback fires afterwards.
    void stop();

    bool isStopped() const { return stopped_; }
    // True while a written chunk waits for the transport to drain
    bool isPaused() const { return writeInFlight_; }
    uint64_t bytesRead() const { return bytesRead_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

private:
    void readNext();
    void onRead(const boost::system::error_code &ec, ByteChunk chunk);
    void onWritten(const boost::system::error_code &ec, size_t bytes);
    void fail(const boost::system::error_code &ec);

    std::unique_ptr<IReadStream> source_;
    std::shared_ptr<IResponseWriter> writer_;
    const uint64_t expectedBytes_;
    const size_t readChunkSize_;
    Callbacks callbacks_;

    uint64_t bytesRead_ = 0;
    uint64_t bytesWritten_ = 0;
    bool started_ = false;
    bool stopped_ = false;
    bool readInFlight_ = false;
    bool writeInFlight_ = false;
};
