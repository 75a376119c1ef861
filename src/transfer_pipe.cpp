// File: transfer_pipe.cpp
#include "transfer_pipe.hpp"
#include "logger.hpp"
#include "stream_errors.hpp"
#include <boost/asio/error.hpp>
#include <algorithm>

TransferPipe::TransferPipe(std::unique_ptr<IReadStream> source, std::shared_ptr<IResponseWriter> writer,
                           uint64_t expectedBytes, size_t readChunkSize, Callbacks callbacks)
    : source_(std::move(source)), writer_(std::move(writer)), expectedBytes_(expectedBytes),
      readChunkSize_(readChunkSize), callbacks_(std::move(callbacks)) {}

TransferPipe::~TransferPipe()
{
    if (source_)
    {
        source_->close();
    }
}

void TransferPipe::start()
{
    if (started_ || stopped_)
    {
        return;
    }
    started_ = true;

    if (expectedBytes_ == 0)
    {
        writeInFlight_ = true;
        writer_->asyncWriteHead([self = shared_from_this()](const boost::system::error_code &ec)
                                { self->onWritten(ec, 0); });
        return;
    }

    readNext();
}

void TransferPipe::stop()
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;

    if (source_)
    {
        source_->close();
    }
}

void TransferPipe::readNext()
{
    if (stopped_ || readInFlight_ || writeInFlight_)
    {
        return;
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(readChunkSize_, expectedBytes_ - bytesRead_));
    readInFlight_ = true;
    source_->asyncRead(want, [self = shared_from_this()](const boost::system::error_code &ec, ByteChunk chunk)
                       { self->onRead(ec, std::move(chunk)); });
}

void TransferPipe::onRead(const boost::system::error_code &ec, ByteChunk chunk)
{
    readInFlight_ = false;
    if (stopped_)
    {
        return;
    }

    if (ec)
    {
        if (ec == boost::asio::error::eof)
        {
            // The source ended before the window was filled: the body would be short
            Logger::Log(LogLevel::WARN, "TransferPipe::onRead: Source ended after " + std::to_string(bytesRead_) +
                                            " of " + std::to_string(expectedBytes_) + " bytes.");
            fail(make_error_code(StreamErrc::transfer_failed));
            return;
        }
        fail(ec);
        return;
    }

    if (!chunk || chunk->empty())
    {
        Logger::Log(LogLevel::WARN, "TransferPipe::onRead: Source returned an empty chunk.");
        fail(make_error_code(StreamErrc::transfer_failed));
        return;
    }

    uint64_t remaining = expectedBytes_ - bytesRead_;
    if (chunk->size() > remaining)
    {
        // Never forward bytes past the end of the window
        chunk = std::make_shared<const std::vector<char>>(chunk->begin(), chunk->begin() + static_cast<std::ptrdiff_t>(remaining));
    }

    size_t size = chunk->size();
    bytesRead_ += size;
    if (callbacks_.onChunk)
    {
        callbacks_.onChunk(size);
    }
    if (stopped_)
    {
        return;
    }

    writeInFlight_ = true;
    writer_->asyncWriteBody(std::move(chunk), [self = shared_from_this(), size](const boost::system::error_code &writeEc)
                            { self->onWritten(writeEc, size); });
}

void TransferPipe::onWritten(const boost::system::error_code &ec, size_t bytes)
{
    writeInFlight_ = false;
    if (stopped_)
    {
        return;
    }

    if (ec)
    {
        fail(ec);
        return;
    }

    bytesWritten_ += bytes;
    if (bytesWritten_ >= expectedBytes_)
    {
        if (callbacks_.onEnd)
        {
            callbacks_.onEnd();
        }
        return;
    }

    if (callbacks_.onDrain)
    {
        callbacks_.onDrain();
    }
    readNext();
}

void TransferPipe::fail(const boost::system::error_code &ec)
{
    Logger::Log(LogLevel::DEBUG, "TransferPipe::fail: " + ec.message());
    if (callbacks_.onError)
    {
        callbacks_.onError(ec);
    }
}
