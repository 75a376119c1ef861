// File: stream_session.cpp
#include "stream_session.hpp"
#include "logger.hpp"
#include "mime_types.hpp"
#include "stream_errors.hpp"
#include <boost/asio/error.hpp>
#include <atomic>
#include <exception>

namespace net = boost::asio;

StreamSession::StreamSession(net::io_context &ioc, StreamRequest request, const StreamConfig &config,
                             ISourceResolver &resolver, ResourceRegistry &registry, std::shared_ptr<IResponseWriter> writer)
    : request_(std::move(request)), config_(config), resolver_(resolver), registry_(registry),
      writer_(std::move(writer)), id_(nextStreamId()),
      resolverTimer_(ioc), inactivityTimer_(ioc), globalTimer_(ioc),
      startedAt_(std::chrono::steady_clock::now()), lastActivityAt_(startedAt_) {}

StreamSession::~StreamSession()
{
    // Normally finish() already ran; this only covers an owner dropping a live session
    if (!isTerminal(state_))
    {
        Logger::Log(LogLevel::WARN, "StreamSession::~StreamSession: [" + id_ + "] Destroyed in state " + ToString(state_));
        if (resolvePending_)
        {
            resolver_.cancel(resolveTicket_);
        }
        if (pipe_)
        {
            pipe_->stop();
        }
        if (registered_)
        {
            registry_.unregisterStream(id_, StreamState::ERRORED);
        }
    }
}

std::string StreamSession::nextStreamId()
{
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(now) + "-" + std::to_string(++counter);
}

void StreamSession::start()
{
    if (state_ != StreamState::INIT || resolvePending_)
    {
        return;
    }

    Logger::Log(LogLevel::INFO, "StreamSession::start: [" + id_ + "] " + (request_.headOnly ? "HEAD" : "GET") +
                                    " " + request_.identifier + " file " + std::to_string(request_.fileIndex) +
                                    " range " + request_.rangeHeader.value_or("none") + " client " + request_.clientId);

    std::weak_ptr<StreamSession> weak = weak_from_this();

    globalTimer_.expires_after(config_.globalTimeout);
    globalTimer_.async_wait([weak](const boost::system::error_code &ec)
                            {
                                if (auto self = weak.lock())
                                    self->onGlobalTimeout(ec); });

    resolverTimer_.expires_after(config_.resolverTimeout);
    resolverTimer_.async_wait([weak](const boost::system::error_code &ec)
                              {
                                  if (auto self = weak.lock())
                                      self->onResolverTimeout(ec); });

    resolvePending_ = true;
    uint64_t ticket = resolver_.asyncResolve(request_.identifier,
                                             [weak](const boost::system::error_code &ec, std::shared_ptr<ISourceHandle> source)
                                             {
                                                 if (auto self = weak.lock())
                                                     self->onResolved(ec, std::move(source));
                                             });
    resolveTicket_ = ticket;
}

void StreamSession::onResolved(const boost::system::error_code &ec, std::shared_ptr<ISourceHandle> source)
{
    if (!resolvePending_ || isTerminal(state_))
    {
        return;
    }
    resolvePending_ = false;
    resolverTimer_.cancel();

    if (ec || !source)
    {
        Logger::Log(LogLevel::WARN, "StreamSession::onResolved: [" + id_ + "] Could not resolve " + request_.identifier +
                                        (ec ? ": " + ec.message() : std::string()));
        finish(StreamState::ERRORED, make_error_code(StreamErrc::resolution_failed));
        return;
    }

    source_ = std::move(source);
    file_ = source_->file(request_.fileIndex);
    if (!file_)
    {
        Logger::Log(LogLevel::WARN, "StreamSession::onResolved: [" + id_ + "] File index " + std::to_string(request_.fileIndex) +
                                        " out of range, " + source_->name() + " has " + std::to_string(source_->fileCount()) + " files.");
        finish(StreamState::ERRORED, make_error_code(StreamErrc::file_not_found));
        return;
    }

    try
    {
        source_->activate();
        file_->select();
    }
    catch (const std::exception &e)
    {
        Logger::Log(LogLevel::ERROR, "StreamSession::onResolved: [" + id_ + "] Failed to activate source: " + std::string(e.what()));
        finish(StreamState::ERRORED, make_error_code(StreamErrc::transfer_failed));
        return;
    }

    registry_.recordSourceActivity(source_->id(), source_->name());

    std::string contentType = resolveContentType(file_->name(), config_.defaultMimeType);
    uint64_t fileLength = file_->length();

    if (request_.headOnly)
    {
        window_ = RangeWindow{};
        window_.total = fileLength;
        window_.end = fileLength == 0 ? 0 : fileLength - 1;
        respondHead(buildHead(contentType));
        return;
    }

    RangeOutcome outcome = interpretRange(request_.rangeHeader, fileLength, RangeOptions{config_.maxChunkSize});
    if (outcome.malformed)
    {
        Logger::Log(LogLevel::WARN, "StreamSession::onResolved: [" + id_ + "] Unusable Range header '" +
                                        request_.rangeHeader.value_or("") + "' for " + std::to_string(fileLength) + " bytes.");
        if (config_.rejectUnsatisfiableRanges)
        {
            rejectRange(fileLength);
            return;
        }
    }
    window_ = outcome.window;

    SeekPrioritizer(config_.priorityPieces, config_.prioritizeSeeks).apply(window_.start, *file_, id_);

    beginTransfer(buildHead(contentType));
}

ResponseHead StreamSession::buildHead(const std::string &contentType) const
{
    ResponseHead head;
    head.status = request_.headOnly ? 200 : window_.status();
    head.contentLength = request_.headOnly ? window_.total : window_.length();
    head.set("Content-Type", contentType);
    head.set("Accept-Ranges", "bytes");
    if (head.status == 206)
    {
        head.set("Content-Range", contentRangeValue(window_));
    }
    head.set("Connection", "keep-alive");
    head.set("Cache-Control", "no-cache, no-store");
    head.set("ETag", "\"" + source_->id() + "-" + std::to_string(request_.fileIndex) + "-" + std::to_string(window_.total) + "\"");
    return head;
}

void StreamSession::respondHead(ResponseHead head)
{
    state_ = StreamState::ACTIVE;
    writer_->setHead(std::move(head));

    std::weak_ptr<StreamSession> weak = weak_from_this();
    writer_->asyncWriteHead([weak](const boost::system::error_code &ec)
                            {
                                auto self = weak.lock();
                                if (!self)
                                    return;
                                if (ec)
                                    self->finish(StreamState::ERRORED, ec);
                                else
                                    self->finish(StreamState::COMPLETED, {}); });
}

void StreamSession::rejectRange(uint64_t total)
{
    window_ = RangeWindow{};
    window_.total = total;
    finish(StreamState::ERRORED, make_error_code(StreamErrc::range_not_satisfiable));
}

void StreamSession::beginTransfer(ResponseHead head)
{
    std::unique_ptr<IReadStream> reader;
    if (window_.length() > 0)
    {
        try
        {
            reader = file_->openReadStream(window_.start, window_.end);
        }
        catch (const std::exception &e)
        {
            Logger::Log(LogLevel::ERROR, "StreamSession::beginTransfer: [" + id_ + "] Failed to open read stream: " + std::string(e.what()));
        }

        if (!reader)
        {
            finish(StreamState::ERRORED, make_error_code(StreamErrc::transfer_failed));
            return;
        }
    }

    state_ = StreamState::ACTIVE;
    lastActivityAt_ = std::chrono::steady_clock::now();

    StreamSnapshot snapshot;
    snapshot.streamId = id_;
    snapshot.sourceId = source_->id();
    snapshot.sourceName = source_->name();
    snapshot.fileName = file_->name();
    snapshot.startedAt = startedAt_;
    snapshot.lastActivity = lastActivityAt_;
    registry_.registerStream(std::move(snapshot));
    registered_ = true;

    writer_->setHead(std::move(head));
    armInactivityTimer();

    std::weak_ptr<StreamSession> weak = weak_from_this();
    TransferPipe::Callbacks callbacks;
    callbacks.onChunk = [weak](size_t bytes)
    {
        if (auto self = weak.lock())
            self->onChunk(bytes);
    };
    callbacks.onDrain = [weak]()
    {
        if (auto self = weak.lock())
            self->armInactivityTimer();
    };
    callbacks.onEnd = [weak]()
    {
        if (auto self = weak.lock())
            self->finish(StreamState::COMPLETED, {});
    };
    callbacks.onError = [weak](const boost::system::error_code &ec)
    {
        if (auto self = weak.lock())
            self->finish(StreamState::ERRORED, ec);
    };

    Logger::Log(LogLevel::INFO, "StreamSession::beginTransfer: [" + id_ + "] Streaming " + file_->name() + " " +
                                    (window_.total == 0 ? std::string("(empty)") : contentRangeValue(window_)) +
                                    " status " + std::to_string(window_.status()));

    pipe_ = std::make_shared<TransferPipe>(std::move(reader), writer_, window_.length(), config_.readChunkSize, std::move(callbacks));
    pipe_->start();
}

void StreamSession::onChunk(size_t bytes)
{
    if (state_ != StreamState::ACTIVE)
    {
        return;
    }

    bytesTransferred_ += bytes;
    lastActivityAt_ = std::chrono::steady_clock::now();
    registry_.touch(id_, bytes, lastActivityAt_);
    armInactivityTimer();
}

void StreamSession::armInactivityTimer()
{
    if (state_ != StreamState::ACTIVE)
    {
        return;
    }

    std::weak_ptr<StreamSession> weak = weak_from_this();
    inactivityTimer_.expires_after(config_.streamTimeout);
    inactivityTimer_.async_wait([weak](const boost::system::error_code &ec)
                                {
                                    if (auto self = weak.lock())
                                        self->onInactivityTimeout(ec); });
}

void StreamSession::onInactivityTimeout(const boost::system::error_code &ec)
{
    if (ec == net::error::operation_aborted || state_ != StreamState::ACTIVE)
    {
        return;
    }
    // A completion queued just before the timer was re-armed
    if (inactivityTimer_.expiry() > std::chrono::steady_clock::now())
    {
        return;
    }

    Logger::Log(LogLevel::WARN, "StreamSession::onInactivityTimeout: [" + id_ + "] No data for " +
                                    std::to_string(config_.streamTimeout.count()) + "ms.");
    finish(StreamState::TIMED_OUT, make_error_code(StreamErrc::inactivity_timeout));
}

void StreamSession::onGlobalTimeout(const boost::system::error_code &ec)
{
    if (ec == net::error::operation_aborted || isTerminal(state_))
    {
        return;
    }

    Logger::Log(LogLevel::WARN, "StreamSession::onGlobalTimeout: [" + id_ + "] Request exceeded " +
                                    std::to_string(config_.globalTimeout.count()) + "ms.");
    finish(StreamState::TIMED_OUT, make_error_code(StreamErrc::global_timeout));
}

void StreamSession::onResolverTimeout(const boost::system::error_code &ec)
{
    if (ec == net::error::operation_aborted || !resolvePending_ || isTerminal(state_))
    {
        return;
    }

    Logger::Log(LogLevel::WARN, "StreamSession::onResolverTimeout: [" + id_ + "] ResolverTimeout for " + request_.identifier +
                                    " after " + std::to_string(config_.resolverTimeout.count()) + "ms.");
    finish(StreamState::TIMED_OUT, make_error_code(StreamErrc::resolver_timeout));
}

void StreamSession::onClientDisconnect()
{
    if (isTerminal(state_))
    {
        return;
    }

    finish(StreamState::DISCONNECTED, make_error_code(StreamErrc::client_disconnected));
}

bool StreamSession::finish(StreamState state, const boost::system::error_code &ec)
{
    if (isTerminal(state_))
    {
        return false;
    }

    auto self = shared_from_this();
    state_ = state;
    ++teardowns_;

    resolverTimer_.cancel();
    inactivityTimer_.cancel();
    globalTimer_.cancel();

    if (resolvePending_)
    {
        resolvePending_ = false;
        resolver_.cancel(resolveTicket_);
    }

    if (pipe_)
    {
        pipe_->stop();
    }

    if (registered_)
    {
        registered_ = false;
        registry_.unregisterStream(id_, state);
    }

    logOutcome(ec);

    if (state == StreamState::COMPLETED)
    {
        writer_->complete();
    }
    else if (state == StreamState::DISCONNECTED || writer_->headersSent())
    {
        writer_->abort();
    }
    else
    {
        unsigned status = httpStatusFor(ec);
        std::vector<std::pair<std::string, std::string>> fields;
        if (status == 416)
        {
            fields.emplace_back("Content-Range", unsatisfiedRangeValue(window_.total));
        }
        std::string message = ec.category() == streamCategory() ? ec.message() : make_error_code(StreamErrc::transfer_failed).message();
        writer_->sendError(status, message, std::move(fields), status == 404 || status == 416);
    }

    pipe_.reset();
    file_.reset();
    source_.reset();

    if (completion_)
    {
        CompletionHandler handler = std::move(completion_);
        completion_ = nullptr;
        handler(state);
    }

    return true;
}

void StreamSession::logOutcome(const boost::system::error_code &ec) const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt_).count();
    uint64_t throughput = elapsed > 0 ? bytesTransferred_ * 1000 / static_cast<uint64_t>(elapsed) : bytesTransferred_;

    std::string msg = "StreamSession::finish: [" + id_ + "] " + ToString(state_) + " after " + std::to_string(elapsed) +
                      "ms, " + std::to_string(bytesTransferred_) + " bytes, " + std::to_string(throughput) + " B/s";
    if (ec)
    {
        msg += " (" + ec.message() + ")";
    }

    LogLevel level = LogLevel::INFO;
    if (state_ == StreamState::TIMED_OUT)
    {
        level = LogLevel::WARN;
    }
    else if (state_ == StreamState::ERRORED)
    {
        level = httpStatusFor(ec) >= 500 ? LogLevel::ERROR : LogLevel::WARN;
    }
    Logger::Log(level, msg);
}
