// File: stream_session.hpp
#pragma once
#include "range_interpreter.hpp"
#include "resource_tracker.hpp"
#include "response_writer.hpp"
#include "seek_prioritizer.hpp"
#include "source_handle.hpp"
#include "stream_config.hpp"
#include "stream_state.hpp"
#include "transfer_pipe.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct StreamRequest
{
    std::string identifier;
    size_t fileIndex = 0;
    std::optional<std::string> rangeHeader;
    std::string clientId;
    bool headOnly = false;
};

// Drives one stream request from resolution to its single terminal state.
// All methods run on the io_context thread.
class StreamSession : public std::enable_shared_from_this<StreamSession>
{
public:
    using CompletionHandler = std::function<void(StreamState state)>;

    StreamSession(boost::asio::io_context &ioc, StreamRequest request, const StreamConfig &config,
                  ISourceResolver &resolver, ResourceRegistry &registry, std::shared_ptr<IResponseWriter> writer);
    ~StreamSession();

    StreamSession(const StreamSession &) = delete;
    StreamSession &operator=(const StreamSession &) = delete;

    void start();

    // The client socket went away. Tears down synchronously.
    void onClientDisconnect();

    // Single terminal transition. Returns false if the stream already finished.
    bool finish(StreamState state, const boost::system::error_code &ec);

    void setCompletionHandler(CompletionHandler handler) { completion_ = std::move(handler); }

    const std::string &id() const { return id_; }
    StreamState state() const { return state_; }
    uint64_t bytesTransferred() const { return bytesTransferred_; }
    const RangeWindow &window() const { return window_; }
    // Number of teardowns performed; 1 after any terminal state
    int teardownCount() const { return teardowns_; }

private:
    void onResolved(const boost::system::error_code &ec, std::shared_ptr<ISourceHandle> source);
    void beginTransfer(ResponseHead head);
    void respondHead(ResponseHead head);
    void rejectRange(uint64_t total);
    ResponseHead buildHead(const std::string &contentType) const;

    void armInactivityTimer();
    void onInactivityTimeout(const boost::system::error_code &ec);
    void onGlobalTimeout(const boost::system::error_code &ec);
    void onResolverTimeout(const boost::system::error_code &ec);

    void onChunk(size_t bytes);
    void logOutcome(const boost::system::error_code &ec) const;

    static std::string nextStreamId();

    StreamRequest request_;
    StreamConfig config_;
    ISourceResolver &resolver_;
    ResourceRegistry &registry_;
    std::shared_ptr<IResponseWriter> writer_;
    const std::string id_;

    boost::asio::steady_timer resolverTimer_;
    boost::asio::steady_timer inactivityTimer_;
    boost::asio::steady_timer globalTimer_;

    std::shared_ptr<ISourceHandle> source_;
    std::shared_ptr<ISourceFile> file_;
    std::shared_ptr<TransferPipe> pipe_;
    RangeWindow window_;

    StreamState state_ = StreamState::INIT;
    bool resolvePending_ = false;
    uint64_t resolveTicket_ = 0;
    bool registered_ = false;
    int teardowns_ = 0;
    uint64_t bytesTransferred_ = 0;
    std::chrono::steady_clock::time_point startedAt_;
    std::chrono::steady_clock::time_point lastActivityAt_;

    CompletionHandler completion_;
};
