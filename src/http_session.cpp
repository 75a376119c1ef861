// File: http_session.cpp
#include "http_session.hpp"
#include "logger.hpp"
#include "stream_session.hpp"
#include "utils.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <chrono>

namespace
{
    constexpr auto kRequestTimeout = std::chrono::seconds(30);
    constexpr std::size_t kWatchReadSize = 4096;
    // Pipelined bytes kept while streaming before the watch stops reading
    constexpr std::size_t kMaxPipelinedBytes = 64 * 1024;
    const std::string kStreamPrefix = "/stream/";
}

HttpSession::HttpSession(tcp::socket &&socket, StreamServices services)
    : stream_(std::move(socket)), services_(services)
{
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    clientId_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

HttpSession::~HttpSession()
{
    Logger::Log(LogLevel::DEBUG, "HttpSession::~HttpSession: Connection " + clientId_ + " released.");
}

void HttpSession::run()
{
    net::dispatch(stream_.get_executor(), [self = shared_from_this()]()
                  { self->doRead(); });
}

void HttpSession::doRead()
{
    if (closed_)
        return;

    req_ = {};
    stream_.expires_after(kRequestTimeout);
    http::async_read(stream_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t bytesTransferred)
                     {
                         self->onRead(ec, bytesTransferred);
                     });
}

void HttpSession::onRead(beast::error_code ec, std::size_t)
{
    if (ec == http::error::end_of_stream)
    {
        doClose();
        return;
    }

    if (ec)
    {
        if (ec != net::error::operation_aborted)
        {
            Logger::Log(LogLevel::DEBUG, "HttpSession::onRead: " + clientId_ + " " + ec.message());
        }
        doClose();
        return;
    }

    handleRequest();
}

void HttpSession::handleRequest()
{
    version_ = req_.version();
    keepAlive_ = req_.keep_alive();
    headersSent_ = false;
    head_ = ResponseHead{};

    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    http::verb method = req_.method();

    Logger::Log(LogLevel::DEBUG, "HttpSession::handleRequest: " + clientId_ + " " + std::string(req_.method_string()) + " " + target);

    if (path == "/health/resources")
    {
        if (method != http::verb::get)
        {
            writeJson(405, {{"error", "Method not allowed"}}, {{"Allow", "GET"}}, keepAlive_);
            return;
        }
        writeJson(200, services_.registry.snapshot().toJson(), {}, keepAlive_);
        return;
    }

    if (path.starts_with(kStreamPrefix))
    {
        if (method != http::verb::get && method != http::verb::head)
        {
            writeJson(405, {{"error", "Method not allowed"}}, {{"Allow", "GET, HEAD"}}, keepAlive_);
            return;
        }
        startStream(path, method == http::verb::head);
        return;
    }

    writeJson(404, {{"error", "Not found"}}, {}, keepAlive_);
}

void HttpSession::startStream(const std::string &path, bool headOnly)
{
    // /stream/{identifier}/{fileIndex}; a '/' inside the identifier must be percent-encoded
    std::string rest = path.substr(kStreamPrefix.size());
    auto slash = rest.find('/');
    if (slash == std::string::npos || rest.find('/', slash + 1) != std::string::npos)
    {
        writeJson(404, {{"error", "Not found"}}, {}, keepAlive_);
        return;
    }

    auto identifier = url_decode(std::string_view(rest).substr(0, slash));
    auto fileIndex = parse_u64(std::string_view(rest).substr(slash + 1));
    if (!identifier || identifier->empty() || !fileIndex)
    {
        writeJson(404, {{"error", "File not found"}}, {}, keepAlive_);
        return;
    }

    StreamRequest request;
    request.identifier = *identifier;
    request.fileIndex = static_cast<size_t>(*fileIndex);
    request.clientId = clientId_;
    request.headOnly = headOnly;
    auto range = req_.find(http::field::range);
    if (range != req_.end())
    {
        request.rangeHeader = std::string(range->value());
    }

    // Timeouts of a running stream belong to StreamSession
    stream_.expires_never();

    active_ = std::make_shared<StreamSession>(services_.ioc, std::move(request), services_.config,
                                              services_.resolver, services_.registry, shared_from_this());
    watchForDisconnect();

    auto session = active_;
    session->start();
}

void HttpSession::watchForDisconnect()
{
    if (watching_ || closed_)
        return;

    watching_ = true;
    stream_.async_read_some(buffer_.prepare(kWatchReadSize),
                            [self = shared_from_this()](beast::error_code ec, std::size_t bytesTransferred)
                            {
                                self->onWatch(ec, bytesTransferred);
                            });
}

void HttpSession::onWatch(beast::error_code ec, std::size_t bytesTransferred)
{
    watching_ = false;

    if (!ec)
    {
        // Pipelined request bytes; parsed once the current response is done
        buffer_.commit(bytesTransferred);
        if (resumeAfterWatch_)
        {
            resumeAfterWatch_ = false;
            doRead();
            return;
        }
        if (active_ && buffer_.size() < kMaxPipelinedBytes)
        {
            watchForDisconnect();
        }
        return;
    }

    if (ec == net::error::operation_aborted && resumeAfterWatch_ && !closed_)
    {
        resumeAfterWatch_ = false;
        doRead();
        return;
    }

    if (closed_)
        return;

    Logger::Log(LogLevel::INFO, "HttpSession::onWatch: Client " + clientId_ + " disconnected: " + ec.message());
    if (active_)
    {
        auto session = active_;
        session->onClientDisconnect();
    }
    doClose();
}

void HttpSession::setHead(ResponseHead head)
{
    head_ = std::move(head);
}

void HttpSession::asyncWriteBody(ByteChunk chunk, WriteHandler handler)
{
    if (closed_)
    {
        net::post(stream_.get_executor(), [handler]()
                  { handler(net::error::operation_aborted); });
        return;
    }

    if (!headersSent_)
    {
        writeHeader(std::move(chunk), std::move(handler));
        return;
    }

    net::async_write(stream_, net::buffer(*chunk),
                     [self = shared_from_this(), chunk, handler](beast::error_code ec, std::size_t)
                     {
                         handler(ec);
                     });
}

void HttpSession::asyncWriteHead(WriteHandler handler)
{
    if (closed_)
    {
        net::post(stream_.get_executor(), [handler]()
                  { handler(net::error::operation_aborted); });
        return;
    }

    writeHeader(nullptr, std::move(handler));
}

void HttpSession::writeHeader(ByteChunk chunk, WriteHandler handler)
{
    auto res = std::make_shared<http::response<http::empty_body>>(static_cast<http::status>(head_.status), version_);
    res->set(http::field::server, "swarmstream");
    for (const auto &field : head_.fields)
    {
        res->set(field.first, field.second);
    }
    if (!keepAlive_)
    {
        res->set(http::field::connection, "close");
    }
    res->content_length(head_.contentLength);

    auto serializer = std::make_shared<http::response_serializer<http::empty_body>>(*res);
    headersSent_ = true;

    http::async_write_header(stream_, *serializer,
                             [self = shared_from_this(), res, serializer, chunk, handler](beast::error_code ec, std::size_t)
                             {
                                 if (ec || !chunk)
                                 {
                                     handler(ec);
                                     return;
                                 }

                                 net::async_write(self->stream_, net::buffer(*chunk),
                                                  [self, chunk, handler](beast::error_code writeEc, std::size_t)
                                                  {
                                                      handler(writeEc);
                                                  });
                             });
}

void HttpSession::sendError(unsigned status, const std::string &message, std::vector<std::pair<std::string, std::string>> fields, bool keepAlive)
{
    writeJson(status, {{"error", message}}, std::move(fields), keepAlive && keepAlive_);
}

void HttpSession::writeJson(unsigned status, const nlohmann::json &body, std::vector<std::pair<std::string, std::string>> fields, bool keepAlive)
{
    if (closed_)
        return;

    auto res = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(status), version_);
    res->set(http::field::server, "swarmstream");
    res->set(http::field::content_type, "application/json");
    res->set(http::field::cache_control, "no-cache, no-store");
    for (const auto &field : fields)
    {
        res->set(field.first, field.second);
    }
    res->keep_alive(keepAlive);
    if (req_.method() != http::verb::head)
    {
        res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    res->prepare_payload();
    headersSent_ = true;

    http::async_write(stream_, *res,
                      [self = shared_from_this(), res](beast::error_code ec, std::size_t)
                      {
                          if (ec)
                          {
                              Logger::Log(LogLevel::DEBUG, "HttpSession::writeJson: " + self->clientId_ + " " + ec.message());
                              self->active_.reset();
                              self->doClose();
                              return;
                          }
                          self->finishResponse(res->keep_alive());
                      });
}

void HttpSession::complete()
{
    finishResponse(keepAlive_);
}

void HttpSession::abort()
{
    active_.reset();
    doClose();
}

void HttpSession::finishResponse(bool keepAlive)
{
    active_.reset();

    if (!keepAlive || closed_)
    {
        doClose();
        return;
    }

    if (watching_)
    {
        // The watch read owns the socket's read side; cancel it and read the next request from its handler
        resumeAfterWatch_ = true;
        stream_.cancel();
        return;
    }

    doRead();
}

void HttpSession::doClose()
{
    if (closed_)
        return;
    closed_ = true;

    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.socket().close(ec);
}
