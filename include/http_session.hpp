// File: http_session.hpp
#pragma once
#include "resource_tracker.hpp"
#include "response_writer.hpp"
#include "source_handle.hpp"
#include "stream_config.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class StreamSession;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Everything a connection needs to serve streams. Owned by main.
struct StreamServices
{
    net::io_context &ioc;
    const StreamConfig &config;
    ISourceResolver &resolver;
    ResourceRegistry &registry;
};

// One client connection. Reads requests one at a time (keep-alive) and acts
// as the response writer of the stream it is serving.
class HttpSession : public IResponseWriter, public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket &&socket, StreamServices services);
    ~HttpSession() override;

    void run();

    void setHead(ResponseHead head) override;
    void asyncWriteBody(ByteChunk chunk, WriteHandler handler) override;
    void asyncWriteHead(WriteHandler handler) override;
    void sendError(unsigned status, const std::string &message, std::vector<std::pair<std::string, std::string>> fields, bool keepAlive) override;
    bool headersSent() const override { return headersSent_; }
    void complete() override;
    void abort() override;

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void handleRequest();
    void startStream(const std::string &path, bool headOnly);
    void writeJson(unsigned status, const nlohmann::json &body, std::vector<std::pair<std::string, std::string>> fields, bool keepAlive);
    void writeHeader(ByteChunk chunk, WriteHandler handler);
    void finishResponse(bool keepAlive);

    // Pending read on the socket while a response streams; fails when the peer goes away
    void watchForDisconnect();
    void onWatch(beast::error_code ec, std::size_t bytesTransferred);

    void doClose();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    StreamServices services_;
    std::string clientId_;

    std::shared_ptr<StreamSession> active_;
    ResponseHead head_;
    unsigned version_ = 11;
    bool keepAlive_ = true;
    bool headersSent_ = false;
    bool watching_ = false;
    bool resumeAfterWatch_ = false;
    bool closed_ = false;
};
