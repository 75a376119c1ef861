// File: http_server.hpp
#pragma once
#include "http_session.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <string>

// Accepts connections and hands each one to an HttpSession.
class HttpServer : public std::enable_shared_from_this<HttpServer>
{
public:
    HttpServer(StreamServices services, const std::string &host, const std::string &port);

    // Opens, binds and listens. Throws std::runtime_error on failure.
    void init();
    void run();
    void stop();

    tcp::endpoint localEndpoint() const;

private:
    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    StreamServices services_;
    std::string host_;
    std::string port_;
    tcp::acceptor acceptor_;
    bool stopped_ = false;
};
