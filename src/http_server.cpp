// File: http_server.cpp
#include "http_server.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <stdexcept>

HttpServer::HttpServer(StreamServices services, const std::string &host, const std::string &port)
    : services_(services), host_(host), port_(port), acceptor_(services.ioc) {}

void HttpServer::init()
{
    auto port = parse_u64(port_);
    if (!port || *port > 65535)
    {
        throw std::runtime_error("HttpServer::init: Invalid port '" + port_ + "'");
    }

    beast::error_code ec;
    auto address = net::ip::make_address(host_, ec);
    if (ec)
    {
        throw std::runtime_error("HttpServer::init: Invalid host '" + host_ + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, static_cast<unsigned short>(*port));

    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
    {
        throw std::runtime_error("HttpServer::init: open: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
    {
        throw std::runtime_error("HttpServer::init: set_option: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec)
    {
        throw std::runtime_error("HttpServer::init: bind " + host_ + ":" + port_ + ": " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
    {
        throw std::runtime_error("HttpServer::init: listen: " + ec.message());
    }

    Logger::Log(LogLevel::INFO, "HttpServer::init: Listening on " + host_ + ":" + std::to_string(localEndpoint().port()));
}

void HttpServer::run()
{
    doAccept();
}

void HttpServer::stop()
{
    net::post(acceptor_.get_executor(), [self = shared_from_this()]()
              {
                  self->stopped_ = true;
                  beast::error_code ec;
                  self->acceptor_.close(ec); });
}

tcp::endpoint HttpServer::localEndpoint() const
{
    beast::error_code ec;
    return acceptor_.local_endpoint(ec);
}

void HttpServer::doAccept()
{
    acceptor_.async_accept(services_.ioc,
                           [self = shared_from_this()](beast::error_code ec, tcp::socket socket)
                           {
                               self->onAccept(ec, std::move(socket));
                           });
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket)
{
    if (stopped_ || ec == net::error::operation_aborted)
    {
        return;
    }

    if (ec)
    {
        Logger::Log(LogLevel::WARN, "HttpServer::onAccept: " + ec.message());
    }
    else
    {
        std::make_shared<HttpSession>(std::move(socket), services_)->run();
    }

    doAccept();
}
