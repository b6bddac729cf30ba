#include "infrastructure/api/HttpServer.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdint>
#include <sstream>

namespace signfleet::infra {

namespace {

// Returns SIZE_MAX when the header is malformed
size_t contentLength(const std::string& headers) {
    std::istringstream iss(headers);
    std::string line;
    while (std::getline(iss, line) && line != "\r") {
        auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, pos);
        for (auto& c : key) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (key == "content-length") {
            try {
                return std::stoull(line.substr(pos + 1));
            } catch (const std::exception&) {
                return SIZE_MAX;
            }
        }
    }
    return 0;
}

} // namespace

HttpServer::HttpServer(AsioContext& asioContext, const Router& router, std::string bindAddress,
                       uint16_t port)
    : asioContext_(asioContext), router_(router), bindAddress_(std::move(bindAddress)),
      port_(port) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_.load()) {
        return;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bindAddress_), port_);
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(asioContext_.getContext());
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        port_ = acceptor_->local_endpoint().port();

        running_ = true;
        startAccept();
        spdlog::info("HTTP server listening on {}:{}", bindAddress_, port_.load());
    } catch (const std::exception& e) {
        spdlog::error("Failed to start HTTP server on {}:{}: {}", bindAddress_, port_.load(),
                      e.what());
        acceptor_.reset();
        throw;
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }
    spdlog::info("HTTP server stopped");
}

void HttpServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void HttpServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>();
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t headerBytes) {
            if (ec) {
                return;
            }

            std::string data((std::istreambuf_iterator<char>(&*buffer)),
                             std::istreambuf_iterator<char>());

            size_t length = contentLength(data.substr(0, headerBytes));
            if (length > MaxBodySize) {
                ApiResponse response;
                response.setError(400, "Request body too large or malformed length");
                sendResponse(socket, response);
                return;
            }

            // async_read_until may have consumed part of the body already
            size_t bodyInBuffer = data.size() - headerBytes;
            size_t remaining = length > bodyInBuffer ? length - bodyInBuffer : 0;

            if (remaining == 0) {
                processRequest(socket, data.substr(0, headerBytes + length));
                return;
            }

            auto bodyBuffer = std::make_shared<std::vector<char>>(remaining);
            asio::async_read(*socket, asio::buffer(*bodyBuffer),
                             [this, self, socket, data, bodyBuffer](const asio::error_code& ec2,
                                                                    std::size_t /*bytes*/) {
                                 if (!ec2) {
                                     processRequest(socket, data + std::string(bodyBuffer->begin(),
                                                                               bodyBuffer->end()));
                                 }
                             });
        });
}

void HttpServer::processRequest(std::shared_ptr<asio::ip::tcp::socket> socket,
                                const std::string& rawRequest) {
    ApiRequest request = Router::parseRequest(rawRequest);
    spdlog::debug("HTTP {} {}", static_cast<int>(request.method), request.path);

    ApiResponse response = router_.dispatch(std::move(request));
    sendResponse(socket, response);
}

void HttpServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                              const ApiResponse& response) {
    auto responseStr = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*responseStr),
                      [socket, responseStr](const asio::error_code& /*ec*/, std::size_t /*bytes*/) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

} // namespace signfleet::infra
