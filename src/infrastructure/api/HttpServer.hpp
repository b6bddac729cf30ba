#pragma once

#include "infrastructure/api/Router.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace signfleet::infra {

/**
 * @brief Minimal HTTP/1.1 server dispatching to a Router.
 *
 * One request per connection; bodies are read by Content-Length. Handlers
 * run on the AsioContext worker threads.
 *
 * @note This class is non-copyable. Create it with std::make_shared.
 */
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    /// Largest request body accepted (snapshot uploads included).
    static constexpr size_t MaxBodySize = 64 * 1024 * 1024;

    /**
     * @brief Constructs an HttpServer.
     * @param asioContext Reference to the AsioContext for async I/O.
     * @param router Routes to serve; must outlive the server.
     * @param bindAddress Local address to listen on.
     * @param port TCP port to listen on; 0 picks a free port.
     */
    HttpServer(AsioContext& asioContext, const Router& router, std::string bindAddress,
               uint16_t port);

    /**
     * @brief Destructor. Stops the server if running.
     */
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Binds and starts accepting connections.
     * @throws std::system_error if the address cannot be bound.
     */
    void start();

    /**
     * @brief Stops accepting connections.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns the bound port (the chosen one when started with 0).
     */
    uint16_t port() const { return port_; }

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);

    AsioContext& asioContext_;
    const Router& router_;
    std::string bindAddress_;
    std::atomic<uint16_t> port_;
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
};

} // namespace signfleet::infra
