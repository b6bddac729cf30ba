#pragma once

#include "core/concurrency/CancellationToken.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace signfleet::infra {

/**
 * @brief Why a TCP connection could not be established.
 */
enum class ConnectError {
    None,        ///< Connected.
    Refused,     ///< The host answered with a reset; nothing listens on the port.
    Unreachable, ///< Name resolution failed or no route to the host.
    TimedOut,    ///< No answer within the deadline.
    Cancelled    ///< The caller's token fired.
};

std::string connectErrorToString(ConnectError error);

/**
 * @brief Response data from an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};                          ///< HTTP status code (e.g., 200, 404).
    std::string body;                           ///< Response body content.
    std::map<std::string, std::string> headers; ///< Response headers, lower-case keys.
    std::string errorMessage;                   ///< Error message if request failed.
    bool success{false};                        ///< True for a completed 2xx exchange.
    ConnectError connectError{ConnectError::None}; ///< Set when no connection was made.
};

/**
 * @brief Blocking HTTP/1.1 client over Asio.
 *
 * Each call runs on a private io_context on the calling thread, so it can be
 * used from any worker without touching the shared pool. Every call is
 * bounded by the client timeout and by the caller's cancellation token; a
 * fired token or an expired deadline aborts the socket operation in flight.
 */
class HttpClient {
public:
    /**
     * @brief Constructs a client.
     * @param timeout Upper bound for one whole exchange (resolve, connect, write, read).
     */
    explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

    /**
     * @brief Performs a GET request.
     * @param host Address or host name.
     * @param port TCP port.
     * @param target Request target including any query string.
     * @param token Cancellation for the exchange.
     */
    HttpResponse get(const std::string& host, uint16_t port, const std::string& target,
                     const core::CancellationToken& token = {}) const;

    /**
     * @brief Performs a POST request.
     * @param body Request body.
     * @param contentType Value of the Content-Type header.
     */
    HttpResponse post(const std::string& host, uint16_t port, const std::string& target,
                      const std::string& body,
                      const std::string& contentType = "application/json",
                      const core::CancellationToken& token = {}) const;

    /**
     * @brief Opens and closes a TCP connection.
     *
     * Used for reachability checks without sending a request.
     *
     * @return Classification of the outcome.
     */
    ConnectError connect(const std::string& host, uint16_t port,
                         const core::CancellationToken& token = {}) const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    HttpResponse exchange(const std::string& method, const std::string& host, uint16_t port,
                          const std::string& target, const std::string& body,
                          const std::string& contentType,
                          const core::CancellationToken& token) const;

    std::chrono::milliseconds timeout_;
};

/**
 * @brief Splits a raw HTTP response into status, headers and body.
 *
 * Handles Content-Length and chunked transfer encoding.
 *
 * @param raw Bytes read from the socket up to end of stream.
 * @param response Receives status code, headers and body.
 * @return False if the status line is malformed.
 */
bool parseHttpResponse(const std::string& raw, HttpResponse& response);

} // namespace signfleet::infra
