#include "infrastructure/network/HttpClient.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <optional>
#include <sstream>

namespace signfleet::infra {

namespace {

using Clock = std::chrono::steady_clock;
using Completion = std::function<void(const asio::error_code&)>;

constexpr auto PollInterval = std::chrono::milliseconds(20);

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

ConnectError classify(const asio::error_code& ec) {
    if (!ec) {
        return ConnectError::None;
    }
    if (ec == asio::error::connection_refused) {
        return ConnectError::Refused;
    }
    if (ec == asio::error::timed_out) {
        return ConnectError::TimedOut;
    }
    return ConnectError::Unreachable;
}

/**
 * @brief One client exchange on a private io_context.
 *
 * run() drives a single asynchronous operation to completion, aborting it
 * when the token fires or the deadline passes.
 */
class Exchange {
public:
    Exchange(std::chrono::milliseconds timeout, const core::CancellationToken& token)
        : resolver_(io_), socket_(io_), token_(token),
          deadline_(Clock::now() + token.remaining(timeout)) {}

    ~Exchange() {
        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    ConnectError connect(const std::string& host, uint16_t port, std::string& error) {
        asio::error_code parseError;
        auto address = asio::ip::make_address(host, parseError);

        asio::error_code ec;
        if (!parseError) {
            asio::ip::tcp::endpoint endpoint(address, port);
            ec = run([&](Completion done) { socket_.async_connect(endpoint, std::move(done)); });
        } else {
            asio::ip::tcp::resolver::results_type endpoints;
            ec = run([&](Completion done) {
                resolver_.async_resolve(
                    host, std::to_string(port),
                    [&endpoints, done = std::move(done)](
                        const asio::error_code& e, asio::ip::tcp::resolver::results_type results) {
                        endpoints = std::move(results);
                        done(e);
                    });
            });
            if (ec) {
                error = "cannot resolve " + host + ": " + ec.message();
                return abandoned_ ? *abandoned_ : ConnectError::Unreachable;
            }
            ec = run([&](Completion done) {
                asio::async_connect(socket_, endpoints,
                                    [done = std::move(done)](const asio::error_code& e,
                                                             const asio::ip::tcp::endpoint&) {
                                        done(e);
                                    });
            });
        }

        if (ec) {
            error = "connect to " + host + ":" + std::to_string(port) + " failed: " +
                    (abandoned_ ? connectErrorToString(*abandoned_) : ec.message());
            return abandoned_ ? *abandoned_ : classify(ec);
        }
        return ConnectError::None;
    }

    asio::error_code write(const std::string& payload) {
        return run([&](Completion done) {
            asio::async_write(socket_, asio::buffer(payload),
                              [done = std::move(done)](const asio::error_code& e, std::size_t) {
                                  done(e);
                              });
        });
    }

    asio::error_code readToEnd(std::string& out) {
        asio::streambuf buffer;
        auto ec = run([&](Completion done) {
            asio::async_read(socket_, buffer, asio::transfer_all(),
                             [done = std::move(done)](const asio::error_code& e, std::size_t) {
                                 done(e);
                             });
        });
        out.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
        return ec == asio::error::eof ? asio::error_code{} : ec;
    }

    std::optional<ConnectError> abandonReason() const { return abandoned_; }

private:
    template <typename Start>
    asio::error_code run(Start&& start) {
        std::optional<asio::error_code> result;
        io_.restart();
        start([&result](const asio::error_code& ec) { result = ec; });

        while (!result) {
            if (!abandoned_) {
                if (token_.isCancelled()) {
                    abandon(ConnectError::Cancelled);
                } else if (Clock::now() >= deadline_) {
                    abandon(ConnectError::TimedOut);
                }
            }
            io_.run_one_for(PollInterval);
        }
        return *result;
    }

    void abandon(ConnectError reason) {
        abandoned_ = reason;
        asio::error_code ignored;
        resolver_.cancel();
        socket_.close(ignored);
    }

    asio::io_context io_;
    asio::ip::tcp::resolver resolver_;
    asio::ip::tcp::socket socket_;
    core::CancellationToken token_;
    Clock::time_point deadline_;
    std::optional<ConnectError> abandoned_;
};

bool decodeChunked(const std::string& data, std::string& body) {
    body.clear();
    size_t pos = 0;
    while (pos < data.size()) {
        auto lineEnd = data.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return false;
        }
        size_t size = 0;
        try {
            size = std::stoul(data.substr(pos, lineEnd - pos), nullptr, 16);
        } catch (const std::exception&) {
            return false;
        }
        pos = lineEnd + 2;
        if (size == 0) {
            return true;
        }
        if (pos + size > data.size()) {
            return false;
        }
        body.append(data, pos, size);
        pos += size + 2;
    }
    return false;
}

} // namespace

std::string connectErrorToString(ConnectError error) {
    switch (error) {
    case ConnectError::None:
        return "connected";
    case ConnectError::Refused:
        return "connection refused";
    case ConnectError::Unreachable:
        return "unreachable";
    case ConnectError::TimedOut:
        return "timed out";
    case ConnectError::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool parseHttpResponse(const std::string& raw, HttpResponse& response) {
    auto headerEnd = raw.find("\r\n\r\n");
    std::istringstream iss(raw.substr(0, headerEnd));
    std::string line;

    if (!std::getline(iss, line)) {
        return false;
    }
    std::istringstream statusLine(trim(line));
    std::string version;
    statusLine >> version >> response.statusCode;
    if (version.rfind("HTTP/", 0) != 0 || statusLine.fail()) {
        return false;
    }

    while (std::getline(iss, line)) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            response.headers[toLower(trim(line.substr(0, colonPos)))] =
                trim(line.substr(colonPos + 1));
        }
    }

    std::string payload = headerEnd == std::string::npos ? "" : raw.substr(headerEnd + 4);

    auto encoding = response.headers.find("transfer-encoding");
    if (encoding != response.headers.end() &&
        toLower(encoding->second).find("chunked") != std::string::npos) {
        return decodeChunked(payload, response.body);
    }

    auto length = response.headers.find("content-length");
    if (length != response.headers.end()) {
        try {
            auto size = std::stoull(length->second);
            if (size < payload.size()) {
                payload.resize(size);
            }
        } catch (const std::exception&) {
            return false;
        }
    }
    response.body = std::move(payload);
    return true;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResponse HttpClient::get(const std::string& host, uint16_t port, const std::string& target,
                             const core::CancellationToken& token) const {
    return exchange("GET", host, port, target, "", "", token);
}

HttpResponse HttpClient::post(const std::string& host, uint16_t port, const std::string& target,
                              const std::string& body, const std::string& contentType,
                              const core::CancellationToken& token) const {
    return exchange("POST", host, port, target, body, contentType, token);
}

ConnectError HttpClient::connect(const std::string& host, uint16_t port,
                                 const core::CancellationToken& token) const {
    Exchange ex(timeout_, token);
    std::string error;
    auto result = ex.connect(host, port, error);
    if (result != ConnectError::None) {
        spdlog::debug("TCP check {}", error);
    }
    return result;
}

HttpResponse HttpClient::exchange(const std::string& method, const std::string& host,
                                  uint16_t port, const std::string& target,
                                  const std::string& body, const std::string& contentType,
                                  const core::CancellationToken& token) const {
    HttpResponse response;
    Exchange ex(timeout_, token);

    response.connectError = ex.connect(host, port, response.errorMessage);
    if (response.connectError != ConnectError::None) {
        return response;
    }

    std::ostringstream request;
    request << method << " " << target << " HTTP/1.1\r\n";
    request << "Host: " << host << ":" << port << "\r\n";
    request << "User-Agent: signfleet\r\n";
    request << "Accept: application/json\r\n";
    if (method != "GET") {
        request << "Content-Type: " << contentType << "\r\n";
        request << "Content-Length: " << body.size() << "\r\n";
    }
    request << "Connection: close\r\n\r\n";
    request << body;

    std::string raw;
    auto ec = ex.write(request.str());
    if (!ec) {
        ec = ex.readToEnd(raw);
    }
    if (ec) {
        auto reason = ex.abandonReason();
        response.errorMessage = method + " " + target + " on " + host + " failed: " +
                                (reason ? connectErrorToString(*reason) : ec.message());
        return response;
    }

    if (!parseHttpResponse(raw, response)) {
        response.errorMessage = "malformed response from " + host;
        return response;
    }

    response.success = response.statusCode >= 200 && response.statusCode < 300;
    if (!response.success) {
        response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
    }
    return response;
}

} // namespace signfleet::infra
