#include <catch2/catch_test_macros.hpp>

#include "LoopbackServer.hpp"
#include "infrastructure/network/HttpClient.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using namespace signfleet::infra;
using signfleet::core::CancellationToken;
using signfleet::test::LoopbackServer;
using namespace std::chrono_literals;

TEST_CASE("parseHttpResponse", "[HttpClient]") {
    HttpResponse response;

    SECTION("Content-Length bounds the body") {
        REQUIRE(parseHttpResponse("HTTP/1.1 200 OK\r\n"
                                  "Content-Type: application/json\r\n"
                                  "Content-Length: 2\r\n"
                                  "\r\n"
                                  "[]trailing",
                                  response));
        REQUIRE(response.statusCode == 200);
        REQUIRE(response.headers["content-type"] == "application/json");
        REQUIRE(response.body == "[]");
    }

    SECTION("Chunked bodies are reassembled") {
        REQUIRE(parseHttpResponse("HTTP/1.1 200 OK\r\n"
                                  "Transfer-Encoding: chunked\r\n"
                                  "\r\n"
                                  "4\r\nWiki\r\n"
                                  "5\r\npedia\r\n"
                                  "0\r\n\r\n",
                                  response));
        REQUIRE(response.body == "Wikipedia");
    }

    SECTION("Body runs to end of stream without a length") {
        REQUIRE(parseHttpResponse("HTTP/1.0 404 Not Found\r\n\r\nnope", response));
        REQUIRE(response.statusCode == 404);
        REQUIRE(response.body == "nope");
    }

    SECTION("Garbage status line") {
        REQUIRE_FALSE(parseHttpResponse("SSH-2.0-OpenSSH\r\n\r\n", response));
        REQUIRE_FALSE(parseHttpResponse("", response));
    }
}

TEST_CASE("HttpClient against a loopback server", "[HttpClient][Network]") {
    LoopbackServer server;
    server.router().add(HttpMethod::GET, "/api/version",
                        [](const ApiRequest&, ApiResponse& response) {
                            response.setJson({{"version", "1.4.0"}});
                        });
    server.router().add(HttpMethod::POST, "/echo", [](const ApiRequest& request,
                                                      ApiResponse& response) {
        response.setJson({{"body", request.body}, {"type", request.headers.at("content-type")}});
    });
    auto port = server.start();

    HttpClient client(2s);

    SECTION("GET") {
        auto response = client.get("127.0.0.1", port, "/api/version");
        REQUIRE(response.success);
        REQUIRE(response.statusCode == 200);
        REQUIRE(nlohmann::json::parse(response.body)["version"] == "1.4.0");
    }

    SECTION("POST carries body and content type") {
        auto response = client.post("127.0.0.1", port, "/echo", "[1,2]", "application/json");
        REQUIRE(response.success);
        auto json = nlohmann::json::parse(response.body);
        REQUIRE(json["body"] == "[1,2]");
        REQUIRE(json["type"] == "application/json");
    }

    SECTION("Non-2xx is not a success") {
        auto response = client.get("127.0.0.1", port, "/unknown");
        REQUIRE(response.statusCode == 404);
        REQUIRE_FALSE(response.success);
        REQUIRE(response.connectError == ConnectError::None);
    }

    SECTION("connect reports an open port") {
        REQUIRE(client.connect("127.0.0.1", port) == ConnectError::None);
    }
}

TEST_CASE("HttpClient connection failures", "[HttpClient][Network]") {
    HttpClient client(300ms);

    SECTION("Closed port is refused") {
        auto port = signfleet::test::closedLoopbackPort();
        REQUIRE(client.connect("127.0.0.1", port) == ConnectError::Refused);

        auto response = client.get("127.0.0.1", port, "/api/health");
        REQUIRE_FALSE(response.success);
        REQUIRE(response.connectError == ConnectError::Refused);
    }

    SECTION("Unanswered address gives up within the timeout") {
        // TEST-NET-1 is never routed
        auto start = std::chrono::steady_clock::now();
        auto error = client.connect("192.0.2.1", 80);
        REQUIRE(error != ConnectError::None);
        REQUIRE(error != ConnectError::Refused);
        REQUIRE(std::chrono::steady_clock::now() - start < 2s);
    }

    SECTION("A cancelled token aborts at once") {
        CancellationToken token;
        token.cancel();
        REQUIRE(client.connect("192.0.2.1", 80, token) == ConnectError::Cancelled);
    }
}
