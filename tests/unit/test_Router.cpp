#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/api/Router.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace signfleet::infra;
using namespace signfleet::core;

TEST_CASE("Router parses raw requests", "[Router]") {
    SECTION("Request line, headers and body") {
        auto request = Router::parseRequest("POST /api/hosts/add HTTP/1.1\r\n"
                                            "Host: localhost\r\n"
                                            "Content-Type: application/json\r\n"
                                            "\r\n"
                                            "{\"ip_address\":\"10.0.0.1\"}");
        REQUIRE(request.method == HttpMethod::POST);
        REQUIRE(request.path == "/api/hosts/add");
        REQUIRE(request.headers["content-type"] == "application/json");
        REQUIRE(request.body == "{\"ip_address\":\"10.0.0.1\"}");
    }

    SECTION("Query strings are split and decoded") {
        auto request = Router::parseRequest(
            "GET /api/hosts/update?ip=10.0.0.1&note=two+words&x=%2Fy&flag HTTP/1.1\r\n\r\n");
        REQUIRE(request.path == "/api/hosts/update");
        REQUIRE(request.query("ip") == "10.0.0.1");
        REQUIRE(request.query("note") == "two words");
        REQUIRE(request.query("x") == "/y");
        REQUIRE(request.query("flag").empty());
        REQUIRE(request.query("missing", "dflt") == "dflt");
    }

    SECTION("Unknown methods") {
        REQUIRE(Router::parseMethod("PATCH") == HttpMethod::UNKNOWN);
        REQUIRE(Router::parseMethod("DELETE") == HttpMethod::DELETE);
    }

    SECTION("Malformed percent escapes are kept literally") {
        REQUIRE(Router::urlDecode("100%") == "100%");
        REQUIRE(Router::urlDecode("%zz") == "%zz");
    }
}

TEST_CASE("Router matches path patterns", "[Router]") {
    std::map<std::string, std::string> params;

    REQUIRE(Router::matchRoute("/api/hosts", "/api/hosts", params));
    REQUIRE(Router::matchRoute("/api/hosts", "/api/hosts/", params));
    REQUIRE_FALSE(Router::matchRoute("/api/hosts", "/api/hosts/add", params));

    REQUIRE(Router::matchRoute("/api/backups/:name", "/api/backups/hosts-1.db", params));
    REQUIRE(params["name"] == "hosts-1.db");
}

TEST_CASE("Router dispatch", "[Router]") {
    Router router;
    router.add(HttpMethod::GET, "/ok", [](const ApiRequest&, ApiResponse& response) {
        response.setJson({{"status", "ok"}});
    });
    router.add(HttpMethod::GET, "/missing", [](const ApiRequest&, ApiResponse&) {
        throw NotFoundError("no such host");
    });
    router.add(HttpMethod::GET, "/backup", [](const ApiRequest&, ApiResponse&) {
        throw BackupUnavailableError("no backups");
    });
    router.add(HttpMethod::GET, "/address", [](const ApiRequest&, ApiResponse&) {
        throw InvalidAddressError("1.2.3");
    });
    router.add(HttpMethod::GET, "/duplicate", [](const ApiRequest&, ApiResponse&) {
        throw DuplicateHostError("taken");
    });
    router.add(HttpMethod::GET, "/peer", [](const ApiRequest&, ApiResponse&) {
        throw PeerUnreachableError("10.0.0.9", "refused");
    });
    router.add(HttpMethod::GET, "/json", [](const ApiRequest&, ApiResponse&) {
        (void)nlohmann::json::parse("{not json");
    });
    router.add(HttpMethod::GET, "/argument", [](const ApiRequest&, ApiResponse&) {
        throw std::invalid_argument("missing ip");
    });
    router.add(HttpMethod::GET, "/boom", [](const ApiRequest&, ApiResponse&) {
        throw std::runtime_error("secret detail");
    });

    auto call = [&router](HttpMethod method, const std::string& path) {
        ApiRequest request;
        request.method = method;
        request.path = path;
        return router.dispatch(request);
    };

    SECTION("Successful handler") {
        auto response = call(HttpMethod::GET, "/ok");
        REQUIRE(response.statusCode == 200);
        REQUIRE(nlohmann::json::parse(response.body)["status"] == "ok");
        REQUIRE(response.headers["Content-Type"] == "application/json");
    }

    SECTION("Unknown path and wrong method") {
        REQUIRE(call(HttpMethod::GET, "/nowhere").statusCode == 404);
        REQUIRE(call(HttpMethod::POST, "/ok").statusCode == 405);
    }

    SECTION("Domain errors map to status codes") {
        REQUIRE(call(HttpMethod::GET, "/missing").statusCode == 404);
        REQUIRE(call(HttpMethod::GET, "/backup").statusCode == 404);
        REQUIRE(call(HttpMethod::GET, "/address").statusCode == 400);
        REQUIRE(call(HttpMethod::GET, "/duplicate").statusCode == 409);
        REQUIRE(call(HttpMethod::GET, "/peer").statusCode == 502);
        REQUIRE(call(HttpMethod::GET, "/json").statusCode == 400);
        REQUIRE(call(HttpMethod::GET, "/argument").statusCode == 400);
    }

    SECTION("Unexpected errors do not leak their message") {
        auto response = call(HttpMethod::GET, "/boom");
        REQUIRE(response.statusCode == 500);
        REQUIRE(response.body.find("secret detail") == std::string::npos);
    }

    SECTION("Error bodies carry the message and code") {
        auto body = nlohmann::json::parse(call(HttpMethod::GET, "/duplicate").body);
        REQUIRE(body["error"] == "taken");
        REQUIRE(body["status"] == 409);
    }
}

TEST_CASE("ApiResponse serialization", "[Router]") {
    ApiResponse response;
    response.setStatus(201);
    response.setAttachment("abc", "application/octet-stream", "roster.db");

    auto text = response.toString();
    REQUIRE(text.rfind("HTTP/1.1 201 Created\r\n", 0) == 0);
    REQUIRE(text.find("Content-Length: 3\r\n") != std::string::npos);
    REQUIRE(text.find("attachment; filename=\"roster.db\"") != std::string::npos);
    REQUIRE(text.substr(text.size() - 3) == "abc");
}
