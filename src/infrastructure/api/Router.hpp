#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace signfleet::infra {

/**
 * @brief HTTP method enumeration.
 */
enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, UNKNOWN };

/**
 * @brief Represents an incoming API request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNKNOWN};         ///< HTTP method of the request.
    std::string path;                               ///< Request path without query string.
    std::string body;                               ///< Request body content.
    std::map<std::string, std::string> headers;     ///< HTTP headers, lower-case keys.
    std::map<std::string, std::string> queryParams; ///< Decoded query string parameters.
    std::map<std::string, std::string> pathParams;  ///< Path parameters from route matching.

    /**
     * @brief Returns a query parameter or a fallback.
     */
    std::string query(const std::string& key, const std::string& fallback = "") const;
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};                        ///< HTTP status code.
    std::string statusText{"OK"};               ///< HTTP status text.
    std::string body;                           ///< Response body content.
    std::map<std::string, std::string> headers; ///< Response headers.

    /**
     * @brief Sets the response body as JSON.
     * @param json JSON value to serialize as body.
     */
    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets a binary attachment body.
     * @param bytes Body content.
     * @param contentType Value of the Content-Type header.
     * @param filename Suggested download name.
     */
    void setAttachment(std::string bytes, const std::string& contentType,
                       const std::string& filename);

    /**
     * @brief Sets an error response.
     * @param code HTTP status code for the error.
     * @param message Error message.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Sets the status code and its reason phrase.
     */
    void setStatus(int code);

    /**
     * @brief Converts the response to an HTTP response string.
     * @return Complete HTTP response string.
     */
    std::string toString() const;
};

/**
 * @brief Handler function type for route endpoints.
 */
using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

/**
 * @brief Route definition for API endpoints.
 */
struct Route {
    HttpMethod method;    ///< HTTP method this route handles.
    std::string pattern;  ///< URL pattern (may include :name path parameters).
    RouteHandler handler; ///< Handler function for this route.
};

/**
 * @brief Explicit route table.
 *
 * Built once at startup and passed by reference to every component that
 * registers endpoints. dispatch() turns domain exceptions thrown by a
 * handler into the matching status code.
 */
class Router {
public:
    /**
     * @brief Registers a route.
     * @param method Method the route answers.
     * @param pattern Path pattern, e.g. "/api/hosts/:id".
     * @param handler Called with the request and a response to fill.
     */
    void add(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Finds the route for a request and runs it.
     *
     * Unknown paths give 404, known paths with another method 405.
     */
    ApiResponse dispatch(ApiRequest request) const;

    const std::vector<Route>& routes() const { return routes_; }

    static ApiRequest parseRequest(const std::string& rawRequest);
    static HttpMethod parseMethod(const std::string& method);
    static std::map<std::string, std::string> parseQueryString(const std::string& queryString);
    static std::string urlDecode(const std::string& text);
    static bool matchRoute(const std::string& pattern, const std::string& path,
                           std::map<std::string, std::string>& pathParams);

private:
    std::vector<Route> routes_;
};

} // namespace signfleet::infra
