#include "infrastructure/api/Router.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace signfleet::infra {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string reasonPhrase(int code) {
    switch (code) {
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 202:
        return "Accepted";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 409:
        return "Conflict";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    default:
        return "Error";
    }
}

} // namespace

std::string ApiRequest::query(const std::string& key, const std::string& fallback) const {
    auto it = queryParams.find(key);
    return it != queryParams.end() ? it->second : fallback;
}

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setAttachment(std::string bytes, const std::string& contentType,
                                const std::string& filename) {
    body = std::move(bytes);
    headers["Content-Type"] = contentType;
    headers["Content-Disposition"] = "attachment; filename=\"" + filename + "\"";
}

void ApiResponse::setStatus(int code) {
    statusCode = code;
    statusText = reasonPhrase(code);
}

void ApiResponse::setError(int code, const std::string& message) {
    setStatus(code);
    nlohmann::json error;
    error["error"] = message;
    error["status"] = code;
    setJson(error);
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

void Router::add(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.push_back({method, pattern, std::move(handler)});
}

ApiResponse Router::dispatch(ApiRequest request) const {
    ApiResponse response;

    bool pathKnown = false;
    for (const auto& route : routes_) {
        if (!matchRoute(route.pattern, request.path, request.pathParams)) {
            continue;
        }
        pathKnown = true;
        if (route.method != request.method) {
            continue;
        }

        try {
            route.handler(request, response);
        } catch (const core::NotFoundError& e) {
            response.setError(404, e.what());
        } catch (const core::InvalidAddressError& e) {
            response.setError(400, e.what());
        } catch (const core::InvalidSnapshotError& e) {
            response.setError(400, e.what());
        } catch (const core::DuplicateHostError& e) {
            response.setError(409, e.what());
        } catch (const core::PeerUnreachableError& e) {
            response.setError(502, e.what());
        } catch (const core::StoreIoError& e) {
            spdlog::error("Storage failure on {}: {}", request.path, e.what());
            response.setError(500, e.what());
        } catch (const nlohmann::json::exception& e) {
            response.setError(400, std::string("Invalid JSON: ") + e.what());
        } catch (const std::invalid_argument& e) {
            response.setError(400, e.what());
        } catch (const std::exception& e) {
            spdlog::error("API error on {}: {}", request.path, e.what());
            response.setError(500, "Internal server error");
        }
        return response;
    }

    if (pathKnown) {
        response.setError(405, "Method not allowed");
    } else {
        response.setError(404, "Endpoint not found");
    }
    return response;
}

ApiRequest Router::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    auto headerEnd = rawRequest.find("\r\n\r\n");
    std::istringstream iss(rawRequest.substr(0, headerEnd));
    std::string line;

    // Parse request line
    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = parseMethod(method);

        auto queryPos = path.find('?');
        if (queryPos != std::string::npos) {
            request.queryParams = parseQueryString(path.substr(queryPos + 1));
            path = path.substr(0, queryPos);
        }
        request.path = urlDecode(path);
    }

    // Parse headers
    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::string value = trim(line.substr(colonPos + 1));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            request.headers[key] = value;
        }
    }

    if (headerEnd != std::string::npos) {
        request.body = rawRequest.substr(headerEnd + 4);
    }

    return request;
}

HttpMethod Router::parseMethod(const std::string& method) {
    if (method == "GET")
        return HttpMethod::GET;
    if (method == "POST")
        return HttpMethod::POST;
    if (method == "PUT")
        return HttpMethod::PUT;
    if (method == "DELETE")
        return HttpMethod::DELETE;
    if (method == "OPTIONS")
        return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::map<std::string, std::string> Router::parseQueryString(const std::string& queryString) {
    std::map<std::string, std::string> params;
    std::istringstream iss(queryString);
    std::string pair;

    while (std::getline(iss, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        auto eqPos = pair.find('=');
        if (eqPos != std::string::npos) {
            params[urlDecode(pair.substr(0, eqPos))] = urlDecode(pair.substr(eqPos + 1));
        } else {
            params[urlDecode(pair)] = "";
        }
    }

    return params;
}

std::string Router::urlDecode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            result += ' ';
        } else if (text[i] == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            result += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += text[i];
        }
    }
    return result;
}

bool Router::matchRoute(const std::string& pattern, const std::string& path,
                        std::map<std::string, std::string>& pathParams) {
    pathParams.clear();

    std::vector<std::string> patternParts, pathParts;
    std::istringstream patternStream(pattern), pathStream(path);
    std::string part;

    while (std::getline(patternStream, part, '/')) {
        if (!part.empty())
            patternParts.push_back(part);
    }
    while (std::getline(pathStream, part, '/')) {
        if (!part.empty())
            pathParts.push_back(part);
    }

    if (patternParts.size() != pathParts.size()) {
        return false;
    }

    for (size_t i = 0; i < patternParts.size(); ++i) {
        if (patternParts[i].front() == ':') {
            pathParams[patternParts[i].substr(1)] = pathParts[i];
        } else if (patternParts[i] != pathParts[i]) {
            return false;
        }
    }

    return true;
}

} // namespace signfleet::infra
