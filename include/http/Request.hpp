#pragma once

#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "const/rest_enums.hpp"

namespace later {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value), decoded
    std::unordered_map<std::string, std::string> headers;  // Header names lowercased
    std::string body;

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }

    bool hasQuery(const std::string& key) const {
        return query.find(key) != query.end();
    }

    std::string getHeader(const std::string& lowercaseName, const std::string& defaultValue = "") const {
        auto it = headers.find(lowercaseName);
        return it != headers.end() ? it->second : defaultValue;
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;

    static Response ok(const nlohmann::json& body) {
        return {200, "application/json", body.dump()};
    }

    static Response created(const nlohmann::json& body) {
        return {201, "application/json", body.dump()};
    }

    static Response noContent() {
        return {204, "application/json", ""};
    }

    static Response error(int status, const std::string& message) {
        nlohmann::json body = {{"status", "error"}, {"message", message}};
        return {status, "application/json", body.dump()};
    }

    static Response badRequest(const std::string& message) {
        return error(400, message);
    }

    static Response notFound(const std::string& message = "Not found") {
        return error(404, message);
    }

    static Response methodNotAllowed() {
        return error(405, "Method not allowed");
    }
};

} // namespace http
} // namespace later
