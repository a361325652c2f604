#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

/**
 * Parsed HTTP/1.1 request. Header names are stored lower-cased.
 */
struct HttpRequest {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version = "HTTP/1.1";
    std::map<std::string, std::string> headers;
    std::string body;

    /// Path parameters captured by the router (":id" -> "5").
    std::map<std::string, std::string> params;

    /// Empty string when the header is absent.
    [[nodiscard]] std::string header(const std::string& name) const;
    [[nodiscard]] bool has_header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json; charset=utf-8";
    std::map<std::string, std::string> headers;

    /// Set for HEAD: Content-Length still describes the body, but it is not sent.
    bool omit_body = false;

    static HttpResponse json(int status, const nlohmann::json& payload);
    static HttpResponse html(int status, std::string markup);

    /// No body and no Content-Type.
    static HttpResponse empty(int status);
};

/// Parses the request line and headers (everything before the blank line).
std::optional<HttpRequest> parse_request_head(std::string_view head);

/// Full response bytes, always with CORS and Connection: close headers.
std::string serialize_response(const HttpResponse& response);

std::string_view reason_phrase(int status);

/// application/json, with or without parameters.
bool is_json_content_type(std::string_view content_type);

/// Decodes %XX escapes. nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(std::string_view in);

std::string to_lower_copy(std::string_view value);
