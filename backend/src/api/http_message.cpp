/**
 * HTTP/1.1 message helpers.
 *
 * Only what a Connection: close server needs: request-line and header
 * parsing, and response serialisation with the CORS header every response
 * carries.
 */

#include "api/http_message.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_token(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char ch) {
        return std::isalnum(ch) || std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(ch)) != std::string_view::npos;
    });
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower_copy(name));
    if (it == headers.end()) {
        return {};
    }
    return it->second;
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.count(to_lower_copy(name)) > 0;
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& payload) {
    HttpResponse resp;
    resp.status = status;
    resp.body = payload.dump();
    return resp;
}

HttpResponse HttpResponse::html(int status, std::string markup) {
    HttpResponse resp;
    resp.status = status;
    resp.body = std::move(markup);
    resp.content_type = "text/html; charset=utf-8";
    return resp;
}

HttpResponse HttpResponse::empty(int status) {
    HttpResponse resp;
    resp.status = status;
    resp.content_type.clear();
    return resp;
}

std::optional<HttpRequest> parse_request_head(std::string_view head) {
    auto line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);

    auto first_space = request_line.find(' ');
    if (first_space == std::string_view::npos) {
        return std::nullopt;
    }
    auto second_space = request_line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos) {
        return std::nullopt;
    }

    HttpRequest req;
    req.method = std::string(request_line.substr(0, first_space));
    req.target = std::string(request_line.substr(first_space + 1, second_space - first_space - 1));
    req.version = std::string(request_line.substr(second_space + 1));

    if (!is_token(req.method) || req.target.empty() || req.version.rfind("HTTP/1.", 0) != 0) {
        return std::nullopt;
    }
    if (req.target.front() != '/' && req.target != "*") {
        return std::nullopt;
    }

    auto query_pos = req.target.find('?');
    req.path = req.target.substr(0, query_pos);
    if (query_pos != std::string::npos) {
        req.query = req.target.substr(query_pos + 1);
    }

    while (line_end != std::string_view::npos) {
        auto start = line_end + 2;
        line_end = head.find("\r\n", start);
        std::string_view line = head.substr(start, line_end == std::string_view::npos ? std::string_view::npos : line_end - start);
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        auto key = line.substr(0, colon);
        if (!is_token(key)) {
            return std::nullopt;
        }
        auto value = trim(line.substr(colon + 1));
        auto& slot = req.headers[to_lower_copy(key)];
        if (slot.empty()) {
            slot = std::string(value);
        } else {
            slot += ", ";
            slot += value;
        }
    }

    return req;
}

std::string serialize_response(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n";
    if (!response.content_type.empty()) {
        out << "Content-Type: " << response.content_type << "\r\n";
    }
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Access-Control-Allow-Origin: *\r\n";
    for (const auto& [name, value] : response.headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Connection: close\r\n";
    out << "\r\n";
    if (!response.omit_body) {
        out << response.body;
    }
    return out.str();
}

std::string_view reason_phrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    }
    return "Unknown";
}

bool is_json_content_type(std::string_view content_type) {
    auto media = to_lower_copy(trim(content_type.substr(0, content_type.find(';'))));
    return media == "application/json";
}

std::optional<std::string> percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return std::nullopt;
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

std::string to_lower_copy(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}
