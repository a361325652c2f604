/**
 * Router — maps (method, path) to handlers.
 *
 * OPTIONS is answered as a CORS preflight for every path. HEAD runs the GET
 * handler and drops the body on the way out. Anything unmatched gets the
 * plain "Cannot <METHOD> <path>" 404.
 */

#include "api/router.h"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace {
constexpr const char* kAllowedMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";
constexpr const char* kInternalErrorMessage = "An unexpected error occurred on the server.";
} // namespace

void Router::add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(Route{method, split_path(pattern), std::move(handler)});
}

void Router::get(const std::string& pattern, Handler handler) {
    add("GET", pattern, std::move(handler));
}

void Router::post(const std::string& pattern, Handler handler) {
    add("POST", pattern, std::move(handler));
}

void Router::use(Middleware middleware) {
    middleware_.push_back(std::move(middleware));
}

HttpResponse Router::dispatch(HttpRequest request) const {
    if (request.method == "OPTIONS") {
        return preflight(request);
    }

    bool head = request.method == "HEAD";
    if (head) {
        request.method = "GET";
    }

    HttpResponse resp;
    try {
        resp = route(request);
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error in {} {}: {}", request.method, request.path, e.what());
        resp = internal_error();
    }

    if (head) {
        resp.omit_body = true;
    }
    return resp;
}

HttpResponse Router::internal_error() {
    return HttpResponse::json(500, {{"error", kInternalErrorMessage}});
}

HttpResponse Router::route(HttpRequest& request) const {
    for (const auto& middleware : middleware_) {
        if (auto resp = middleware(request)) {
            return *resp;
        }
    }

    auto segments = split_path(request.path);
    for (const auto& route : routes_) {
        if (route.method != request.method) {
            continue;
        }
        if (match(route, segments, request)) {
            return route.handler(request);
        }
    }

    return HttpResponse::html(404, "Cannot " + request.method + " " + request.path);
}

HttpResponse Router::preflight(const HttpRequest& request) {
    HttpResponse resp = HttpResponse::empty(204);
    resp.headers["Access-Control-Allow-Methods"] = kAllowedMethods;
    auto requested = request.header("Access-Control-Request-Headers");
    if (!requested.empty()) {
        resp.headers["Access-Control-Allow-Headers"] = requested;
        resp.headers["Vary"] = "Access-Control-Request-Headers";
    }
    return resp;
}

std::vector<std::string> Router::split_path(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            segments.emplace_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

bool Router::match(const Route& route, const std::vector<std::string>& segments, HttpRequest& request) {
    if (route.segments.size() != segments.size()) {
        return false;
    }
    std::map<std::string, std::string> params;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& expected = route.segments[i];
        if (!expected.empty() && expected.front() == ':') {
            auto decoded = percent_decode(segments[i]);
            if (!decoded) {
                return false;
            }
            params[expected.substr(1)] = std::move(*decoded);
        } else if (to_lower_copy(expected) != to_lower_copy(segments[i])) {
            return false;
        }
    }
    request.params = std::move(params);
    return true;
}
