#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/http_message.h"

/**
 * Method + path routing for the HTTP API.
 *
 * Patterns are '/'-separated; a segment starting with ':' captures the
 * request segment into HttpRequest::params. Literal segments compare
 * case-insensitively and empty segments are ignored, so "/api/persons/"
 * matches "/api/persons".
 *
 * dispatch() is the fault boundary for handlers: a std::exception escaping a
 * handler or middleware is logged and answered with a generic 500.
 */
class Router {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    /// Returns a response to short-circuit routing, or nullopt to continue.
    using Middleware = std::function<std::optional<HttpResponse>(const HttpRequest&)>;

    void add(const std::string& method, const std::string& pattern, Handler handler);
    void get(const std::string& pattern, Handler handler);
    void post(const std::string& pattern, Handler handler);

    /// Middleware runs in registration order, before any route.
    void use(Middleware middleware);

    [[nodiscard]] HttpResponse dispatch(HttpRequest request) const;

    static HttpResponse internal_error();

private:
    struct Route {
        std::string method;
        std::vector<std::string> segments;
        Handler handler;
    };

    HttpResponse route(HttpRequest& request) const;
    static HttpResponse preflight(const HttpRequest& request);
    static std::vector<std::string> split_path(std::string_view path);
    static bool match(const Route& route, const std::vector<std::string>& segments, HttpRequest& request);

    std::vector<Middleware> middleware_;
    std::vector<Route> routes_;
};
