#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "api/http_message.h"
#include "api/router.h"
#include "phonebook/person_store.h"

/**
 * The phonebook REST surface.
 *
 *   GET  /                   — banner
 *   GET  /api/persons        — every entry
 *   GET  /info               — entry count and server time (HTML)
 *   GET  /api/persons/:id    — one entry, or 404 with no body
 *   POST /api/persons        — create { "name": "...", "number": "..." }
 */
class PhonebookService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit PhonebookService(PersonStore& store, Clock clock = [] { return std::chrono::system_clock::now(); });

    void register_routes(Router& router);

    /// Local time, e.g. "Mon Oct 19 2026 10:00:00 GMT+0200 (CEST)".
    static std::string format_timestamp(std::chrono::system_clock::time_point when);

private:
    HttpResponse handle_root(const HttpRequest& req) const;
    HttpResponse handle_list(const HttpRequest& req) const;
    HttpResponse handle_info(const HttpRequest& req) const;
    HttpResponse handle_get(const HttpRequest& req) const;
    HttpResponse handle_create(const HttpRequest& req);

    PersonStore& store_;
    Clock clock_;
};
