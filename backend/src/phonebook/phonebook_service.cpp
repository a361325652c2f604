/**
 * PhonebookService — route handlers over the PersonStore.
 *
 * Expected failures (missing fields, duplicate names, unknown ids) are
 * answered here. Anything thrown propagates to Router::dispatch, which turns
 * it into the generic 500.
 */

#include "phonebook/phonebook_service.h"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "phonebook/person_payload.h"

using json = nlohmann::json;

namespace {

std::optional<std::int64_t> parse_id(std::string_view text) {
    std::int64_t id = 0;
    auto first = text.data();
    auto last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, id);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return id;
}

HttpResponse error_response(int status, const char* message) {
    return HttpResponse::json(status, {{"error", message}});
}

} // namespace

PhonebookService::PhonebookService(PersonStore& store, Clock clock)
    : store_(store), clock_(std::move(clock)) {}

void PhonebookService::register_routes(Router& router) {
    router.get("/", [this](const HttpRequest& req) { return handle_root(req); });
    router.get("/api/persons", [this](const HttpRequest& req) { return handle_list(req); });
    router.get("/info", [this](const HttpRequest& req) { return handle_info(req); });
    router.get("/api/persons/:id", [this](const HttpRequest& req) { return handle_get(req); });
    router.post("/api/persons", [this](const HttpRequest& req) { return handle_create(req); });
}

std::string PhonebookService::format_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "localtime_r");
    }
    char buf[128];
    std::size_t n = std::strftime(buf, sizeof(buf), "%a %b %d %Y %H:%M:%S GMT%z (%Z)", &local);
    return std::string(buf, n);
}

HttpResponse PhonebookService::handle_root(const HttpRequest&) const {
    spdlog::info("GET / request received.");
    return HttpResponse::html(200, "<h1>Phonebook Backend is Running!</h1>");
}

HttpResponse PhonebookService::handle_list(const HttpRequest&) const {
    spdlog::info("GET /api/persons request received.");
    auto people = store_.snapshot();
    return HttpResponse::json(200, *people);
}

HttpResponse PhonebookService::handle_info(const HttpRequest&) const {
    spdlog::info("GET /info request received.");
    std::string markup = "<div>\n";
    markup += "  <p>Phonebook has info for " + std::to_string(store_.size()) + " people</p>\n";
    markup += "  <p>" + format_timestamp(clock_()) + "</p>\n";
    markup += "</div>";
    return HttpResponse::html(200, std::move(markup));
}

HttpResponse PhonebookService::handle_get(const HttpRequest& req) const {
    const auto& raw = req.params.at("id");
    auto id = parse_id(raw);
    std::optional<Person> person;
    if (id) {
        person = store_.get(*id);
    }
    if (!person) {
        spdlog::info("GET /api/persons/{} request received. Person not found.", raw);
        return HttpResponse::empty(404);
    }
    spdlog::info("GET /api/persons/{} request received. Found person: {}", raw, person->name);
    return HttpResponse::json(200, *person);
}

HttpResponse PhonebookService::handle_create(const HttpRequest& req) {
    spdlog::info("POST /api/persons request received. Body: {}", req.body);

    std::string_view body;
    if (is_json_content_type(req.header("Content-Type"))) {
        body = req.body;
    }

    PersonPayload payload;
    switch (parse_person_payload(body, payload)) {
    case PayloadStatus::Ok:
        break;
    case PayloadStatus::MalformedJson:
        spdlog::warn("Error: request body is not valid JSON.");
        return error_response(400, "malformatted json");
    case PayloadStatus::MissingField:
        spdlog::warn("Error: Name or number is missing.");
        return error_response(400, "name or number missing");
    }

    auto result = store_.create(payload.name, payload.number);
    switch (result.status) {
    case PersonStore::CreateStatus::Created:
        break;
    case PersonStore::CreateStatus::MissingField:
        spdlog::warn("Error: Name or number is missing.");
        return error_response(400, "name or number missing");
    case PersonStore::CreateStatus::DuplicateName:
        spdlog::warn("Error: Name '{}' already exists.", payload.name);
        return error_response(409, "name already exists");
    }

    const Person& person = *result.person;
    spdlog::info("New person added: id={} name={} number={}", person.id, person.name, person.number);
    return HttpResponse::json(201, person);
}
