/**
 * Boundary parsing for the create-person request body.
 */

#include "phonebook/person_payload.h"

#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

bool read_required_string(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return !out.empty();
}

} // namespace

PayloadStatus parse_person_payload(std::string_view body, PersonPayload& out) {
    json parsed = json::object();
    if (body.find_first_not_of(" \t\r\n") != std::string_view::npos) {
        parsed = json::parse(body.begin(), body.end(), nullptr, false);
        if (parsed.is_discarded()) {
            return PayloadStatus::MalformedJson;
        }
    }
    if (!parsed.is_object()) {
        return PayloadStatus::MissingField;
    }

    PersonPayload payload;
    if (!read_required_string(parsed, "name", payload.name) ||
        !read_required_string(parsed, "number", payload.number)) {
        return PayloadStatus::MissingField;
    }
    out = std::move(payload);
    return PayloadStatus::Ok;
}
