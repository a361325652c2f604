#pragma once

#include <string>
#include <string_view>

/**
 * Validated body of POST /api/persons.
 */
struct PersonPayload {
    std::string name;
    std::string number;
};

enum class PayloadStatus {
    Ok,
    MalformedJson,
    MissingField
};

/// A field counts as present only when it is a non-empty JSON string.
/// A body that parses to something other than an object has no fields.
PayloadStatus parse_person_payload(std::string_view body, PersonPayload& out);
