#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * One phonebook entry. Ids are assigned by PersonStore and never change.
 */
struct Person {
    std::int64_t id = 0;
    std::string name;
    std::string number;
};

bool operator==(const Person& lhs, const Person& rhs);
bool operator!=(const Person& lhs, const Person& rhs);

/// Serialises as {"id": ..., "name": ..., "number": ...}.
void to_json(nlohmann::json& j, const Person& person);

/// The four entries every fresh store starts with (ids 1-4).
std::vector<Person> seed_people();
