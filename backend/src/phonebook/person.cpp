/**
 * Person — value type for a single phonebook entry and its JSON form.
 */

#include "phonebook/person.h"

bool operator==(const Person& lhs, const Person& rhs) {
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.number == rhs.number;
}

bool operator!=(const Person& lhs, const Person& rhs) {
    return !(lhs == rhs);
}

void to_json(nlohmann::json& j, const Person& person) {
    j = nlohmann::json{
        {"id", person.id},
        {"name", person.name},
        {"number", person.number},
    };
}

std::vector<Person> seed_people() {
    return {
        {1, "Arto Hellas", "040-123456"},
        {2, "Ada Lovelace", "39-44-5323523"},
        {3, "Dan Abramov", "12-43-234345"},
        {4, "Mary Poppendieck", "39-23-6423122"},
    };
}
