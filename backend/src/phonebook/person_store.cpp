/**
 * PersonStore — owns the phonebook collection for the lifetime of the process.
 *
 * Reads copy the current snapshot pointer under the lock and work on it
 * without holding it. Creates replace the snapshot with a copy that has the
 * new entry appended.
 */

#include "phonebook/person_store.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

PersonStore::PersonStore()
    : people_(std::make_shared<const std::vector<Person>>()) {}

PersonStore::PersonStore(std::vector<Person> seed) {
    std::unordered_set<std::int64_t> ids;
    std::unordered_set<std::string> names;
    for (const auto& person : seed) {
        if (person.id <= 0) {
            throw std::invalid_argument("seed id must be positive: " + std::to_string(person.id));
        }
        if (!ids.insert(person.id).second) {
            throw std::invalid_argument("duplicate seed id: " + std::to_string(person.id));
        }
        if (!names.insert(person.name).second) {
            throw std::invalid_argument("duplicate seed name: " + person.name);
        }
    }
    people_ = std::make_shared<const std::vector<Person>>(std::move(seed));
}

PersonStore::Snapshot PersonStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return people_;
}

std::vector<Person> PersonStore::list() const {
    return *snapshot();
}

std::optional<Person> PersonStore::get(std::int64_t id) const {
    auto people = snapshot();
    auto it = std::find_if(people->begin(), people->end(), [id](const Person& p) {
        return p.id == id;
    });
    if (it == people->end()) {
        return std::nullopt;
    }
    return *it;
}

PersonStore::CreateResult PersonStore::create(const std::string& name, const std::string& number) {
    CreateResult result;
    if (name.empty() || number.empty()) {
        result.status = CreateStatus::MissingField;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool exists = std::any_of(people_->begin(), people_->end(), [&name](const Person& p) {
        return p.name == name;
    });
    if (exists) {
        result.status = CreateStatus::DuplicateName;
        return result;
    }

    Person person{next_id(*people_), name, number};
    auto next = std::make_shared<std::vector<Person>>(*people_);
    next->push_back(person);
    people_ = std::move(next);

    result.status = CreateStatus::Created;
    result.person = std::move(person);
    return result;
}

std::size_t PersonStore::size() const {
    return snapshot()->size();
}

std::int64_t PersonStore::next_id(const std::vector<Person>& people) {
    if (people.empty()) {
        return 1;
    }
    auto it = std::max_element(people.begin(), people.end(), [](const Person& lhs, const Person& rhs) {
        return lhs.id < rhs.id;
    });
    return it->id + 1;
}
