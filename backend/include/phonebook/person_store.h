#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "phonebook/person.h"

/**
 * The in-memory collection of phonebook entries.
 *
 * Names and ids are unique across the collection. Every successful create
 * publishes a new immutable snapshot, so readers that already hold a
 * snapshot never observe the append.
 */
class PersonStore {
public:
    enum class CreateStatus {
        Created,
        MissingField,
        DuplicateName
    };

    struct CreateResult {
        CreateStatus status = CreateStatus::MissingField;
        std::optional<Person> person;
    };

    using Snapshot = std::shared_ptr<const std::vector<Person>>;

    PersonStore();

    /// Throws std::invalid_argument if the seed repeats an id or a name.
    explicit PersonStore(std::vector<Person> seed);

    PersonStore(const PersonStore&) = delete;
    PersonStore& operator=(const PersonStore&) = delete;

    [[nodiscard]] Snapshot snapshot() const;

    [[nodiscard]] std::vector<Person> list() const;

    [[nodiscard]] std::optional<Person> get(std::int64_t id) const;

    /// Checks for a duplicate name, assigns max id + 1 and appends, as one step.
    CreateResult create(const std::string& name, const std::string& number);

    [[nodiscard]] std::size_t size() const;

    static std::int64_t next_id(const std::vector<Person>& people);

private:
    mutable std::mutex mutex_;
    Snapshot people_;
};
