#ifndef TASKLIST_TODO_H
#define TASKLIST_TODO_H

#include <cstddef>
#include <optional>
#include <string>
#include <boost/json.hpp>
#include <tasklist/model.h>
#include <tasklist/util/time.h>

namespace tasklist {

inline constexpr std::size_t kMaxFieldLength = 50;

/**
 * @brief A stored todo record.
 *
 * id is assigned by the store on insert and never changes. created_at is set
 * once; updated_at starts equal to it and moves forward on every update.
 */
struct Todo {
    std::string id;
    std::string title;
    std::string description;
    Timestamp created_at;
    Timestamp updated_at;
};

/**
 * @brief Typed request body for create and update.
 * An absent key and an explicit null both leave the field empty.
 */
struct TodoFields {
    std::optional<std::string> title;
    std::optional<std::string> description;
};

TASKLIST_MODEL(TodoFields, title, description)

struct ValidationError {
    std::string field;
    std::string message;
};

/**
 * @brief Checks the create-time field rules.
 * Each field must be present, non-empty and at most kMaxFieldLength characters.
 * @return The first violation found, title before description.
 */
[[nodiscard]] std::optional<ValidationError> validate(const std::optional<std::string>& title,
                                                      const std::optional<std::string>& description);

inline std::optional<ValidationError> validate(const TodoFields& fields) {
    return validate(fields.title, fields.description);
}

// {"id", "title", "description", "createdAt", "updatedAt"}
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Todo& todo);

} // namespace tasklist

#endif
