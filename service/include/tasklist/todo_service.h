#ifndef TASKLIST_TODO_SERVICE_H
#define TASKLIST_TODO_SERVICE_H

#include <memory>
#include <string>
#include <vector>
#include <tasklist/async.h>
#include <tasklist/result.h>
#include <tasklist/todo.h>
#include <tasklist/todo_store.h>

namespace tasklist {

inline constexpr const char* kNotFoundMessage = "no data find for given id";

/**
 * @brief The five todo operations.
 *
 * Sole writer of todo state. Each operation performs at most one store call
 * and reports the outcome as a Result; nothing is retried. Store failures are
 * logged and surface as FailureKind::Internal.
 */
class TodoService {
public:
    explicit TodoService(std::shared_ptr<TodoStore> store, Clock clock = system_now);

    /** @brief Validates, then inserts. Invalid input never reaches the store. */
    Async<Result<Todo>> create(const TodoFields& fields);

    Async<Result<std::vector<Todo>>> list_all();

    Async<Result<Todo>> get_by_id(const std::string& id);

    /**
     * @brief Writes the present fields as given and refreshes updated_at.
     * Field rules are not re-checked here; only create validates.
     */
    Async<Result<Todo>> update(const std::string& id, const TodoFields& fields);

    Async<Result<Deleted>> delete_by_id(const std::string& id);

private:
    std::shared_ptr<TodoStore> store_;
    Clock clock_;
};

} // namespace tasklist

#endif
