#ifndef TASKLIST_TODO_STORE_H
#define TASKLIST_TODO_STORE_H

#include <optional>
#include <string>
#include <vector>
#include <tasklist/async.h>
#include <tasklist/todo.h>

namespace tasklist {

/**
 * @brief Abstract persistence interface for todos.
 *
 * Every operation touches a single record and is atomic at the store.
 * A missing record is reported through the return value (empty optional,
 * false); any failure of the store itself throws StoreError.
 */
class TodoStore {
public:
    virtual ~TodoStore() = default;

    /**
     * @brief Persists a new record.
     * The store assigns id, created_at and updated_at (equal on insert).
     * Absent fields are stored as empty strings.
     */
    virtual Async<Todo> insert(const TodoFields& fields) = 0;

    /** @brief Every stored record, in the store's natural order. */
    virtual Async<std::vector<Todo>> find_all() = 0;

    /** @brief Exact id match. Malformed ids yield std::nullopt. */
    virtual Async<std::optional<Todo>> find_by_id(const std::string& id) = 0;

    /**
     * @brief Replaces the present fields and stamps updated_at.
     * updated_at becomes max(now, previous updated_at + 1ms).
     * @return The record after the update, or std::nullopt if id is unknown.
     */
    virtual Async<std::optional<Todo>> update_by_id(const std::string& id,
                                                    const TodoFields& fields,
                                                    Timestamp now) = 0;

    /** @return false if no record had this id. */
    virtual Async<bool> delete_by_id(const std::string& id) = 0;
};

} // namespace tasklist

#endif
