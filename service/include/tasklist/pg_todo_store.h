#ifndef TASKLIST_PG_TODO_STORE_H
#define TASKLIST_PG_TODO_STORE_H

#include <memory>
#include <string>
#include <string_view>
#include <tasklist/database.h>
#include <tasklist/todo_store.h>

namespace tasklist {

/**
 * @brief TodoStore over a SQL Database (PostgreSQL dialect).
 *
 * One row per todo in `table`. Ids are server-generated UUIDs; timestamps are
 * stored as timestamptz and read back as epoch milliseconds.
 */
class PgTodoStore : public TodoStore {
public:
    explicit PgTodoStore(std::shared_ptr<Database> db, Clock clock = system_now, std::string table = "todos");

    /** @brief Creates the table if it does not exist. */
    Async<void> migrate();

    Async<Todo> insert(const TodoFields& fields) override;
    Async<std::vector<Todo>> find_all() override;
    Async<std::optional<Todo>> find_by_id(const std::string& id) override;
    Async<std::optional<Todo>> update_by_id(const std::string& id,
                                            const TodoFields& fields,
                                            Timestamp now) override;
    Async<bool> delete_by_id(const std::string& id) override;

    // Any textual form PostgreSQL's uuid type accepts (dashed, braced or bare hex)
    static bool is_uuid(std::string_view id);

private:
    std::string select_columns() const;
    static Todo row_to_todo(const Row& row);

    std::shared_ptr<Database> db_;
    Clock clock_;
    std::string table_;
};

} // namespace tasklist

#endif
