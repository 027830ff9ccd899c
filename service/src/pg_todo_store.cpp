#include <tasklist/pg_todo_store.h>
#include <tasklist/exceptions.h>
#include <boost/uuid/string_generator.hpp>

namespace tasklist {

namespace {

    // Epoch milliseconds parameter -> timestamptz
    std::string timestamp_param(const std::string& placeholder) {
        return "('epoch'::timestamptz + " + placeholder + "::bigint * interval '1 millisecond')";
    }

}

PgTodoStore::PgTodoStore(std::shared_ptr<Database> db, Clock clock, std::string table)
    : db_(std::move(db)), clock_(std::move(clock)), table_(std::move(table)) {}

bool PgTodoStore::is_uuid(std::string_view id) {
    try {
        boost::uuids::string_generator()(id.begin(), id.end());
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

std::string PgTodoStore::select_columns() const {
    return "\"id\"::text AS \"id\", \"title\", \"description\", "
           "(EXTRACT(EPOCH FROM \"created_at\") * 1000)::bigint AS \"created_at_ms\", "
           "(EXTRACT(EPOCH FROM \"updated_at\") * 1000)::bigint AS \"updated_at_ms\"";
}

Todo PgTodoStore::row_to_todo(const Row& row) {
    Todo todo;
    todo.id = row["id"].as<std::string>();
    todo.title = row["title"].as<std::string>();
    todo.description = row["description"].as<std::string>();
    todo.created_at = util::from_epoch_ms(row["created_at_ms"].as<std::int64_t>());
    todo.updated_at = util::from_epoch_ms(row["updated_at_ms"].as<std::int64_t>());
    return todo;
}

Async<void> PgTodoStore::migrate() {
    co_await db_->query(
        "CREATE TABLE IF NOT EXISTS \"" + table_ + "\" ("
        "\"id\" UUID PRIMARY KEY DEFAULT gen_random_uuid(), "
        "\"title\" TEXT NOT NULL, "
        "\"description\" TEXT NOT NULL, "
        "\"created_at\" TIMESTAMPTZ NOT NULL, "
        "\"updated_at\" TIMESTAMPTZ NOT NULL)");
}

Async<Todo> PgTodoStore::insert(const TodoFields& fields) {
    const std::string created = timestamp_param(db_->placeholder(3));
    const std::string sql =
        "INSERT INTO \"" + table_ + "\" (\"title\", \"description\", \"created_at\", \"updated_at\") "
        "VALUES (" + db_->placeholder(1) + ", " + db_->placeholder(2) + ", " + created + ", " + created + ") "
        "RETURNING " + select_columns();

    auto res = co_await db_->query(sql, fields.title.value_or(""), fields.description.value_or(""),
                                   util::to_epoch_ms(clock_()));
    if (res.empty()) {
        throw StoreError("Insert into " + table_ + " returned no row");
    }
    co_return row_to_todo(res[0]);
}

Async<std::vector<Todo>> PgTodoStore::find_all() {
    auto res = co_await db_->query("SELECT " + select_columns() + " FROM \"" + table_ + "\" ORDER BY \"created_at\", \"id\"");

    std::vector<Todo> todos;
    todos.reserve(res.size());
    for (size_t i = 0; i < res.size(); ++i) {
        todos.push_back(row_to_todo(res[i]));
    }
    co_return todos;
}

Async<std::optional<Todo>> PgTodoStore::find_by_id(const std::string& id) {
    if (!is_uuid(id)) {
        co_return std::nullopt;
    }

    const std::string sql = "SELECT " + select_columns() + " FROM \"" + table_ +
                            "\" WHERE \"id\" = " + db_->placeholder(1) + "::uuid";
    auto res = co_await db_->query(sql, id);
    if (res.empty()) {
        co_return std::nullopt;
    }
    co_return row_to_todo(res[0]);
}

Async<std::optional<Todo>> PgTodoStore::update_by_id(const std::string& id,
                                                     const TodoFields& fields,
                                                     Timestamp now) {
    if (!is_uuid(id)) {
        co_return std::nullopt;
    }

    // Only present fields are written
    std::string sets;
    std::vector<std::string> params;
    int idx = 1;

    if (fields.title) {
        sets += "\"title\" = " + db_->placeholder(idx++) + ", ";
        params.push_back(*fields.title);
    }
    if (fields.description) {
        sets += "\"description\" = " + db_->placeholder(idx++) + ", ";
        params.push_back(*fields.description);
    }

    sets += "\"updated_at\" = GREATEST(" + timestamp_param(db_->placeholder(idx++)) +
            ", \"updated_at\" + interval '1 millisecond')";
    params.push_back(std::to_string(util::to_epoch_ms(now)));

    const std::string sql = "UPDATE \"" + table_ + "\" SET " + sets +
                            " WHERE \"id\" = " + db_->placeholder(idx) + "::uuid RETURNING " + select_columns();
    params.push_back(id);

    auto res = co_await db_->query(sql, params);
    if (res.empty()) {
        co_return std::nullopt;
    }
    co_return row_to_todo(res[0]);
}

Async<bool> PgTodoStore::delete_by_id(const std::string& id) {
    if (!is_uuid(id)) {
        co_return false;
    }

    const std::string sql = "DELETE FROM \"" + table_ + "\" WHERE \"id\" = " + db_->placeholder(1) + "::uuid";
    auto res = co_await db_->query(sql, id);
    co_return res.affected_rows() > 0;
}

} // namespace tasklist
