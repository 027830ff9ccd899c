#ifndef TASKLIST_DATABASE_H
#define TASKLIST_DATABASE_H

#include <tasklist/async.h>
#include <tasklist/db_result.h>
#include <tasklist/util/string.h>
#include <string>
#include <vector>
#include <type_traits>

namespace tasklist {

/**
 * @brief Abstract interface for SQL drivers.
 *
 * Stores code against this interface so the driver can be swapped for a
 * spy in tests.
 */
class Database {
public:
    virtual ~Database() = default;

    /**
     * @brief Executes an asynchronous SQL query with optional parameters.
     *
     * @param sql The SQL string (use $1, $2 placeholders).
     * @param params Text parameters, sent separately from the SQL.
     * @throws StoreError when the query or the connection fails.
     */
    virtual Async<DbResult> query(const std::string& sql, const std::vector<std::string>& params = {}) = 0;

    /**
     * @brief Returns the parameter placeholder for the specific driver ("$1", "$2").
     */
    virtual std::string placeholder(int index) const = 0;

    /**
     * @brief Variadic overload for convenient parameter passing.
     * usage: db.query("SELECT * FROM todos WHERE id = $1::uuid", id);
     * Disabled if the only argument is already a vector<string> to prevent recursion.
     */
    template<typename... Args,
             typename = std::enable_if_t<(sizeof...(Args) > 0) &&
                 !(sizeof...(Args) == 1 && (std::is_same_v<std::decay_t<Args>, std::vector<std::string>> && ...))>>
    Async<DbResult> query(const std::string& sql, Args&&... args) {
        std::vector<std::string> params = { util::to_string_param(args)... };
        co_return co_await query(sql, params);
    }
};

} // namespace tasklist

#endif
