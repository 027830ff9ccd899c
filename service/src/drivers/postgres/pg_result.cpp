#include <tasklist/pg_result.h>
#include <tasklist/exceptions.h>
#include <string>

namespace tasklist {

    PgResult::PgResult(PGresult* res) : res_(res, PQclear) {}

    PgResult PgResult::take(PGresult* res, PGconn* conn) {
        PgResult owned(res);
        if (!res) {
            throw StoreError("PostgreSQL returned no result: " + std::string(PQerrorMessage(conn)));
        }
        const ExecStatusType status = PQresultStatus(res);
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
            throw StoreError("PostgreSQL Query Error: " + std::string(PQresultErrorMessage(res)));
        }
        return owned;
    }

    std::size_t PgResult::row_count() const {
        return static_cast<std::size_t>(PQntuples(res_.get()));
    }

    std::optional<std::string_view> PgResult::value(std::size_t row, std::string_view column) const {
        const int col = PQfnumber(res_.get(), std::string(column).c_str());
        if (col < 0) {
            throw StoreError("Column not found: " + std::string(column));
        }
        const int r = static_cast<int>(row);
        if (PQgetisnull(res_.get(), r, col)) {
            return std::nullopt;
        }
        return std::string_view(PQgetvalue(res_.get(), r, col),
                                static_cast<std::size_t>(PQgetlength(res_.get(), r, col)));
    }

    std::int64_t PgResult::affected_rows() const {
        const char* tuples = PQcmdTuples(res_.get());
        return tuples[0] == '\0' ? 0 : std::stoll(tuples);
    }

} // namespace tasklist
