#ifndef TASKLIST_POSTGRES_RESULT_H
#define TASKLIST_POSTGRES_RESULT_H

#include <libpq-fe.h>
#include <memory>
#include <string>
#include <tasklist/db_result.h>

namespace tasklist {

    // Owns a PGresult. Only successful results are wrapped; see PgResult::take.
    class PgResult : public ResultImpl {
    public:
        /**
         * @brief Wraps @p res, or throws StoreError carrying the server's
         * message when the statement did not succeed. Clears @p res either way.
         */
        static PgResult take(PGresult* res, PGconn* conn);

        std::size_t row_count() const override;
        std::optional<std::string_view> value(std::size_t row, std::string_view column) const override;
        std::int64_t affected_rows() const override;

    private:
        explicit PgResult(PGresult* res);

        std::shared_ptr<PGresult> res_;
    };

} // namespace tasklist

#endif // TASKLIST_POSTGRES_RESULT_H
