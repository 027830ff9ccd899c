#ifndef TASKLIST_POSTGRES_POOL_H
#define TASKLIST_POSTGRES_POOL_H

#include <chrono>
#include <string>
#include <vector>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <tasklist/database.h>
#include <tasklist/pg_connection.h>
#include <tasklist/util/checkout_queue.h>
#include <tasklist/util/circuit_breaker.h>

namespace tasklist {

    /**
     * @brief Fixed-size pool of PgConnections implementing Database.
     *
     * Queries are not retried. A query that fails on a broken connection
     * closes it; the next caller that receives it reconnects first.
     */
    class PgPool : public Database, public std::enable_shared_from_this<PgPool> {
    public:
        PgPool(boost::asio::io_context& ctx, std::string conn_str, int size = 10);

        /**
         * @brief Opens every connection in the pool.
         * @throws StoreError if any connection cannot be established.
         */
        Async<void> connect();

        Async<DbResult> query(const std::string& sql, const std::vector<std::string>& params = {}) override;
        using Database::query;

        std::string placeholder(const int index) const override {
            return "$" + std::to_string(index);
        }

        static constexpr std::chrono::seconds kAcquireTimeout{5};

    private:
        boost::asio::io_context& ctx_;
        std::string conn_str_;
        int size_;

        std::vector<std::unique_ptr<PgConnection>> pool_;
        util::CheckoutQueue<PgConnection*> idle_;
        CircuitBreaker breaker_;
    };

    // Shortcut
    using Postgres = PgPool;

} // namespace tasklist

#endif // TASKLIST_POSTGRES_POOL_H
