#include <tasklist/pg_pool.h>
#include <tasklist/exceptions.h>
#include <tasklist/logger.h>

namespace tasklist {

    PgPool::PgPool(boost::asio::io_context& ctx, std::string conn_str, int size)
        : ctx_(ctx), conn_str_(std::move(conn_str)), size_(size), idle_(ctx, kAcquireTimeout) {}

    Async<void> PgPool::connect() {
        for (int i = 0; i < size_; ++i) {
            auto conn = std::make_unique<PgConnection>(ctx_);
            co_await conn->connect(conn_str_);

            idle_.release(conn.get());
            pool_.push_back(std::move(conn));
        }

        Logger::instance().info("Postgres pool ready with " + std::to_string(size_) + " connections");
    }

    Async<DbResult> PgPool::query(const std::string& sql, const std::vector<std::string>& params) {
        if (!breaker_.try_acquire()) {
            throw StoreError("Postgres Circuit Open: Too many recent failures");
        }

        PgConnection* conn = nullptr;
        std::exception_ptr failure;
        try {
            conn = co_await idle_.acquire();
            if (!conn->is_open()) {
                co_await conn->connect(conn_str_);
            }

            PgResult res = co_await conn->query(sql, params);

            idle_.release(conn);
            breaker_.on_success();
            co_return DbResult(std::make_shared<PgResult>(std::move(res)));
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("Postgres query failed: ") + e.what());
            failure = std::current_exception();
        }

        if (conn) {
            conn->force_close();
            idle_.release(conn);
        }
        breaker_.on_failure();
        std::rethrow_exception(failure);
    }

} // namespace tasklist
