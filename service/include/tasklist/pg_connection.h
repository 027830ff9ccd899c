#ifndef TASKLIST_POSTGRES_CONNECTION_H
#define TASKLIST_POSTGRES_CONNECTION_H

#include <libpq-fe.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <string>
#include <vector>
#include <tasklist/async.h>
#include <tasklist/pg_result.h>

namespace tasklist {

    /**
     * @brief One libpq session whose socket waits go through Asio.
     *
     * libpq keeps ownership of the descriptor; the stream_descriptor only
     * borrows it for readiness notifications. A connection that threw from
     * query() should be closed and reconnected before reuse.
     */
    class PgConnection {
    public:
        explicit PgConnection(boost::asio::io_context& ctx);
        ~PgConnection();

        PgConnection(const PgConnection&) = delete;
        PgConnection& operator=(const PgConnection&) = delete;

        // Drops any current session first. Throws StoreError.
        Async<void> connect(const std::string& conninfo);

        // Runs one parameterised statement. Throws StoreError.
        [[nodiscard]] Async<PgResult> query(const std::string& sql, const std::vector<std::string>& params);

        bool is_open() const { return session_ != nullptr && watcher_.is_open(); }
        void force_close();

    private:
        enum class Ready { Read, Write };

        PGconn* session_ = nullptr;
        boost::asio::posix::stream_descriptor watcher_;

        void watch_current_socket();
        [[noreturn]] void fail(const std::string& what);
        Async<void> wait(Ready ready);
        Async<void> flush();
    };

} // namespace tasklist

#endif // TASKLIST_POSTGRES_CONNECTION_H
