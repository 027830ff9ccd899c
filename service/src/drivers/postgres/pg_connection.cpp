#include <tasklist/pg_connection.h>
#include <tasklist/exceptions.h>
#include <boost/asio/use_awaitable.hpp>

namespace tasklist {

    using Descriptor = boost::asio::posix::stream_descriptor;

    PgConnection::PgConnection(boost::asio::io_context& ctx) : watcher_(ctx) {}

    PgConnection::~PgConnection() {
        force_close();
    }

    void PgConnection::force_close() {
        if (watcher_.is_open()) {
            watcher_.release();
        }
        if (session_) {
            PQfinish(session_);
            session_ = nullptr;
        }
    }

    void PgConnection::fail(const std::string& what) {
        std::string detail = session_ ? PQerrorMessage(session_) : "";
        force_close();
        throw StoreError(what + ": " + detail);
    }

    // libpq may switch sockets while connecting (e.g. trying the next host)
    void PgConnection::watch_current_socket() {
        const int fd = PQsocket(session_);
        if (fd < 0) {
            fail("PostgreSQL socket unavailable");
        }
        if (watcher_.is_open() && watcher_.native_handle() == fd) {
            return;
        }
        if (watcher_.is_open()) {
            watcher_.release();
        }
        watcher_.assign(fd);
    }

    Async<void> PgConnection::connect(const std::string& conninfo) {
        force_close();

        session_ = PQconnectStart(conninfo.c_str());
        if (!session_) {
            throw StoreError("Failed to allocate PostgreSQL connection object");
        }
        if (PQstatus(session_) == CONNECTION_BAD) {
            fail("PostgreSQL connection failed");
        }

        for (auto state = PGRES_POLLING_WRITING; state != PGRES_POLLING_OK; state = PQconnectPoll(session_)) {
            if (state == PGRES_POLLING_FAILED) {
                fail("PostgreSQL handshake failed");
            }
            watch_current_socket();
            co_await wait(state == PGRES_POLLING_READING ? Ready::Read : Ready::Write);
        }

        if (PQsetnonblocking(session_, 1) != 0) {
            fail("Failed to make PostgreSQL connection non-blocking");
        }
    }

    Async<PgResult> PgConnection::query(const std::string& sql, const std::vector<std::string>& params) {
        if (!is_open()) {
            throw StoreError("PostgreSQL connection is not open");
        }

        std::vector<const char*> values;
        values.reserve(params.size());
        for (const auto& p : params) {
            values.push_back(p.c_str());
        }

        // Text-format parameters; the server infers or casts types
        if (!PQsendQueryParams(session_, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0)) {
            throw StoreError("Failed to send query: " + std::string(PQerrorMessage(session_)));
        }

        co_await flush();

        while (PQisBusy(session_)) {
            co_await wait(Ready::Read);
            if (!PQconsumeInput(session_)) {
                throw StoreError("Failed to read from PostgreSQL: " + std::string(PQerrorMessage(session_)));
            }
        }

        PGresult* first = PQgetResult(session_);
        while (PGresult* extra = PQgetResult(session_)) {
            PQclear(extra);
        }

        co_return PgResult::take(first, session_);
    }

    Async<void> PgConnection::wait(Ready ready) {
        co_await watcher_.async_wait(
            ready == Ready::Read ? Descriptor::wait_read : Descriptor::wait_write,
            boost::asio::use_awaitable);
    }

    Async<void> PgConnection::flush() {
        for (int pending = PQflush(session_); pending != 0; pending = PQflush(session_)) {
            if (pending < 0) {
                throw StoreError("Failed to flush output: " + std::string(PQerrorMessage(session_)));
            }
            co_await wait(Ready::Write);
        }
    }

} // namespace tasklist
