#ifndef TASKLIST_APP_H
#define TASKLIST_APP_H

#include <cstddef>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <tasklist/async.h>
#include <tasklist/router.h>

namespace net = boost::asio;

namespace tasklist {

class Listener;

struct AppConfig {
    std::size_t max_body_size = 1024 * 1024;  // 1MB default
    int timeout_seconds = 30;                 // 30s timeout
    std::string log_path = "stdout";          // Logging destination
};

/**
 * @brief Owns the router and the Boost.Asio engine that serves it.
 *
 * Every request goes through handle_request, which dispatches to the matched
 * handler and turns anything thrown into a JSON envelope.
 */
class App {
private:
    Router router_;
    net::io_context ioc_;
    AppConfig config_;
    std::shared_ptr<Listener> listener_;

public:
    explicit App(AppConfig config = {});
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    const AppConfig& get_config() const { return config_; }

    /** @brief Creates a route group with a common prefix. */
    RouteGroup group(const std::string& prefix);

    /** @brief Returns the internal io_context engine. */
    net::io_context& engine() { return ioc_; }

    /**
     * @brief Dispatches one request and returns the serialized HTTP response.
     *
     * Unmatched routes produce a 404 envelope. HttpError maps to its status;
     * any other exception becomes a 500. One access-log line is written.
     */
    Async<std::string> handle_request(Request& req, const std::string& client_ip, bool keep_alive);

    /**
     * @brief Runs @p task on the engine until it completes, before serving.
     * Rethrows whatever the task throws.
     */
    void run_startup(Async<void> task);

    /**
     * @brief Binds 0.0.0.0:@p port and starts accepting.
     * @return The bound port (useful when @p port is 0).
     * @throws boost::system::system_error if the port cannot be bound.
     */
    unsigned short bind(int port);

    /**
     * @brief Runs the engine on @p num_threads threads until stop() or SIGINT/SIGTERM.
     */
    void run(int num_threads = 0);

    /** @brief bind() followed by run(). */
    void listen(int port, int num_threads = 0);

    void stop();
};

} // namespace tasklist

#endif
