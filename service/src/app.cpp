#include <tasklist/app.h>
#include <tasklist/exceptions.h>
#include <tasklist/logger.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>
#include "server.h"

namespace tasklist {

App::App(AppConfig config) : config_(std::move(config)) {
    Logger::instance().configure(config_.log_path);
}

App::~App() {
    if (!ioc_.stopped()) {
        ioc_.stop();
    }
}

RouteGroup App::group(const std::string& prefix) {
    return RouteGroup(router_, prefix);
}

Async<std::string> App::handle_request(Request& req, const std::string& client_ip, const bool keep_alive) {
    const auto start_time = std::chrono::steady_clock::now();
    Response res;

    try {
        auto match = router_.match(req.method, req.path);
        if (match.has_value()) {
            req.params = std::move(match->params);
            co_await match->handler(req, res);
        } else {
            res.status(404).json({
                {"success", false},
                {"message", "Route not found"}
            });
        }
    } catch (const HttpError& e) {
        res = Response();
        res.status(e.status()).json({
            {"success", false},
            {"message", e.what()}
        });
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Exception in handle_request: ") + e.what());
        res = Response();
        res.status(500).json({
            {"success", false},
            {"error", e.what()},
            {"message", "Server Error"}
        });
    }

    res.header("Connection", keep_alive ? "keep-alive" : "close");

    const auto end_time = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    Logger::instance().log_access(client_ip, req.method, req.path, res.get_status(), duration);

    co_return res.build_response();
}

void App::run_startup(Async<void> task) {
    auto done = boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
    ioc_.run();
    ioc_.restart();
    done.get();
}

unsigned short App::bind(const int port) {
    auto const address = net::ip::make_address("0.0.0.0");
    auto const endpoint = net::ip::tcp::endpoint{address, static_cast<unsigned short>(port)};

    try {
        listener_ = std::make_shared<Listener>(ioc_, endpoint, *this);
        listener_->run();
    } catch (const std::exception& e) {
        Logger::instance().error(std::string("Could not start listener: ") + e.what());
        throw;
    }
    return listener_->local_port();
}

void App::run(int num_threads) {
    if (num_threads <= 0) {
        num_threads = 4;
    }

    // (Ctrl+C) to stop cleanly
    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](boost::system::error_code const& ec, int) {
        if (!ec) {
            Logger::instance().info("Shutting down");
            stop();
        }
    });

    std::vector<std::thread> v;
    v.reserve(num_threads - 1);
    for (auto i = num_threads - 1; i > 0; --i)
        v.emplace_back([this] {
            ioc_.run();
        });

    // Run on the calling thread too
    ioc_.run();

    for (auto& t : v)
        t.join();
}

void App::listen(const int port, const int num_threads) {
    const unsigned short bound = bind(port);
    Logger::instance().info("Listening on port " + std::to_string(bound));
    run(num_threads);
}

void App::stop() {
    ioc_.stop();
}

} // namespace tasklist
