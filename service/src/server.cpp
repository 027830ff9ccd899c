#include "server.h"
#include <tasklist/app.h>
#include <tasklist/logger.h>
#include <tasklist/request.h>
#include <boost/json.hpp>

namespace tasklist {

namespace {

    Request from_beast(http::request<http::string_body>&& req) {
        Request out;
        out.method = {req.method_string().data(), req.method_string().size()};
        out.set_target({req.target().data(), req.target().size()});
        out.body = std::move(req.body());
        return out;
    }

    Async<void> handle_session(
        std::shared_ptr<HttpSession> self,
        App& app,
        Request req,
        std::string client_ip,
        bool keep_alive
    ) {
        auto& stream = self->stream();
        std::string response_str;
        bool failed = false;

        try {
            response_str = co_await app.handle_request(req, client_ip, keep_alive);
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("Async handler error: ") + e.what());
            failed = true;
        }

        if (failed) {
            keep_alive = false;
            response_str =
                "HTTP/1.1 500 Internal Server Error\r\n"
                "Content-Type: application/json; charset=utf-8\r\n"
                "Content-Length: 42\r\n"
                "Connection: close\r\n\r\n"
                "{\"success\":false,\"message\":\"Server Error\"}";
        }

        auto [ec, written] = co_await net::async_write(
            stream,
            net::buffer(response_str),
            net::as_tuple(net::use_awaitable)
        );
        boost::ignore_unused(written);

        if (ec) {
            Logger::instance().debug("write error: " + ec.message());
            co_return;
        }

        if (!keep_alive) {
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } else {
            self->do_read();
        }
    }
}

HttpSession::HttpSession(tcp::socket&& socket, App& app)
    : stream_(std::move(socket)), app_(app) {}

void HttpSession::run() {
    net::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(app_.get_config().max_body_size);

    stream_.expires_after(std::chrono::seconds(app_.get_config().timeout_seconds));

    http::async_read(stream_, buffer_, *parser_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, const std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec == http::error::body_limit) {
        send_error_response(http::status::payload_too_large, "Payload Too Large");
        return;
    }
    if (ec) {
        if (ec != net::error::connection_reset && ec != net::error::eof && ec != beast::error::timeout) {
            Logger::instance().warn("read error: " + ec.message());
        }
        return;
    }

    auto beast_req = parser_->release();
    const bool keep_alive = beast_req.keep_alive();

    net::co_spawn(
        stream_.get_executor(),
        handle_session(
            shared_from_this(),
            app_,
            from_beast(std::move(beast_req)),
            get_client_ip(),
            keep_alive
        ),
        net::detached
    );
}

std::string HttpSession::get_client_ip() {
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

void HttpSession::send_error_response(http::status status, std::string_view message) {
    auto res = std::make_shared<http::response<http::string_body>>(status, 11);
    res->set(http::field::server, "tasklist");
    res->set(http::field::content_type, "application/json; charset=utf-8");
    res->keep_alive(false);
    res->body() = boost::json::serialize(boost::json::object{
        {"success", false},
        {"message", message}
    });
    res->prepare_payload();

    http::async_write(stream_, *res,
        [self = shared_from_this(), res](beast::error_code ec, std::size_t bytes) {
            self->on_error_written(ec, bytes);
        });
}

void HttpSession::on_error_written(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    if (ec) return;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}


Listener::Listener(net::io_context& ioc, const tcp::endpoint& endpoint, App& app)
    : ioc_(ioc), acceptor_(ioc), app_(app) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void Listener::run() { do_accept(); }

void Listener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(const beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted || ec == net::error::bad_descriptor) {
            return;
        }
        if (ec != net::error::invalid_argument)
            Logger::instance().warn("accept error: " + ec.message());
    } else {
        std::make_shared<HttpSession>(std::move(socket), app_)->run();
    }
    do_accept();
}

} // namespace tasklist
