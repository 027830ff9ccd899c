#ifndef TASKLIST_SERVER_H
#define TASKLIST_SERVER_H

#include <boost/beast/core.hpp>         // buffer, tcp_stream
#include <boost/beast/http.hpp>         // request, response, parsing
#include <boost/asio/ip/tcp.hpp>        // sockets, acceptor
#include <boost/asio.hpp>               // io_context
#include <memory>
#include <optional>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace tasklist {

class App;

// Handles one HTTP/1.1 connection
class HttpSession : public std::enable_shared_from_this<HttpSession> {
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    App& app_;

public:
    HttpSession(tcp::socket&& socket, App& app);

    void run();
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    beast::tcp_stream& stream() { return stream_; }

private:
    std::string get_client_ip();
    void send_error_response(http::status status, std::string_view message);
    void on_error_written(beast::error_code ec, std::size_t bytes_transferred);
};

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    App& app_;

public:
    // Throws boost::system::system_error if the endpoint cannot be bound
    Listener(net::io_context& ioc, const tcp::endpoint& endpoint, App& app);
    void run();
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    unsigned short local_port() const { return acceptor_.local_endpoint().port(); }
};

} // namespace tasklist

#endif
