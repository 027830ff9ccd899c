#include <tasklist/response.h>
#include <boost/json/src.hpp>
#include <boost/beast/http/write.hpp>
#include <sstream>

namespace tasklist {

namespace http = boost::beast::http;

Response::Response() {
    res_.version(11);
    res_.result(http::status::ok);
    res_.set(http::field::server, "tasklist");
}

Response& Response::status(int code) {
    res_.result(static_cast<unsigned>(code));
    return *this;
}

Response& Response::header(const std::string& key, const std::string& value) {
    res_.set(key, value);
    return *this;
}

Response& Response::json(const boost::json::value& data) {
    res_.set(http::field::content_type, "application/json; charset=utf-8");
    res_.body() = boost::json::serialize(data);
    return *this;
}

std::string Response::build_response() const {
    auto out = res_;
    out.prepare_payload();

    std::ostringstream oss;
    oss << out;
    return oss.str();
}

int Response::get_status() const {
    return res_.result_int();
}

} // namespace tasklist
