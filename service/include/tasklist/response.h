#ifndef TASKLIST_RESPONSE_H
#define TASKLIST_RESPONSE_H

#include <string>
#include <string_view>
#include <type_traits>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json.hpp>

namespace tasklist {

class Response {
private:
    boost::beast::http::response<boost::beast::http::string_body> res_;

public:
    Response();

    Response& status(int code);
    Response& header(const std::string& key, const std::string& value);

    // Boost.JSON overload
    Response& json(const boost::json::value& data);

    // Generic JSON Serializer
    template<typename T>
    Response& json(const T& data) {
        if constexpr (std::is_convertible_v<T, boost::json::value>) {
            return json(static_cast<boost::json::value>(data));
        } else {
            return json(boost::json::value_from(data));
        }
    }

    std::string build_response() const;
    int get_status() const;
    const std::string& body() const { return res_.body(); }
};

} // namespace tasklist

#endif
