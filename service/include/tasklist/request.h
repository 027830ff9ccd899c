#ifndef TASKLIST_REQUEST_H
#define TASKLIST_REQUEST_H

#include <string>
#include <string_view>
#include <unordered_map>
#include <boost/json.hpp>
#include <tasklist/exceptions.h>

namespace tasklist {

struct Request {
    std::string method;
    std::string path;
    std::string body;
    std::unordered_map<std::string, std::string> params;

    // Keeps the path part of "/path?a=1"
    void set_target(std::string_view target);

    // Parsed body. Blank bodies read as {}; only unparseable text throws BadRequest.
    boost::json::value json_value() const;

    // Typed JSON Extraction
    template<typename T>
    T json() const {
        return boost::json::value_to<T>(json_value());
    }

    // Path parameter captured by the router. Throws BadRequest if absent.
    const std::string& param(const std::string& key) const;
};

} // namespace tasklist

#endif
