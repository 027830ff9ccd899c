#include <tasklist/request.h>
#include <tasklist/util/string.h>

namespace tasklist {

void Request::set_target(std::string_view target) {
    path = std::string(target.substr(0, target.find('?')));
}

boost::json::value Request::json_value() const {
    if (util::trim(body).empty()) {
        return boost::json::object{};
    }

    boost::system::error_code ec;
    auto val = boost::json::parse(body, ec);
    if (ec) {
        throw BadRequest("Invalid JSON body: " + ec.message());
    }
    return val;
}

const std::string& Request::param(const std::string& key) const {
    auto it = params.find(key);
    if (it == params.end()) {
        throw BadRequest("Missing path parameter: " + key);
    }
    return it->second;
}

} // namespace tasklist
