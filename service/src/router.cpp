#include <tasklist/router.h>
#include <tasklist/util/string.h>
#include <algorithm>

namespace tasklist {

namespace {

    // Yields the next non-empty '/'-delimited piece of @p rest, consuming it.
    std::optional<std::string_view> next_segment(std::string_view& rest) {
        while (!rest.empty() && rest.front() == '/') {
            rest.remove_prefix(1);
        }
        if (rest.empty()) {
            return std::nullopt;
        }
        auto cut = std::min(rest.find('/'), rest.size());
        auto seg = rest.substr(0, cut);
        rest.remove_prefix(cut);
        return seg;
    }

}

RouteGroup::RouteGroup(Router& router, std::string prefix)
    : router_(router), prefix_(std::move(prefix)) {}

void RouteGroup::get(const std::string& path, Handler handler) const {
    router_.add_route("GET", prefix_ + path, std::move(handler));
}

void RouteGroup::post(const std::string& path, Handler handler) const {
    router_.add_route("POST", prefix_ + path, std::move(handler));
}

void RouteGroup::put(const std::string& path, Handler handler) const {
    router_.add_route("PUT", prefix_ + path, std::move(handler));
}

void RouteGroup::del(const std::string& path, Handler handler) const {
    router_.add_route("DELETE", prefix_ + path, std::move(handler));
}

std::vector<Router::Segment> Router::compile(std::string_view pattern) {
    std::vector<Segment> out;
    while (auto seg = next_segment(pattern)) {
        if (seg->front() == ':') {
            out.push_back({std::string(seg->substr(1)), true});
        } else {
            out.push_back({std::string(*seg), false});
        }
    }
    return out;
}

bool Router::bind(const std::vector<Segment>& pattern, std::string_view path,
                  std::unordered_map<std::string, std::string>& params) {
    for (const auto& expected : pattern) {
        auto seg = next_segment(path);
        if (!seg) return false;

        if (expected.capture) {
            params[expected.text] = util::url_decode(*seg);
        } else if (expected.text != *seg) {
            return false;
        }
    }
    return !next_segment(path).has_value();
}

void Router::add_route(const std::string& method, const std::string& path, Handler handler) {
    by_method_[method].push_back({compile(path), std::move(handler)});
}

std::optional<RouteMatch> Router::match(std::string_view method, std::string_view path) const {
    auto table = by_method_.find(std::string(method));
    if (table == by_method_.end()) {
        return std::nullopt;
    }

    path = path.substr(0, path.find('?'));

    for (const auto& route : table->second) {
        std::unordered_map<std::string, std::string> params;
        if (bind(route.pattern, path, params)) {
            return RouteMatch{route.handler, std::move(params)};
        }
    }
    return std::nullopt;
}

} // namespace tasklist
