#ifndef TASKLIST_ROUTER_H
#define TASKLIST_ROUTER_H

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <optional>
#include <unordered_map>
#include <tasklist/async.h>
#include <tasklist/request.h>
#include <tasklist/response.h>

namespace tasklist {

using Handler = std::function<Async<void>(Request&, Response&)>;

struct RouteMatch {
    Handler handler;
    std::unordered_map<std::string, std::string> params;  // e.g. {"id": "42"}
};

class Router;

/**
 * @brief Registers routes under a common path prefix.
 */
class RouteGroup {
private:
    Router& router_;
    std::string prefix_;

public:
    RouteGroup(Router& router, std::string prefix);

    void get(const std::string& path, Handler handler) const;
    void post(const std::string& path, Handler handler) const;
    void put(const std::string& path, Handler handler) const;
    void del(const std::string& path, Handler handler) const;
};

/**
 * @brief Per-method table of compiled path patterns.
 *
 * A pattern segment written ":name" captures the URL-decoded request
 * segment. Empty segments are ignored on both sides, so "/a//b/" and
 * "/a/b" are the same path. Within one method the earliest registration
 * that matches wins.
 */
class Router {
private:
    struct Segment {
        std::string text;   // literal, or the capture name without ':'
        bool capture = false;
    };

    struct Route {
        std::vector<Segment> pattern;
        Handler handler;
    };

    std::unordered_map<std::string, std::vector<Route>> by_method_;

    static std::vector<Segment> compile(std::string_view pattern);
    static bool bind(const std::vector<Segment>& pattern, std::string_view path,
                     std::unordered_map<std::string, std::string>& params);

public:
    void add_route(const std::string& method, const std::string& path, Handler handler);

    [[nodiscard]] std::optional<RouteMatch> match(std::string_view method, std::string_view path) const;
};

} // namespace tasklist

#endif
