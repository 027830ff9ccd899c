#ifndef TASKLIST_EXCEPTIONS_H
#define TASKLIST_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace tasklist {

/**
 * @brief Base class for errors raised at the HTTP boundary.
 * Caught by App::handle_request and turned into an envelope with the given status.
 */
class HttpError : public std::runtime_error {
    int status_code_;
public:
    HttpError(int status, const std::string& msg)
        : std::runtime_error(msg), status_code_(status) {}

    int status() const { return status_code_; }
};

/** @brief 400 Bad Request */
class BadRequest : public HttpError {
public:
    BadRequest(const std::string& msg = "Bad Request") : HttpError(400, msg) {}
};

/**
 * @brief The persistence layer failed (connectivity, timeout, constraint violation).
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief A configuration value is missing or malformed. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tasklist

#endif
