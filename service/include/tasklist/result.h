#ifndef TASKLIST_RESULT_H
#define TASKLIST_RESULT_H

#include <string>
#include <utility>
#include <variant>

namespace tasklist {

enum class FailureKind {
    Validation,
    NotFound,
    Internal
};

struct Failure {
    FailureKind kind;
    std::string message;
};

// Payload of a successful delete
struct Deleted {};

/**
 * @brief Outcome of a service operation: a payload or a tagged Failure.
 */
template<typename T>
class Result {
public:
    static Result success(T value) { return Result(std::move(value)); }

    static Result failure(FailureKind kind, std::string message) {
        return Result(Failure{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }

    const Failure& error() const { return std::get<Failure>(state_); }

private:
    explicit Result(T value) : state_(std::move(value)) {}
    explicit Result(Failure failure) : state_(std::move(failure)) {}

    std::variant<T, Failure> state_;
};

} // namespace tasklist

#endif
