#include <tasklist/todo_service.h>
#include <tasklist/exceptions.h>
#include <tasklist/logger.h>

namespace tasklist {

namespace {

    template<typename T>
    Result<T> internal_failure(const std::string& operation, const StoreError& e) {
        Logger::instance().error(operation + " failed: " + e.what());
        return Result<T>::failure(FailureKind::Internal, e.what());
    }

    template<typename T>
    Result<T> not_found(const std::string& operation, const std::string& id) {
        Logger::instance().debug(operation + ": no todo with id " + id);
        return Result<T>::failure(FailureKind::NotFound, kNotFoundMessage);
    }

}

TodoService::TodoService(std::shared_ptr<TodoStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

Async<Result<Todo>> TodoService::create(const TodoFields& fields) {
    if (auto invalid = validate(fields)) {
        Logger::instance().debug("create rejected: " + invalid->message);
        co_return Result<Todo>::failure(FailureKind::Validation, invalid->message);
    }

    try {
        Todo todo = co_await store_->insert(fields);
        co_return Result<Todo>::success(std::move(todo));
    } catch (const StoreError& e) {
        co_return internal_failure<Todo>("create", e);
    }
}

Async<Result<std::vector<Todo>>> TodoService::list_all() {
    try {
        auto todos = co_await store_->find_all();
        co_return Result<std::vector<Todo>>::success(std::move(todos));
    } catch (const StoreError& e) {
        co_return internal_failure<std::vector<Todo>>("list", e);
    }
}

Async<Result<Todo>> TodoService::get_by_id(const std::string& id) {
    try {
        auto todo = co_await store_->find_by_id(id);
        if (!todo) {
            co_return not_found<Todo>("get", id);
        }
        co_return Result<Todo>::success(std::move(*todo));
    } catch (const StoreError& e) {
        co_return internal_failure<Todo>("get", e);
    }
}

Async<Result<Todo>> TodoService::update(const std::string& id, const TodoFields& fields) {
    try {
        auto todo = co_await store_->update_by_id(id, fields, clock_());
        if (!todo) {
            co_return not_found<Todo>("update", id);
        }
        co_return Result<Todo>::success(std::move(*todo));
    } catch (const StoreError& e) {
        co_return internal_failure<Todo>("update", e);
    }
}

Async<Result<Deleted>> TodoService::delete_by_id(const std::string& id) {
    try {
        const bool removed = co_await store_->delete_by_id(id);
        if (!removed) {
            co_return not_found<Deleted>("delete", id);
        }
        co_return Result<Deleted>::success(Deleted{});
    } catch (const StoreError& e) {
        co_return internal_failure<Deleted>("delete", e);
    }
}

} // namespace tasklist
