#include <tasklist/todo_controller.h>

namespace tasklist {

int status_for(const FailureKind kind) {
    switch (kind) {
        case FailureKind::NotFound: return 404;
        case FailureKind::Validation:
        case FailureKind::Internal: return 500;
    }
    return 500;
}

void send_success(Response& res, boost::json::value data, const std::string& message) {
    res.status(200).json(boost::json::object{
        {"success", true},
        {"data", std::move(data)},
        {"message", message}
    });
}

void send_failure(Response& res, const Failure& failure) {
    const int status = status_for(failure.kind);
    if (failure.kind == FailureKind::NotFound) {
        res.status(status).json(boost::json::object{
            {"success", false},
            {"message", failure.message}
        });
        return;
    }
    res.status(status).json(boost::json::object{
        {"success", false},
        {"error", failure.message},
        {"message", "Server Error"}
    });
}

TodoController::TodoController(std::shared_ptr<TodoService> service)
    : service_(std::move(service)) {}

void TodoController::register_routes(const RouteGroup& routes) const {
    auto service = service_;

    routes.post("/createTodos", [service](Request& req, Response& res) {
        return create(*service, req, res);
    });
    routes.get("/getTodos", [service](Request& req, Response& res) {
        return list(*service, req, res);
    });
    routes.get("/getTodo/:id", [service](Request& req, Response& res) {
        return get(*service, req, res);
    });
    routes.put("/updateTodo/:id", [service](Request& req, Response& res) {
        return update(*service, req, res);
    });
    routes.del("/deleteTodo/:id", [service](Request& req, Response& res) {
        return remove(*service, req, res);
    });
}

Async<void> TodoController::create(TodoService& service, Request& req, Response& res) {
    const auto fields = req.json<TodoFields>();
    auto result = co_await service.create(fields);
    if (!result) {
        send_failure(res, result.error());
        co_return;
    }
    send_success(res, boost::json::value_from(result.value()), "Entry created successfully");
}

Async<void> TodoController::list(TodoService& service, Request&, Response& res) {
    auto result = co_await service.list_all();
    if (!result) {
        send_failure(res, result.error());
        co_return;
    }
    send_success(res, boost::json::value_from(result.value()), "entire Todo data");
}

Async<void> TodoController::get(TodoService& service, Request& req, Response& res) {
    const std::string id = req.param("id");
    auto result = co_await service.get_by_id(id);
    if (!result) {
        send_failure(res, result.error());
        co_return;
    }
    send_success(res, boost::json::value_from(result.value()), "Todo " + id + " data fetched successfully");
}

Async<void> TodoController::update(TodoService& service, Request& req, Response& res) {
    const std::string id = req.param("id");
    const auto fields = req.json<TodoFields>();
    auto result = co_await service.update(id, fields);
    if (!result) {
        send_failure(res, result.error());
        co_return;
    }
    send_success(res, boost::json::value_from(result.value()), "Updated successfully");
}

Async<void> TodoController::remove(TodoService& service, Request& req, Response& res) {
    const std::string id = req.param("id");
    auto result = co_await service.delete_by_id(id);
    if (!result) {
        send_failure(res, result.error());
        co_return;
    }
    res.status(200).json(boost::json::object{
        {"success", true},
        {"message", "todo deleted"}
    });
}

} // namespace tasklist
