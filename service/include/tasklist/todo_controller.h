#ifndef TASKLIST_TODO_CONTROLLER_H
#define TASKLIST_TODO_CONTROLLER_H

#include <memory>
#include <string>
#include <boost/json.hpp>
#include <tasklist/async.h>
#include <tasklist/result.h>
#include <tasklist/router.h>
#include <tasklist/todo_service.h>

namespace tasklist {

// 200 {success: true, data, message}
void send_success(Response& res, boost::json::value data, const std::string& message);

// 404 {success: false, message} or 500 {success: false, error, message: "Server Error"}
void send_failure(Response& res, const Failure& failure);

int status_for(FailureKind kind);

/**
 * @brief HTTP surface of TodoService.
 *
 *   POST   /createTodos
 *   GET    /getTodos
 *   GET    /getTodo/:id
 *   PUT    /updateTodo/:id
 *   DELETE /deleteTodo/:id
 */
class TodoController {
public:
    explicit TodoController(std::shared_ptr<TodoService> service);

    void register_routes(const RouteGroup& routes) const;

    static Async<void> create(TodoService& service, Request& req, Response& res);
    static Async<void> list(TodoService& service, Request& req, Response& res);
    static Async<void> get(TodoService& service, Request& req, Response& res);
    static Async<void> update(TodoService& service, Request& req, Response& res);
    static Async<void> remove(TodoService& service, Request& req, Response& res);

private:
    std::shared_ptr<TodoService> service_;
};

} // namespace tasklist

#endif
