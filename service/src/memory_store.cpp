#include <tasklist/memory_store.h>
#include <algorithm>
#include <boost/uuid/uuid_io.hpp>

namespace tasklist {

MemoryTodoStore::MemoryTodoStore(Clock clock) : clock_(std::move(clock)) {}

std::vector<Todo>::iterator MemoryTodoStore::locate(const std::string& id) {
    return std::find_if(todos_.begin(), todos_.end(),
        [&](const Todo& t) { return t.id == id; });
}

Async<Todo> MemoryTodoStore::insert(const TodoFields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    Todo todo;
    todo.id = boost::uuids::to_string(uuid_gen_());
    todo.title = fields.title.value_or("");
    todo.description = fields.description.value_or("");
    todo.created_at = clock_();
    todo.updated_at = todo.created_at;

    todos_.push_back(todo);
    co_return todo;
}

Async<std::vector<Todo>> MemoryTodoStore::find_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    co_return todos_;
}

Async<std::optional<Todo>> MemoryTodoStore::find_by_id(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locate(id);
    if (it == todos_.end()) {
        co_return std::nullopt;
    }
    co_return *it;
}

Async<std::optional<Todo>> MemoryTodoStore::update_by_id(const std::string& id,
                                                         const TodoFields& fields,
                                                         Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locate(id);
    if (it == todos_.end()) {
        co_return std::nullopt;
    }

    if (fields.title) it->title = *fields.title;
    if (fields.description) it->description = *fields.description;
    it->updated_at = std::max(now, it->updated_at + std::chrono::milliseconds(1));

    co_return *it;
}

Async<bool> MemoryTodoStore::delete_by_id(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locate(id);
    if (it == todos_.end()) {
        co_return false;
    }
    todos_.erase(it);
    co_return true;
}

std::size_t MemoryTodoStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return todos_.size();
}

} // namespace tasklist
