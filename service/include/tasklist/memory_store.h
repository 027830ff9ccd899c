#ifndef TASKLIST_MEMORY_STORE_H
#define TASKLIST_MEMORY_STORE_H

#include <mutex>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include <tasklist/todo_store.h>

namespace tasklist {

/**
 * @brief Process-local TodoStore.
 *
 * Records live in insertion order behind a mutex. Ids are random UUIDs.
 * Used by the test suite and by STORE_BACKEND=memory.
 */
class MemoryTodoStore : public TodoStore {
public:
    explicit MemoryTodoStore(Clock clock = system_now);

    Async<Todo> insert(const TodoFields& fields) override;
    Async<std::vector<Todo>> find_all() override;
    Async<std::optional<Todo>> find_by_id(const std::string& id) override;
    Async<std::optional<Todo>> update_by_id(const std::string& id,
                                            const TodoFields& fields,
                                            Timestamp now) override;
    Async<bool> delete_by_id(const std::string& id) override;

    std::size_t size() const;

private:
    std::vector<Todo>::iterator locate(const std::string& id);

    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<Todo> todos_;
    boost::uuids::random_generator uuid_gen_;
};

} // namespace tasklist

#endif
