#include <catch2/catch_test_macros.hpp>
#include <tasklist/memory_store.h>
#include <tasklist/pg_todo_store.h>
#include "test_helpers.h"

using namespace tasklist;
using tasklist::testing::FakeClock;
using tasklist::testing::run_sync;

namespace {
    TodoFields fields(std::optional<std::string> title, std::optional<std::string> description) {
        return TodoFields{std::move(title), std::move(description)};
    }
}

TEST_CASE("MemoryStore: Insert and Lookup", "[store]") {
    FakeClock clock;
    MemoryTodoStore store(clock.clock());

    Todo a = run_sync(store.insert(fields("A", "first")));
    clock.advance(std::chrono::milliseconds(10));
    Todo b = run_sync(store.insert(fields("B", "second")));

    SECTION("Insert assigns distinct UUID ids and equal timestamps") {
        CHECK(PgTodoStore::is_uuid(a.id));
        CHECK(PgTodoStore::is_uuid(b.id));
        CHECK(a.id != b.id);
        CHECK(a.created_at == a.updated_at);
        CHECK(b.created_at == clock.now());
    }

    SECTION("find_all returns insertion order") {
        auto all = run_sync(store.find_all());
        REQUIRE(all.size() == 2);
        CHECK(all[0].id == a.id);
        CHECK(all[1].id == b.id);
    }

    SECTION("find_by_id") {
        auto found = run_sync(store.find_by_id(b.id));
        REQUIRE(found.has_value());
        CHECK(found->title == "B");

        CHECK_FALSE(run_sync(store.find_by_id("no-such-id")).has_value());
    }
}

TEST_CASE("MemoryStore: Update", "[store]") {
    FakeClock clock;
    MemoryTodoStore store(clock.clock());
    Todo todo = run_sync(store.insert(fields("A", "first")));

    SECTION("Present fields are replaced, absent ones kept") {
        clock.advance(std::chrono::seconds(1));
        auto updated = run_sync(store.update_by_id(todo.id, fields(std::nullopt, "changed"), clock.now()));
        REQUIRE(updated.has_value());
        CHECK(updated->title == "A");
        CHECK(updated->description == "changed");
        CHECK(updated->created_at == todo.created_at);
        CHECK(updated->updated_at == clock.now());
    }

    SECTION("updated_at strictly advances even when the clock does not") {
        auto first = run_sync(store.update_by_id(todo.id, fields("x", "y"), clock.now()));
        auto second = run_sync(store.update_by_id(todo.id, fields("x", "y"), clock.now()));
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(first->updated_at > todo.updated_at);
        CHECK(second->updated_at > first->updated_at);
    }

    SECTION("Unknown id") {
        CHECK_FALSE(run_sync(store.update_by_id("missing", fields("x", "y"), clock.now())).has_value());
        CHECK(run_sync(store.find_by_id(todo.id))->title == "A");
    }
}

TEST_CASE("MemoryStore: Delete", "[store]") {
    MemoryTodoStore store;
    Todo todo = run_sync(store.insert(fields("A", "first")));

    CHECK(run_sync(store.delete_by_id(todo.id)) == true);
    CHECK(store.size() == 0);
    CHECK(run_sync(store.delete_by_id(todo.id)) == false);
    CHECK_FALSE(run_sync(store.find_by_id(todo.id)).has_value());
}
