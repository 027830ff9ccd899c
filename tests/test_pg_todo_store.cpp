#include <catch2/catch_test_macros.hpp>
#include <tasklist/database.h>
#include <tasklist/db_result.h>
#include <tasklist/exceptions.h>
#include <tasklist/pg_todo_store.h>
#include <map>
#include "test_helpers.h"

using namespace tasklist;
using tasklist::testing::FakeClock;
using tasklist::testing::run_sync;

// MOCK DATABASE CLASSES FOR TESTING
using MockRow = std::map<std::string, std::string, std::less<>>;

class MockResult : public ResultImpl {
public:
    MockResult(std::vector<MockRow> rows, int64_t affected) : rows_(std::move(rows)), affected_(affected) {}

    size_t row_count() const override { return rows_.size(); }

    std::optional<std::string_view> value(size_t row, std::string_view column) const override {
        const auto& cells = rows_.at(row);
        auto it = cells.find(column);
        if (it == cells.end()) throw StoreError("no column " + std::string(column));
        return std::string_view(it->second);
    }

    int64_t affected_rows() const override { return affected_; }

private:
    std::vector<MockRow> rows_;
    int64_t affected_;
};

// Records every query and answers with the canned rows
class SpyDatabase : public Database {
public:
    using Database::query;

    std::vector<std::string> sqls;
    std::vector<std::vector<std::string>> params;
    std::vector<MockRow> rows;
    int64_t affected = 0;
    bool fail = false;

    std::string placeholder(int index) const override { return "$" + std::to_string(index); }

    Async<DbResult> query(const std::string& sql, const std::vector<std::string>& p = {}) override {
        sqls.push_back(sql);
        params.push_back(p);
        if (fail) {
            throw StoreError("server closed the connection unexpectedly");
        }
        co_return DbResult(std::make_shared<MockResult>(rows, affected));
    }
};

namespace {
    const std::string kId = "0b9c1d52-6c3a-4f7e-9a41-2f5d8e7c6b10";

    MockRow todo_row(const std::string& title = "Buy groceries") {
        return {
            {"id", kId},
            {"title", title},
            {"description", "Milk, eggs, bread"},
            {"created_at_ms", "1700000000000"},
            {"updated_at_ms", "1700000000500"}
        };
    }
}

TEST_CASE("PgTodoStore: UUID Recognition", "[pg]") {
    CHECK(PgTodoStore::is_uuid(kId));
    CHECK(PgTodoStore::is_uuid("0B9C1D52-6C3A-4F7E-9A41-2F5D8E7C6B10"));
    CHECK_FALSE(PgTodoStore::is_uuid(""));
    CHECK_FALSE(PgTodoStore::is_uuid("123"));
    CHECK_FALSE(PgTodoStore::is_uuid("0b9c1d52x6c3a-4f7e-9a41-2f5d8e7c6b10"));
    CHECK_FALSE(PgTodoStore::is_uuid("0b9c1d52-6c3a-4f7e-9a41-2f5d8e7c6b1g"));
}

TEST_CASE("PgTodoStore: Migration", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    PgTodoStore store(db);

    run_sync(store.migrate());
    REQUIRE(db->sqls.size() == 1);
    CHECK(db->sqls[0].find("CREATE TABLE IF NOT EXISTS \"todos\"") != std::string::npos);
    CHECK(db->sqls[0].find("gen_random_uuid()") != std::string::npos);
}

TEST_CASE("PgTodoStore: Insert", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    FakeClock clock(1700000000000);
    PgTodoStore store(db, clock.clock());
    db->rows = {todo_row()};

    Todo todo = run_sync(store.insert(TodoFields{"Buy groceries", "Milk, eggs, bread"}));

    SECTION("Values travel as parameters, never in the SQL text") {
        REQUIRE(db->params.size() == 1);
        CHECK(db->params[0] == std::vector<std::string>{"Buy groceries", "Milk, eggs, bread", "1700000000000"});
        CHECK(db->sqls[0].find("Buy groceries") == std::string::npos);
        CHECK(db->sqls[0].find("RETURNING") != std::string::npos);
    }

    SECTION("Returned row is mapped") {
        CHECK(todo.id == kId);
        CHECK(todo.title == "Buy groceries");
        CHECK(util::to_epoch_ms(todo.created_at) == 1700000000000);
        CHECK(util::to_epoch_ms(todo.updated_at) == 1700000000500);
    }
}

TEST_CASE("PgTodoStore: Empty Insert Result Is A Store Error", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    PgTodoStore store(db);
    CHECK_THROWS_AS(run_sync(store.insert(TodoFields{"a", "b"})), StoreError);
}

TEST_CASE("PgTodoStore: Lookups", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    PgTodoStore store(db);

    SECTION("find_all maps every row") {
        db->rows = {todo_row("one"), todo_row("two")};
        auto all = run_sync(store.find_all());
        REQUIRE(all.size() == 2);
        CHECK(all[0].title == "one");
        CHECK(all[1].title == "two");
        CHECK(db->sqls[0].find("ORDER BY") != std::string::npos);
    }

    SECTION("find_by_id binds the id") {
        db->rows = {todo_row()};
        auto found = run_sync(store.find_by_id(kId));
        REQUIRE(found.has_value());
        CHECK(db->params[0] == std::vector<std::string>{kId});
        CHECK(db->sqls[0].find("$1::uuid") != std::string::npos);
    }

    SECTION("No row means not found") {
        CHECK_FALSE(run_sync(store.find_by_id(kId)).has_value());
    }

    SECTION("Malformed ids are not found without a query") {
        CHECK_FALSE(run_sync(store.find_by_id("not-a-uuid")).has_value());
        CHECK_FALSE(run_sync(store.update_by_id("42", TodoFields{"a", "b"}, system_now())).has_value());
        CHECK_FALSE(run_sync(store.delete_by_id("'; DROP TABLE todos; --")));
        CHECK(db->sqls.empty());
    }
}

TEST_CASE("PgTodoStore: Update", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    PgTodoStore store(db);
    db->rows = {todo_row("Updated title")};
    const Timestamp now = util::from_epoch_ms(1700000009000);

    SECTION("Both fields") {
        auto updated = run_sync(store.update_by_id(kId, TodoFields{"Updated title", "Updated description"}, now));
        REQUIRE(updated.has_value());
        CHECK(updated->title == "Updated title");

        const std::string& sql = db->sqls[0];
        CHECK(sql.find("\"title\" = $1") != std::string::npos);
        CHECK(sql.find("\"description\" = $2") != std::string::npos);
        CHECK(sql.find("GREATEST(") != std::string::npos);
        CHECK(sql.find("\"id\" = $4::uuid") != std::string::npos);
        CHECK(db->params[0] == std::vector<std::string>{"Updated title", "Updated description", "1700000009000", kId});
    }

    SECTION("Only present fields are written") {
        run_sync(store.update_by_id(kId, TodoFields{std::nullopt, "d"}, now));
        const std::string& sql = db->sqls[0];
        CHECK(sql.find("\"title\" =") == std::string::npos);
        CHECK(sql.find("\"description\" = $1") != std::string::npos);
        CHECK(db->params[0] == std::vector<std::string>{"d", "1700000009000", kId});
    }

    SECTION("No fields only advances updated_at") {
        run_sync(store.update_by_id(kId, TodoFields{}, now));
        const std::string& sql = db->sqls[0];
        CHECK(sql.find("\"title\" =") == std::string::npos);
        CHECK(sql.find("\"description\" =") == std::string::npos);
        CHECK(sql.find("\"updated_at\" = GREATEST(") != std::string::npos);
        CHECK(sql.find("$1::bigint") != std::string::npos);
        CHECK(db->params[0] == std::vector<std::string>{"1700000009000", kId});
    }

    SECTION("No matching row") {
        db->rows.clear();
        CHECK_FALSE(run_sync(store.update_by_id(kId, TodoFields{"a", "b"}, now)).has_value());
    }
}

TEST_CASE("PgTodoStore: Delete", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    PgTodoStore store(db);

    db->affected = 1;
    CHECK(run_sync(store.delete_by_id(kId)) == true);

    db->affected = 0;
    CHECK(run_sync(store.delete_by_id(kId)) == false);
}

TEST_CASE("PgTodoStore: Driver Errors Propagate", "[pg]") {
    auto db = std::make_shared<SpyDatabase>();
    db->fail = true;
    PgTodoStore store(db);

    CHECK_THROWS_AS(run_sync(store.find_all()), StoreError);
    CHECK_THROWS_AS(run_sync(store.find_by_id(kId)), StoreError);
    CHECK_THROWS_AS(run_sync(store.delete_by_id(kId)), StoreError);
}

TEST_CASE("DbResult: Row Access", "[pg]") {
    auto rows = std::vector<MockRow>{{{"n", "42"}, {"word", "abc"}}};
    DbResult res(std::make_shared<MockResult>(rows, 0));

    REQUIRE(res.size() == 1);
    CHECK(res[0]["n"].as<std::int64_t>() == 42);
    CHECK(res[0]["word"].as<std::string>() == "abc");

    SECTION("Text that is not a number is a store error") {
        CHECK_THROWS_AS(res[0]["word"].as<std::int64_t>(), StoreError);
    }

    SECTION("Reading past the last row is a store error") {
        CHECK_THROWS_AS(res[1], StoreError);
        CHECK_THROWS_AS(DbResult{}[0], StoreError);
        CHECK(DbResult{}.empty());
    }
}
