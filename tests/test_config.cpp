#include <catch2/catch_test_macros.hpp>
#include <tasklist/config.h>
#include <tasklist/exceptions.h>
#include <cstdlib>

using namespace tasklist;

namespace {
    const char* const kVars[] = {
        "PORT", "NUM_THREADS", "STORE_BACKEND", "DATABASE_URL", "DB_POOL_SIZE",
        "LOG_PATH", "LOG_LEVEL", "MAX_BODY_SIZE"
    };

    void clear_config_env() {
        for (const char* name : kVars) {
            unsetenv(name);
        }
    }
}

TEST_CASE("Config: Defaults", "[config]") {
    clear_config_env();

    SECTION("Postgres backend requires DATABASE_URL") {
        CHECK_THROWS_AS(load_config(), ConfigError);
    }

    SECTION("Defaults with a database URL") {
        setenv("DATABASE_URL", "postgresql://localhost/todos", 1);
        ServiceConfig config = load_config();

        CHECK(config.port == 4000);
        CHECK(config.num_threads == 4);
        CHECK(config.backend == StoreBackend::Postgres);
        CHECK(config.database_url == "postgresql://localhost/todos");
        CHECK(config.db_pool_size == 10);
        CHECK(config.log_path == "stdout");
        CHECK(config.log_level == LogLevel::INFO);
        CHECK(config.max_body_size == 1024 * 1024);
    }

    SECTION("Memory backend needs no database") {
        setenv("STORE_BACKEND", "memory", 1);
        ServiceConfig config = load_config();
        CHECK(config.backend == StoreBackend::Memory);
        CHECK(config.database_url.empty());
    }

    clear_config_env();
}

TEST_CASE("Config: Overrides and Validation", "[config]") {
    clear_config_env();
    setenv("STORE_BACKEND", "memory", 1);

    SECTION("Overrides are applied") {
        setenv("PORT", "8081", 1);
        setenv("NUM_THREADS", "2", 1);
        setenv("LOG_LEVEL", "DEBUG", 1);
        setenv("LOG_PATH", "/tmp/tasklist.log", 1);
        setenv("MAX_BODY_SIZE", "2048", 1);

        ServiceConfig config = load_config();
        CHECK(config.port == 8081);
        CHECK(config.num_threads == 2);
        CHECK(config.log_level == LogLevel::DEBUG);
        CHECK(config.log_path == "/tmp/tasklist.log");
        CHECK(config.max_body_size == 2048);
    }

    SECTION("Out of range port") {
        setenv("PORT", "70000", 1);
        CHECK_THROWS_AS(load_config(), ConfigError);
    }

    SECTION("Non-numeric port") {
        setenv("PORT", "http", 1);
        CHECK_THROWS_AS(load_config(), ConfigError);
    }

    SECTION("Zero threads") {
        setenv("NUM_THREADS", "0", 1);
        CHECK_THROWS_AS(load_config(), ConfigError);
    }

    SECTION("Unknown log level") {
        setenv("LOG_LEVEL", "verbose", 1);
        CHECK_THROWS_AS(load_config(), ConfigError);
    }

    SECTION("Unknown backend") {
        setenv("STORE_BACKEND", "mongodb", 1);
        CHECK_THROWS_AS(load_config(), ConfigError);
    }

    clear_config_env();
}

TEST_CASE("Config: Backend Names", "[config]") {
    CHECK(parse_store_backend("postgres") == StoreBackend::Postgres);
    CHECK(parse_store_backend("PostgreSQL") == StoreBackend::Postgres);
    CHECK(parse_store_backend("Memory") == StoreBackend::Memory);
    CHECK_THROWS_AS(parse_store_backend(""), ConfigError);
}
