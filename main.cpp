#include <tasklist/app.h>
#include <tasklist/config.h>
#include <tasklist/environment.h>
#include <tasklist/exceptions.h>
#include <tasklist/logger.h>
#include <tasklist/memory_store.h>
#include <tasklist/pg_pool.h>
#include <tasklist/pg_todo_store.h>
#include <tasklist/todo_controller.h>
#include <tasklist/todo_service.h>
#include <boost/system/system_error.hpp>
#include <iostream>

using namespace tasklist;

namespace {

    Async<void> open_database(std::shared_ptr<PgPool> pool, std::shared_ptr<PgTodoStore> store) {
        co_await pool->connect();
        co_await store->migrate();
    }

    int run() {
        load_env();
        const ServiceConfig config = load_config();

        App app(AppConfig{config.max_body_size, 30, config.log_path});
        auto& logger = Logger::instance();
        logger.set_level(config.log_level);

        std::shared_ptr<TodoStore> store;
        if (config.backend == StoreBackend::Memory) {
            logger.warn("Using in-memory store; data is lost on exit");
            store = std::make_shared<MemoryTodoStore>();
        } else {
            auto pool = std::make_shared<Postgres>(app.engine(), config.database_url, config.db_pool_size);
            auto pg_store = std::make_shared<PgTodoStore>(pool);

            app.run_startup(open_database(pool, pg_store));
            logger.info("Database connected successfully");
            store = pg_store;
        }

        auto service = std::make_shared<TodoService>(store);
        TodoController controller(service);
        controller.register_routes(app.group("/api/v1"));

        app.listen(config.port, config.num_threads);
        logger.flush();
        return 0;
    }

}

int main() {
    try {
        return run();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
    } catch (const StoreError& e) {
        Logger::instance().error(std::string("Database startup failed: ") + e.what());
        Logger::instance().flush();
    } catch (const boost::system::system_error& e) {
        Logger::instance().error(std::string("Server startup failed: ") + e.what());
        Logger::instance().flush();
    }
    return 1;
}
