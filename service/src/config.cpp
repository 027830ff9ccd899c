#include <tasklist/config.h>
#include <tasklist/environment.h>
#include <tasklist/exceptions.h>
#include <tasklist/util/string.h>

namespace tasklist {

StoreBackend parse_store_backend(const std::string& name) {
    const std::string lowered = util::to_lower(name);
    if (lowered == "postgres" || lowered == "postgresql") return StoreBackend::Postgres;
    if (lowered == "memory") return StoreBackend::Memory;
    throw ConfigError("Unknown STORE_BACKEND: " + name);
}

ServiceConfig load_config() {
    ServiceConfig config;

    config.port = env<int>("PORT", config.port);
    if (config.port <= 0 || config.port > 65535) {
        throw ConfigError("PORT out of range: " + std::to_string(config.port));
    }

    config.num_threads = env<int>("NUM_THREADS", config.num_threads);
    if (config.num_threads <= 0) {
        throw ConfigError("NUM_THREADS must be positive");
    }

    config.backend = parse_store_backend(env<std::string>("STORE_BACKEND", std::string("postgres")));
    if (config.backend == StoreBackend::Postgres) {
        config.database_url = env<std::string>("DATABASE_URL");
        config.db_pool_size = env<int>("DB_POOL_SIZE", config.db_pool_size);
        if (config.db_pool_size <= 0) {
            throw ConfigError("DB_POOL_SIZE must be positive");
        }
    }

    config.log_path = env<std::string>("LOG_PATH", config.log_path);
    config.log_level = parse_log_level(env<std::string>("LOG_LEVEL", std::string("info")));

    config.max_body_size = env<std::size_t>("MAX_BODY_SIZE", config.max_body_size);

    return config;
}

} // namespace tasklist
