#ifndef TASKLIST_CONFIG_H
#define TASKLIST_CONFIG_H

#include <cstddef>
#include <string>
#include <tasklist/logger.h>

namespace tasklist {

enum class StoreBackend {
    Postgres,
    Memory
};

struct ServiceConfig {
    int port = 4000;
    int num_threads = 4;
    StoreBackend backend = StoreBackend::Postgres;
    std::string database_url;                 // required for Postgres
    int db_pool_size = 10;
    std::string log_path = "stdout";
    LogLevel log_level = LogLevel::INFO;
    std::size_t max_body_size = 1024 * 1024;  // 1MB
};

/**
 * @brief Builds the service configuration from the process environment.
 *
 * Reads PORT, NUM_THREADS, STORE_BACKEND, DATABASE_URL, DB_POOL_SIZE,
 * LOG_PATH, LOG_LEVEL and MAX_BODY_SIZE.
 * @throws ConfigError on missing or out-of-range values.
 */
ServiceConfig load_config();

StoreBackend parse_store_backend(const std::string& name);

} // namespace tasklist

#endif
