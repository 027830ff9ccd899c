#pragma once

#include <string>
#include <optional>
#include <cstdlib>
#include <tasklist/exceptions.h>
#include <tasklist/util/string.h>

namespace tasklist {

    /**
     * @brief Loads KEY=VALUE lines from a dotenv file into the process environment.
     * Variables that are already set keep their value.
     * @return false if the file could not be opened.
     */
    bool load_env(const std::string& path = ".env");

    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr || *val == '\0') {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw ConfigError("Missing environment variable: " + key);
        }

        try {
            return util::convert_string<T>(val);
        } catch (const ConfigError& e) {
            throw ConfigError(key + ": " + e.what());
        }
    }
}
