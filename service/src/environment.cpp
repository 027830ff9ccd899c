#include "tasklist/environment.h"
#include <fstream>
#include <utility>

namespace tasklist {

    namespace {

        // KEY=VALUE, optionally prefixed by "export " and with the value in matching quotes
        std::optional<std::pair<std::string, std::string>> parse_assignment(std::string_view line) {
            std::string text = util::trim(line);
            if (text.empty() || text.front() == '#') {
                return std::nullopt;
            }

            constexpr std::string_view kExport = "export ";
            if (text.starts_with(kExport)) {
                text = util::trim(std::string_view(text).substr(kExport.size()));
            }

            const auto eq = text.find('=');
            if (eq == std::string::npos) {
                return std::nullopt;
            }

            std::string key = util::trim(std::string_view(text).substr(0, eq));
            std::string value = util::trim(std::string_view(text).substr(eq + 1));
            if (key.empty()) {
                return std::nullopt;
            }

            const bool quoted = value.size() >= 2 && value.front() == value.back() &&
                                (value.front() == '"' || value.front() == '\'');
            if (quoted) {
                value = value.substr(1, value.size() - 2);
            }
            return std::make_pair(std::move(key), std::move(value));
        }

    }

    bool load_env(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            return false;
        }

        for (std::string line; std::getline(file, line);) {
            if (auto kv = parse_assignment(line)) {
                // overwrite = 0: the process environment wins
                setenv(kv->first.c_str(), kv->second.c_str(), 0);
            }
        }
        return true;
    }
}
