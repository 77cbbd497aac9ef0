#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Unclutter {
    struct Config {
        long http_timeout_ms = 30000;
        long http_max_redirects = 10;
        bool http_verify_tls = true;
        size_t char_threshold = 500;
        std::string log_level = "info";
        bool log_to_file = false;

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        // Throws std::runtime_error when the file cannot be opened and
        // nlohmann::json::exception when it is not valid JSON.
        void Load(const std::string& path);
        void CreateDefault(const std::string& path);

        nlohmann::json ToJson() const;
    };
}
