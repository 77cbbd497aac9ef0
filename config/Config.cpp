#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace Unclutter {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_verify_tls"] = http_verify_tls;
    data["char_threshold"] = char_threshold;
    data["log_level"] = log_level;
    data["log_to_file"] = log_to_file;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    f.close();

    const Config defaults;
    http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
    http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
    http_verify_tls = data.value("http_verify_tls", defaults.http_verify_tls);
    char_threshold = data.value("char_threshold", defaults.char_threshold);
    log_level = data.value("log_level", defaults.log_level);
    log_to_file = data.value("log_to_file", defaults.log_to_file);

    if (http_timeout_ms < 0) {
        throw std::runtime_error("http_timeout_ms must not be negative");
    }
    if (http_max_redirects < 0) {
        throw std::runtime_error("http_max_redirects must not be negative");
    }

    // Write back missing keys so an existing config.json picks up new options.
    // Unknown keys are preserved.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        try {
            std::filesystem::path p(path);
            std::filesystem::path bak = p;
            bak += ".bak";
            std::error_code ec;
            std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
            }

            std::ofstream o(path, std::ios::trunc);
            o << std::setw(4) << data << std::endl;
        } catch (const std::exception& e) {
            // Startup continues with the values already loaded.
            Logger::Log(LogLevel::Warn, "Could not update " + path + ": " + e.what());
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not create config file: " + path_str);
    }
    o << std::setw(4) << Config().ToJson() << std::endl;
}

}
