#include <curl/curl.h>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "core/ReadabilityPipeline.hpp"
#include "network/CurlTransport.hpp"
#include "utils/BodyStreams.hpp"
#include "utils/Logger.hpp"

namespace {

struct CliOptions {
    std::string config_path;
    std::string target;
    std::string base_url = "http://localhost/";
    long timeout_ms = -1;
    bool check_only = false;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config PATH] [--timeout MS] [--base-url URL] [--check] URL|-\n"
              << "  URL         page to fetch and extract\n"
              << "  -           read HTML from stdin instead\n"
              << "  --base-url  URL used to resolve links when reading stdin\n"
              << "  --check     with -, only report whether the HTML looks readable\n";
}

bool ParseArgs(int argc, char* argv[], CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& value) {
            if (i + 1 >= argc) return false;
            value = argv[++i];
            return true;
        };
        if (arg == "--check") {
            out.check_only = true;
        } else if (arg == "--config") {
            if (!next_value(out.config_path)) return false;
        } else if (arg == "--base-url") {
            if (!next_value(out.base_url)) return false;
        } else if (arg == "--timeout") {
            std::string value;
            if (!next_value(value)) return false;
            try {
                out.timeout_ms = std::stol(value);
            } catch (const std::exception&) {
                return false;
            }
            if (out.timeout_ms < 0) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (out.target.empty() && (arg == "-" || arg.rfind("--", 0) != 0)) {
            out.target = arg;
        } else {
            return false;
        }
    }
    // The readability check works on raw HTML, so it only applies to stdin.
    if (out.check_only && out.target != "-") return false;
    return !out.target.empty();
}

nlohmann::json ArticleToJson(const Unclutter::Article& article) {
    nlohmann::json data;
    data["title"] = article.title;
    data["byline"] = article.byline;
    data["excerpt"] = article.excerpt;
    data["site_name"] = article.site_name;
    data["image"] = article.image;
    data["language"] = article.language;
    data["length"] = article.length;
    data["content"] = article.content;
    data["text_content"] = article.text_content;
    return data;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (argc == 0 || argv[0] == nullptr || !ParseArgs(argc, argv, cli)) {
        PrintUsage(argc > 0 && argv[0] ? argv[0] : "unclutter");
        return 2;
    }

    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    if (cli.config_path.empty()) {
        cli.config_path = (exe_dir / "config" / "config.json").string();
    }

    // Load Config
    auto& config = Unclutter::Config::GetInstance();
    try {
        config.Load(cli.config_path);
        Unclutter::Logger::Log(Unclutter::LogLevel::Debug, "Configuration loaded from: " + cli.config_path);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            Unclutter::Logger::Log(Unclutter::LogLevel::Error, "Failed to load config: " + error_message);
            return 1;
        }
        Unclutter::Logger::Log(Unclutter::LogLevel::Info, "config.json not found. Creating a default one at: " + cli.config_path);
        try {
            config.CreateDefault(cli.config_path);
        } catch (const std::exception& create_e) {
            Unclutter::Logger::Log(Unclutter::LogLevel::Warn, "Failed to create default config: " + std::string(create_e.what()));
        }
    } catch (const nlohmann::json::exception& e) {
        Unclutter::Logger::Log(Unclutter::LogLevel::Error, "Malformed config " + cli.config_path + ": " + e.what());
        return 1;
    }

    Unclutter::Logger::SetMinLevel(Unclutter::Logger::FromString(config.log_level));
    if (config.log_to_file) {
        const std::filesystem::path log_dir = exe_dir / "logs";
        if (std::error_code ec = Unclutter::Logger::EnableFileOutput(log_dir)) {
            Unclutter::Logger::Log(Unclutter::LogLevel::Warn,
                                   "Cannot create log directory " + log_dir.string() + ": " + ec.message());
        }
    }

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    Unclutter::CurlTransport::Options transport_options;
    transport_options.max_redirects = config.http_max_redirects;
    transport_options.verify_tls = config.http_verify_tls;
    Unclutter::CurlTransport transport(transport_options);

    Unclutter::ReadabilityOptions engine_options;
    engine_options.char_threshold = config.char_threshold;
    Unclutter::ReadabilityPipeline pipeline(transport, Unclutter::ReadabilityPipeline::DefaultEngineFactory(engine_options));

    const std::chrono::milliseconds timeout(cli.timeout_ms >= 0 ? cli.timeout_ms : config.http_timeout_ms);
    int exit_code = 0;

    if (cli.target == "-") {
        Unclutter::IstreamBodyStream input(std::cin);
        if (cli.check_only) {
            std::cout << (pipeline.CheckStream(input) ? "true" : "false") << std::endl;
        } else {
            auto base = Unclutter::UrlUtil::ParseRequestUrl(cli.base_url);
            if (!base) {
                Unclutter::Logger::Log(Unclutter::LogLevel::Error, "Invalid --base-url: " + cli.base_url);
                curl_global_cleanup();
                return 2;
            }
            auto result = pipeline.AcquireFromStream(input, *base);
            if (result.ok()) {
                std::cout << std::setw(2) << ArticleToJson(*result.article) << std::endl;
            } else {
                std::cerr << result.error.Describe() << std::endl;
                exit_code = 1;
            }
        }
    } else {
        auto result = pipeline.AcquireFromUrl(cli.target, timeout);
        if (!result.ok()) {
            std::cerr << result.error.Describe() << std::endl;
            exit_code = 1;
        } else {
            std::cout << std::setw(2) << ArticleToJson(*result.article) << std::endl;
        }
    }

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}
