#include <catch2/catch_all.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/Config.hpp"
#include "utils/Logger.hpp"

using namespace Unclutter;

namespace {

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() / ("unclutter_config_" + std::to_string(stamp));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string File(const std::string& name) const { return (path / name).string(); }

    std::filesystem::path path;
};

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

nlohmann::json ReadJson(const std::string& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

} // anonymous namespace

TEST_CASE("Config defaults") {
    Config config;
    CHECK(config.http_timeout_ms == 30000);
    CHECK(config.http_max_redirects == 10);
    CHECK(config.http_verify_tls);
    CHECK(config.char_threshold == 500);
    CHECK(config.log_level == "info");
    CHECK_FALSE(config.log_to_file);
}

TEST_CASE("CreateDefault writes every key and Load reads them back") {
    TempDir dir;
    const std::string path = (dir.path / "nested" / "config.json").string();
    Config().CreateDefault(path);

    nlohmann::json written = ReadJson(path);
    CHECK(written == Config().ToJson());

    Config config;
    config.http_timeout_ms = 1;
    config.Load(path);
    CHECK(config.http_timeout_ms == 30000);
    CHECK_FALSE(std::filesystem::exists(path + ".bak"));
}

TEST_CASE("Load applies values and fills in missing keys") {
    TempDir dir;
    const std::string path = dir.File("config.json");
    const std::string original = R"({"http_timeout_ms": 1500, "log_level": "debug", "custom": "kept"})";
    WriteFile(path, original);

    Config config;
    config.Load(path);
    CHECK(config.http_timeout_ms == 1500);
    CHECK(config.log_level == "debug");
    CHECK(config.http_max_redirects == 10);
    CHECK(config.char_threshold == 500);

    nlohmann::json rewritten = ReadJson(path);
    CHECK(rewritten["http_timeout_ms"] == 1500);
    CHECK(rewritten["http_max_redirects"] == 10);
    CHECK(rewritten["char_threshold"] == 500);
    CHECK(rewritten["log_to_file"] == false);
    CHECK(rewritten["custom"] == "kept");

    REQUIRE(std::filesystem::exists(path + ".bak"));
    std::ifstream bak(path + ".bak");
    std::string backup((std::istreambuf_iterator<char>(bak)), std::istreambuf_iterator<char>());
    CHECK(backup == original);
}

TEST_CASE("Load failures") {
    TempDir dir;
    Config config;

    SECTION("missing file") {
        CHECK_THROWS_AS(config.Load(dir.File("absent.json")), std::runtime_error);
    }
    SECTION("malformed JSON") {
        WriteFile(dir.File("bad.json"), "{ \"http_timeout_ms\": ");
        CHECK_THROWS_AS(config.Load(dir.File("bad.json")), nlohmann::json::exception);
    }
    SECTION("wrong type") {
        WriteFile(dir.File("typed.json"), R"({"http_timeout_ms": "soon"})");
        CHECK_THROWS_AS(config.Load(dir.File("typed.json")), nlohmann::json::exception);
    }
    SECTION("negative timeout") {
        WriteFile(dir.File("negative.json"), R"({"http_timeout_ms": -5})");
        CHECK_THROWS_AS(config.Load(dir.File("negative.json")), std::runtime_error);
    }
}

TEST_CASE("Logger level names") {
    CHECK(Logger::FromString("debug") == LogLevel::Debug);
    CHECK(Logger::FromString("WARN") == LogLevel::Warn);
    CHECK(Logger::FromString("error") == LogLevel::Error);
    CHECK(Logger::FromString("nonsense") == LogLevel::Info);
    CHECK(std::string(Logger::ToString(LogLevel::Warn)) == "Warn");

    LogLevel previous = Logger::GetMinLevel();
    Logger::SetMinLevel(LogLevel::Error);
    CHECK(Logger::GetMinLevel() == LogLevel::Error);
    Logger::SetMinLevel(previous);
}

TEST_CASE("Logger writes to a dated file once file output is enabled") {
    TempDir dir;
    const auto log_dir = dir.path / "logs";
    LogLevel previous = Logger::GetMinLevel();
    Logger::SetMinLevel(LogLevel::Info);

    std::error_code ec = Logger::EnableFileOutput(log_dir);
    REQUIRE_FALSE(static_cast<bool>(ec));
    Logger::Log(LogLevel::Warn, "written to file");
    Logger::Log(LogLevel::Debug, "below the minimum level");
    Logger::DisableFileOutput();
    Logger::Log(LogLevel::Warn, "after file output was disabled");
    Logger::SetMinLevel(previous);

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) files.push_back(entry.path());
    REQUIRE(files.size() == 1);
    CHECK(files[0].extension() == ".log");

    std::ifstream in(files[0]);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("[Warn] written to file") != std::string::npos);
    CHECK(contents.find("below the minimum level") == std::string::npos);
    CHECK(contents.find("after file output was disabled") == std::string::npos);
}

TEST_CASE("Logger reports directories it cannot create") {
    TempDir dir;
    const std::string blocker = dir.File("not_a_dir");
    WriteFile(blocker, "x");
    std::error_code ec = Logger::EnableFileOutput(std::filesystem::path(blocker) / "logs");
    CHECK(static_cast<bool>(ec));
}
