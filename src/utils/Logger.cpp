#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace Unclutter {

namespace {

// Daily log file under one directory. Reopened lazily when the date of the
// line being written differs from the open file's.
struct FileSink {
    std::filesystem::path dir;
    std::string date;
    std::ofstream out;

    void Write(const std::tm& when, const std::string& line) {
        char today[16];
        std::strftime(today, sizeof(today), "%Y-%m-%d", &when);
        if (date != today) {
            date = today;
            if (out.is_open()) out.close();
            out.open(dir / (date + ".log"), std::ios::out | std::ios::app);
        }
        if (out.is_open()) out << line << std::endl;
    }
};

struct LoggerState {
    std::mutex mutex;
    LogLevel min_level = LogLevel::Info;
    std::unique_ptr<FileSink> file;
};

LoggerState& State() {
    static LoggerState state;
    return state;
}

std::tm LocalTime(std::time_t t) {
    std::tm buf{};
    #ifdef _WIN32
    localtime_s(&buf, &t);
    #else
    localtime_r(&t, &buf);
    #endif
    return buf;
}

} // anonymous namespace

void Logger::SetMinLevel(LogLevel level) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.min_level = level;
}

LogLevel Logger::GetMinLevel() {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.min_level;
}

std::error_code Logger::EnableFileOutput(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return ec;
    auto sink = std::make_unique<FileSink>();
    sink->dir = dir;

    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.file = std::move(sink);
    return {};
}

void Logger::DisableFileOutput() {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.file.reset();
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "warn" || t == "warning") return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
    }
    return "";
}

void Logger::Log(LogLevel level, const std::string& message) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level < state.min_level) return;

    const std::tm now = LocalTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::ostringstream line;
    line << std::put_time(&now, "%Y-%m-%d %X") << " [" << ToString(level) << "] " << message;

    std::cerr << line.str() << std::endl;
    if (state.file) state.file->Write(now, line.str());
}

}
