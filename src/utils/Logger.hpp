#pragma once
#include <filesystem>
#include <string>
#include <system_error>

namespace Unclutter {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    // Process-wide logger. Lines go to stderr, leaving stdout to the CLI.
    // With file output enabled they are also appended to
    // <dir>/YYYY-MM-DD.log, switching files when the date changes.
    class Logger {
    public:
        static void SetMinLevel(LogLevel level);
        static LogLevel GetMinLevel();

        // On failure logging stays on stderr only and the reason is returned.
        static std::error_code EnableFileOutput(const std::filesystem::path& dir);
        static void DisableFileOutput();

        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static void Log(LogLevel level, const std::string& message);
    };
}
