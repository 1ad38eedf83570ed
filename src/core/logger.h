#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nvlink::core {

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
};

const char* LogLevelName(LogLevel level);
bool TryParseLogLevel(std::string_view text, LogLevel& out_level);

class Logger final {
public:
    static void SetMinLevel(LogLevel level);
    static LogLevel MinLevel();
    static bool IsEnabled(LogLevel level);

    static void Trace(std::string_view module, std::string_view message);
    static void Debug(std::string_view module, std::string_view message);
    static void Info(std::string_view module, std::string_view message);
    static void Warn(std::string_view module, std::string_view message);
    static void Error(std::string_view module, std::string_view message);

private:
    static void Log(LogLevel level, std::string_view module, std::string_view message);
};

}  // namespace nvlink::core
