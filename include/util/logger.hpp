#pragma once

#include "util/result.hpp"

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace uploader {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

std::optional<LogLevel> ParseLogLevel(std::string_view text);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Mirrors every line into |path| (appended). An empty path closes the sink.
    Result SetLogFile(const std::string& path);

    // printf-style logging
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));

private:
    Logger() = default;

    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);
};

#define LogDebug(...) ::uploader::Logger::Instance().LogWithSource(::uploader::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::uploader::Logger::Instance().LogWithSource(::uploader::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::uploader::Logger::Instance().LogWithSource(::uploader::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::uploader::Logger::Instance().LogWithSource(::uploader::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace uploader
