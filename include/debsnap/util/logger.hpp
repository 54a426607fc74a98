#pragma once

#include <cstdarg>
#include <string>

namespace debsnap {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Mirror every line into `path` (appended). Empty path stops mirroring.
    bool SetLogFile(const std::string& path);
    std::string LogFile() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::debsnap::Logger::Instance().LogWithSource(::debsnap::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::debsnap::Logger::Instance().LogWithSource(::debsnap::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::debsnap::Logger::Instance().LogWithSource(::debsnap::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::debsnap::Logger::Instance().LogWithSource(::debsnap::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace debsnap
