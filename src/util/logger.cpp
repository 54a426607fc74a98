#include "debsnap/util/logger.hpp"

#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace debsnap {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::FILE* g_file = nullptr;
std::string g_file_path;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}

void WriteLine(std::FILE* out,
               const char* ts,
               LogLevel lvl,
               const char* base,
               int line,
               const char* fmt,
               va_list ap) {
    if (ts[0] != '\0') {
        std::fprintf(out, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(out, "[%s] ", ToStr(lvl));
    }
    if (base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
    std::vfprintf(out, fmt, ap);
    std::fprintf(out, "\n");
}
} // namespace

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

bool Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
        g_file_path.clear();
    }
    if (path.empty()) return true;

    g_file = std::fopen(path.c_str(), "a");
    if (!g_file) return false;
    g_file_path = path;
    return true;
}

std::string Logger::LogFile() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_file_path;
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    // Workers log concurrently; one lock covers level check and both sinks.
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level) return;

    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    const char* base = BaseName(file);

    if (g_file) {
        va_list copy;
        va_copy(copy, ap);
        WriteLine(g_file, ts, lvl, base, line, fmt, copy);
        va_end(copy);
        std::fflush(g_file);
    }
    WriteLine(stderr, ts, lvl, base, line, fmt, ap);
}

} // namespace debsnap
