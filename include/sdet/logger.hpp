#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace sdet {
enum class LogLevel { Debug = 0, Info, Warn, Error };

class Logger {
public:
    static void set_level(LogLevel lv) { level_.store(static_cast<int>(lv)); }
    static LogLevel level() { return static_cast<LogLevel>(level_.load()); }

    // "debug" | "info" | "warn" | "error"; false on anything else
    static bool parse_level(const std::string& s, LogLevel& out) {
        if (s == "debug") out = LogLevel::Debug;
        else if (s == "info") out = LogLevel::Info;
        else if (s == "warn") out = LogLevel::Warn;
        else if (s == "error") out = LogLevel::Error;
        else return false;
        return true;
    }

    template <typename... Args>
    static void debug(const char* fmt, Args... args) { write(LogLevel::Debug, stdout, "[D] ", fmt, args...); }

    template <typename... Args>
    static void info(const char* fmt, Args... args) { write(LogLevel::Info, stdout, "[I] ", fmt, args...); }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) { write(LogLevel::Warn, stderr, "[W] ", fmt, args...); }

    template <typename... Args>
    static void error(const char* fmt, Args... args) { write(LogLevel::Error, stderr, "[E] ", fmt, args...); }

private:
    template <typename... Args>
    static void write(LogLevel lv, FILE* out, const char* tag, const char* fmt, Args... args) {
        if (static_cast<int>(lv) < level_.load()) return;
        std::string line = stamp() + tag + fmt + "\n";
        std::lock_guard<std::mutex> lk(mu_);
        if constexpr (sizeof...(Args) == 0) fputs(line.c_str(), out);
        else fprintf(out, line.c_str(), args...);
        fflush(out);
    }

    static std::string stamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        int ms = static_cast<int>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[32];
        size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d ", ms);
        return buf;
    }

    static inline std::mutex mu_{};
    static inline std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
};
}
