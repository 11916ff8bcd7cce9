#pragma once
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string_view>

namespace keyscope {

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3,
    log_off   = 4
};

struct logger
{
    static inline log_level g_level = log_warn;

    static void log(log_level level, const char* msg)
    {
        if (level < g_level)
            return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        const char* tag;
        switch (level)
        {
            case log_debug: tag = "DEBUG"; break;
            case log_info:  tag = "INFO";  break;
            case log_warn:  tag = "WARN";  break;
            case log_error: tag = "ERROR"; break;
            default:        tag = "?";     break;
        }

        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        std::fprintf(stderr, "[%02d:%02d:%02d] [%s] %s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, tag, msg);
    }

    // printf-style variant; messages longer than the buffer are truncated
    template<typename... Args>
    static void logf(log_level level, const char* fmt, Args... args)
    {
        if (level < g_level)
            return;
        char buf[512];
        std::snprintf(buf, sizeof(buf), fmt, args...);
        log(level, buf);
    }
};

inline bool parse_log_level(std::string_view str, log_level& level)
{
    if (str == "debug")      level = log_debug;
    else if (str == "info")  level = log_info;
    else if (str == "warn")  level = log_warn;
    else if (str == "error") level = log_error;
    else if (str == "off")   level = log_off;
    else return false;
    return true;
}

} // namespace keyscope

#define LOG_DEBUG(msg) do { if (::keyscope::logger::g_level <= ::keyscope::log_debug) ::keyscope::logger::log(::keyscope::log_debug, msg); } while(0)
#define LOG_INFO(msg)  do { if (::keyscope::logger::g_level <= ::keyscope::log_info)  ::keyscope::logger::log(::keyscope::log_info,  msg); } while(0)
#define LOG_WARN(msg)  do { if (::keyscope::logger::g_level <= ::keyscope::log_warn)  ::keyscope::logger::log(::keyscope::log_warn,  msg); } while(0)
#define LOG_ERROR(msg) do { if (::keyscope::logger::g_level <= ::keyscope::log_error) ::keyscope::logger::log(::keyscope::log_error, msg); } while(0)

#define LOG_DEBUGF(...) do { if (::keyscope::logger::g_level <= ::keyscope::log_debug) ::keyscope::logger::logf(::keyscope::log_debug, __VA_ARGS__); } while(0)
#define LOG_INFOF(...)  do { if (::keyscope::logger::g_level <= ::keyscope::log_info)  ::keyscope::logger::logf(::keyscope::log_info,  __VA_ARGS__); } while(0)
#define LOG_WARNF(...)  do { if (::keyscope::logger::g_level <= ::keyscope::log_warn)  ::keyscope::logger::logf(::keyscope::log_warn,  __VA_ARGS__); } while(0)
