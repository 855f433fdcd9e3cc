#include "log.hpp"
#include "utils.hpp"
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace {
std::mutex log_m;
LogLevel log_level = LogLevel::Info;
LogSink log_sink;
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Debug:   return "DEBUG";
    }
    return "?";
}

void set_log_level(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(log_m);
    log_level = lvl;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lk(log_m);
    return log_level;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lk(log_m);
    log_sink = std::move(sink);
}

void log_msg(LogLevel lvl, const char* tag, const char* fmt, ...) {
    {
        std::lock_guard<std::mutex> lk(log_m);
        if (lvl > log_level) return;
    }

    char msg[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    char line[1200];
    snprintf(line, sizeof(line), "%s %-5s [%s] %s",
             now_timestamp().c_str(), log_level_name(lvl), tag, msg);

    LogSink sink;
    {
        std::lock_guard<std::mutex> lk(log_m);
        if (!log_sink) {
            fprintf(stderr, "%s\n", line);
            fflush(stderr);
            return;
        }
        sink = log_sink;
    }
    // Called unlocked: a sink may log or swap the sink itself.
    sink(lvl, line);
}
