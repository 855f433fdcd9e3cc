#pragma once
#include <functional>
#include <string>

enum class LogLevel { Error = 0, Warning, Info, Debug };

// Receives every line that passes the level filter, already formatted.
using LogSink = std::function<void(LogLevel, const std::string& line)>;

const char* log_level_name(LogLevel lvl);
void set_log_level(LogLevel lvl);
LogLevel get_log_level();
// Replaces stderr output; pass nullptr to restore it.
void set_log_sink(LogSink sink);

void log_msg(LogLevel lvl, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));
