// Minimal printf-style logging with a replaceable sink
#pragma once

#include <cstdarg>

namespace cardio {

enum class LogLevel { DEBUG = 3, INFO = 4, WARN = 5, ERROR = 6 };

// Sink receives an already formatted, NUL terminated line (no newline).
using LogSink = void (*)(LogLevel level, const char* tag, const char* line);

void setLogSink(LogSink sink);      // nullptr restores the stderr sink
void setLogLevel(LogLevel minLevel);
LogLevel logLevel();

void logPrint(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;
void logVPrint(LogLevel level, const char* tag, const char* fmt, va_list ap);

} // namespace cardio

#define CARDIO_LOGD(tag, ...) ::cardio::logPrint(::cardio::LogLevel::DEBUG, tag, __VA_ARGS__)
#define CARDIO_LOGI(tag, ...) ::cardio::logPrint(::cardio::LogLevel::INFO, tag, __VA_ARGS__)
#define CARDIO_LOGW(tag, ...) ::cardio::logPrint(::cardio::LogLevel::WARN, tag, __VA_ARGS__)
#define CARDIO_LOGE(tag, ...) ::cardio::logPrint(::cardio::LogLevel::ERROR, tag, __VA_ARGS__)
