#include "cardio_log.h"
#include <atomic>
#include <cstdio>

namespace cardio {

static void stderrSink(LogLevel level, const char* tag, const char* line) {
    const char* lv = "D";
    switch (level) {
        case LogLevel::DEBUG: lv = "D"; break;
        case LogLevel::INFO:  lv = "I"; break;
        case LogLevel::WARN:  lv = "W"; break;
        case LogLevel::ERROR: lv = "E"; break;
    }
    std::fprintf(stderr, "%s/%s: %s\n", lv, tag ? tag : "cardio", line);
}

static std::atomic<LogSink> g_sink{&stderrSink};
static std::atomic<int> g_minLevel{static_cast<int>(LogLevel::INFO)};

void setLogSink(LogSink sink) {
    g_sink.store(sink ? sink : &stderrSink);
}

void setLogLevel(LogLevel minLevel) {
    g_minLevel.store(static_cast<int>(minLevel));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_minLevel.load());
}

void logVPrint(LogLevel level, const char* tag, const char* fmt, va_list ap) {
    if (static_cast<int>(level) < g_minLevel.load()) return;
    // fixed stack buffer: logging never allocates
    char line[192];
    std::vsnprintf(line, sizeof(line), fmt, ap);
    g_sink.load()(level, tag, line);
}

void logPrint(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVPrint(level, tag, fmt, ap);
    va_end(ap);
}

} // namespace cardio
