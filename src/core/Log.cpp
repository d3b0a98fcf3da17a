// ========================= src/core/Log.cpp =========================
#include "Log.hpp"
#include <cstdarg>
#include <cstdio>
#include <vector>

namespace fl {

    static LogSink g_sink;
    static bool g_quiet = false;

    void setLogSink(LogSink sink) { g_sink = std::move(sink); }
    void setLogQuiet(bool quiet) { g_quiet = quiet; }

    static void emit(LogLevel lv, const char* tag, const char* fmt, va_list ap) {
        if (lv == LogLevel::Info && g_quiet) return;

        va_list copy;
        va_copy(copy, ap);
        int len = std::vsnprintf(nullptr, 0, fmt, copy);
        va_end(copy);
        if (len < 0) return;

        std::vector<char> buf(size_t(len) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);

        std::string line = std::string("[") + tag + "] " + buf.data();
        if (g_sink) { g_sink(lv, line); return; }

        FILE* out = (lv == LogLevel::Info) ? stdout : stderr;
        std::fprintf(out, "%s\n", line.c_str());
    }

    void logInfo(const char* tag, const char* fmt, ...) {
        va_list ap; va_start(ap, fmt); emit(LogLevel::Info, tag, fmt, ap); va_end(ap);
    }

    void logWarn(const char* tag, const char* fmt, ...) {
        va_list ap; va_start(ap, fmt); emit(LogLevel::Warn, tag, fmt, ap); va_end(ap);
    }

    void logError(const char* tag, const char* fmt, ...) {
        va_list ap; va_start(ap, fmt); emit(LogLevel::Error, tag, fmt, ap); va_end(ap);
    }

} // namespace fl
