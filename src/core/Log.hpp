// ========================= src/core/Log.hpp =========================
#pragma once
#include <functional>
#include <string>

namespace fl {

    enum class LogLevel { Info, Warn, Error };

    // Receives "[tag] message" lines. Default sink prints to stdout/stderr.
    using LogSink = std::function<void(LogLevel, const std::string&)>;

    void setLogSink(LogSink sink);   // empty sink restores the default
    void setLogQuiet(bool quiet);    // drop Info lines (tests)

    // printf-style; tag is printed in brackets like "[Session]".
    void logInfo(const char* tag, const char* fmt, ...);
    void logWarn(const char* tag, const char* fmt, ...);
    void logError(const char* tag, const char* fmt, ...);

} // namespace fl
