#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Critical,
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Unknown names map to Info
LogLevel parseLogLevel(const std::string& name);
const char* logLevelName(LogLevel level);

// Writes "[tag] [LEVEL] msg". Warning and above go to stderr.
void logMessage(LogLevel level, const std::string& tag, const std::string& msg);

inline void logDebug(const std::string& tag, const std::string& msg) { logMessage(LogLevel::Debug, tag, msg); }
inline void logInfo(const std::string& tag, const std::string& msg) { logMessage(LogLevel::Info, tag, msg); }
inline void logWarn(const std::string& tag, const std::string& msg) { logMessage(LogLevel::Warning, tag, msg); }
inline void logError(const std::string& tag, const std::string& msg) { logMessage(LogLevel::Error, tag, msg); }

#endif
