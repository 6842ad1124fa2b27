#ifndef RDZV_LOG_H
#define RDZV_LOG_H

#include <sstream>

enum LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERR,
    FATAL,
    BUG,
    NONE
};

class NullBuffer final : public std::streambuf {
public:
    int overflow(const int c) override { return c; }
};

class NullStream final : public std::ostream {
public:
    NullStream();

private:
    NullBuffer m_sb;
};

/// Accumulates one log line and flushes it to stdout on destruction.
/// Messages below the reporting level are routed into a null stream.
/// The reporting level is read once from the RDZV_LOG_LEVEL environment variable.
class Logger final {
public:
    Logger();

    ~Logger();

    std::ostream &getStream(LogLevel level);

    static LogLevel &getReportingLevel();

    static void setReportingLevel(LogLevel level);

    Logger(const Logger &) = delete;

    Logger &operator=(const Logger &) = delete;

private:
    static LogLevel reportingLevel;
    std::ostringstream os;
    LogLevel messageLevel;
};

#define LOG(level) \
Logger().getStream(level)


#endif // RDZV_LOG_H
