#include "rdzv_log.hpp"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>

static const char *ToString(const LogLevel level) {
    switch (level) {
        case DEBUG:
            return "DEBUG";
        case INFO:
            return "INFO";
        case WARN:
            return "WARN";
        case ERR:
            return "ERR";
        case FATAL:
            return "FATAL";
        case BUG:
            return "BUG";
        default:
            return "UNKNOWN";
    }
}

static LogLevel readReportingLevel() {
    const char *logLevel = std::getenv("RDZV_LOG_LEVEL");
    if (logLevel == nullptr) {
        return NONE;
    }
    if (strcmp(logLevel, "DEBUG") == 0) {
        return DEBUG;
    }
    if (strcmp(logLevel, "INFO") == 0) {
        return INFO;
    }
    if (strcmp(logLevel, "WARN") == 0) {
        return WARN;
    }
    if (strcmp(logLevel, "ERR") == 0) {
        return ERR;
    }
    if (strcmp(logLevel, "FATAL") == 0) {
        return FATAL;
    }
    return NONE;
}

LogLevel Logger::reportingLevel = readReportingLevel();

// waiters of one round log from many threads at once; keep their lines whole
static std::mutex output_mutex{};

NullStream::NullStream():
    std::ostream(&m_sb) {
}

Logger::Logger() :
    messageLevel(INFO) {
}

Logger::~Logger() {
    if (messageLevel >= reportingLevel) {
        os << std::endl;
        {
            std::lock_guard guard{output_mutex};
            std::cout << os.str();
            std::cout.flush();
        }
        if (messageLevel == FATAL) {
            exit(1);
        }
    }
}

std::ostream &Logger::getStream(const LogLevel level) {
    messageLevel = level;

    if (level >= reportingLevel) {
        time_t raw_time;
        char buffer[80];
        time(&raw_time);
        tm time_info{};
        localtime_r(&raw_time, &time_info);
        strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &time_info);

        os << buffer << " - " << ToString(level) << ": ";

        return os;
    }

    static thread_local NullStream null_stream;
    return null_stream;
}

LogLevel &Logger::getReportingLevel() {
    return reportingLevel;
}

void Logger::setReportingLevel(const LogLevel level) {
    reportingLevel = level;
}
