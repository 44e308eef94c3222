#ifndef FASTACLEAN_LOGGER_HPP
#define FASTACLEAN_LOGGER_HPP

#include <ostream>
#include <iostream>


/*

Very simple logging to stderr.

Usage:

logger = Logger::get();  // returns the logging singleton
logger.set_level(LOG_INFO);
logger.info() << "info message" << std::endl; // printed
logger.debug() << "debug message" << std::endl; // not printed

Warnings and errors are prefixed with "WARNING: " and "ERROR: " when the
message is started with begin_warning() / begin_error().

*/


enum LOG_LEVELS {
    LOG_DEBUG = 1,
    LOG_INFO = 2,
    LOG_WARNING = 3,
    LOG_ERROR = 4,
};

class Logger;

class LogStream {
public:
    LogStream(int level, Logger& logger): level(level), logger(logger) { }
    template <typename T>
    LogStream& operator<<(const T& val);
    LogStream& operator<<(std::ostream& (*f)(std::ostream&));
    bool enabled() const;
private:
    int level;
    Logger& logger;
};


class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }
    Logger(Logger const&) = delete;
    void operator=(Logger const&) = delete;

    void set_level(int level) { this->level = level; }
    LogStream& debug() { return _debug; }
    LogStream& info() { return _info; }
    LogStream& warning() { return _warning << "WARNING: "; }
    LogStream& error() { return _error << "ERROR: "; }

private:
    Logger()
        : level(LOG_INFO)
        , _os(std::cerr)
        , _debug(LogStream(LOG_DEBUG, *this))
        , _info(LogStream(LOG_INFO, *this))
        , _warning(LogStream(LOG_WARNING, *this))
        , _error(LogStream(LOG_ERROR, *this))
    { }
    int level;
    std::ostream& _os;
    LogStream _debug;
    LogStream _info;
    LogStream _warning;
    LogStream _error;

    friend class LogStream;
};


inline bool LogStream::enabled() const {
    return level >= logger.level;
}

template <typename T>
LogStream& LogStream::operator<<(const T& val) {
    if (enabled()) {
        logger._os << val;
    }
    return *this;
}

// This overload is required for supporting std::endl
inline LogStream& LogStream::operator<<(std::ostream& (*f)(std::ostream&)) {
    if (enabled()) {
        f(logger._os);
    }
    return *this;
}

#endif
