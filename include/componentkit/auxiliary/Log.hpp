// componentkit-format

#ifndef COMPONENTKIT_AUXILIARY_LOG_HPP_
#define COMPONENTKIT_AUXILIARY_LOG_HPP_

#include <sstream>
#include <string>

#define COMPONENTKIT_LOG_LOCATION                                                                  \
    ::ComponentKit::Aux::Log::Location { __FILE__, __func__, __LINE__ }

#define FATAL(...)                                                                                 \
    ::ComponentKit::Aux::Log::log(COMPONENTKIT_LOG_LOCATION,                                       \
                                  ::ComponentKit::Aux::Log::LogLevel::fatal, __VA_ARGS__)
#define ERROR(...)                                                                                 \
    ::ComponentKit::Aux::Log::log(COMPONENTKIT_LOG_LOCATION,                                       \
                                  ::ComponentKit::Aux::Log::LogLevel::error, __VA_ARGS__)
#define WARN(...)                                                                                  \
    ::ComponentKit::Aux::Log::log(COMPONENTKIT_LOG_LOCATION,                                       \
                                  ::ComponentKit::Aux::Log::LogLevel::warn, __VA_ARGS__)
#define INFO(...)                                                                                  \
    ::ComponentKit::Aux::Log::log(COMPONENTKIT_LOG_LOCATION,                                       \
                                  ::ComponentKit::Aux::Log::LogLevel::info, __VA_ARGS__)

// DEBUG and TRACE are compiled out in release logging mode
#ifdef COMPONENTKIT_RELEASE_LOGGING
#define DEBUG(...)                                                                                 \
    do {                                                                                           \
    } while (false)
#define TRACE(...)                                                                                 \
    do {                                                                                           \
    } while (false)
#else
#define DEBUG(...)                                                                                 \
    ::ComponentKit::Aux::Log::log(COMPONENTKIT_LOG_LOCATION,                                       \
                                  ::ComponentKit::Aux::Log::LogLevel::debug, __VA_ARGS__)
#define TRACE(...)                                                                                 \
    ::ComponentKit::Aux::Log::log(COMPONENTKIT_LOG_LOCATION,                                       \
                                  ::ComponentKit::Aux::Log::LogLevel::trace, __VA_ARGS__)
#endif

namespace ComponentKit {
namespace Aux {
namespace Log {

struct Location {
    const char *file;
    const char *function;
    const int line;
};

enum class LogLevel { trace = 0, debug = 1, info = 2, warn = 3, error = 4, fatal = 5, quiet = 6 };

/**
 * Accept loglevel as string and set.
 * @param logLevel as string
 */
void setLogLevel(const std::string &logLevel);

/**
 * @return current loglevel as string
 */
std::string getLogLevel();

namespace Settings {

LogLevel getLogLevel();
void setLogLevel(LogLevel p);

void setPrintTime(bool b);
bool getPrintTime();

void setPrintLocation(bool b);
bool getPrintLocation();

} // namespace Settings

bool isLogLevelEnabled(LogLevel p) noexcept;

void printLogPrefix(std::ostream &stream, const Location &loc, LogLevel p);

/**
 * Writes a finished log line to stdout (INFO and below) or stderr (WARN and above).
 */
void emit(const std::string &line, LogLevel p);

inline void printToStream(std::ostream &) {}

template <typename T, typename... Rest>
void printToStream(std::ostream &stream, const T &arg, const Rest &...rest) {
    stream << arg;
    printToStream(stream, rest...);
}

template <typename... T>
void log(const Location &loc, LogLevel p, const T &...args) {
    if (!isLogLevelEnabled(p))
        return;

    std::stringstream stream;
    printLogPrefix(stream, loc, p);
    printToStream(stream, args...);
    stream << '\n';
    emit(stream.str(), p);
}

} // namespace Log
} // namespace Aux
} // namespace ComponentKit

#endif // COMPONENTKIT_AUXILIARY_LOG_HPP_
