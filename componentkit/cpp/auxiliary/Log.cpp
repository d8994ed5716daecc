// componentkit-format

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include <componentkit/auxiliary/Log.hpp>

namespace ComponentKit {
namespace Aux {
namespace Log {

void setLogLevel(const std::string &logLevel) {
    if (logLevel == "TRACE") {
        Settings::setLogLevel(LogLevel::trace);
    } else if (logLevel == "DEBUG") {
        Settings::setLogLevel(LogLevel::debug);
    } else if (logLevel == "INFO") {
        Settings::setLogLevel(LogLevel::info);
    } else if (logLevel == "WARN") {
        Settings::setLogLevel(LogLevel::warn);
    } else if (logLevel == "ERROR") {
        Settings::setLogLevel(LogLevel::error);
    } else if (logLevel == "FATAL") {
        Settings::setLogLevel(LogLevel::fatal);
    } else if (logLevel == "QUIET") {
        Settings::setLogLevel(LogLevel::quiet);
    } else {
        throw std::runtime_error("unknown loglevel: " + logLevel);
    }
}

std::string getLogLevel() {
    switch (Settings::getLogLevel()) {
    case LogLevel::trace:
        return "TRACE";
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    case LogLevel::fatal:
        return "FATAL";
    case LogLevel::quiet:
        return "QUIET";
    }
    return "UNKNOWN";
}

namespace Settings {

namespace {
std::atomic<bool> printTime{false};
std::atomic<bool> printLocation{false};
std::atomic<LogLevel> loglevel{LogLevel::error};
} // namespace

LogLevel getLogLevel() {
    return loglevel;
}
void setLogLevel(LogLevel p) {
    loglevel = p;
}

void setPrintTime(bool b) {
    printTime = b;
}
bool getPrintTime() {
    return printTime;
}

void setPrintLocation(bool b) {
    printLocation = b;
}
bool getPrintLocation() {
    return printLocation;
}

} // namespace Settings

namespace {

std::mutex outputMutex;

void printTime(std::ostream &stream) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm local;
    localtime_r(&nowTime, &local);
    stream << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ']';
}

void printLogLevel(std::ostream &stream, LogLevel p) {
    switch (p) {
    case LogLevel::fatal:
        stream << "[FATAL]";
        break;
    case LogLevel::error:
        stream << "[ERROR]";
        break;
    case LogLevel::warn:
        stream << "[WARN ]";
        break;
    case LogLevel::info:
        stream << "[INFO ]";
        break;
    case LogLevel::debug:
        stream << "[DEBUG]";
        break;
    case LogLevel::trace:
        stream << "[TRACE]";
        break;
    default:
        break;
    }
}

void printLocation(std::ostream &stream, const Location &loc) {
    stream << "[" << loc.file << ", " << loc.line << ": " << loc.function << "]";
}

} // namespace

bool isLogLevelEnabled(LogLevel p) noexcept {
    return p >= Settings::getLogLevel();
}

void printLogPrefix(std::ostream &stream, const Location &loc, LogLevel p) {
    printLogLevel(stream, p);
    if (Settings::getPrintTime())
        printTime(stream);
    if (Settings::getPrintLocation())
        printLocation(stream, loc);
    stream << ": ";
}

void emit(const std::string &line, LogLevel p) {
    std::lock_guard<std::mutex> guard{outputMutex};
    if (p >= LogLevel::warn) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}

} // namespace Log
} // namespace Aux
} // namespace ComponentKit
