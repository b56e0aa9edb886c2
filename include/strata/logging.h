/**
 * Compile-time logging for Strata
 *
 * Every component declares a tag once per translation unit and streams
 * into a level macro:
 *
 *   STRATA_LOG_TAG(Catalog);
 *   STRATA_LOG_DEBUG(Catalog) << "Appended state " << state_id;
 *
 * Statements compile to nothing unless STRATA_ENABLE_DEBUG_LOGGING is
 * defined, and levels below STRATA_MIN_LOG_LEVEL (1=DEBUG .. 4=ERROR)
 * are dropped at compile time.
 */

#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace strata {
namespace logging {

enum class LogLevel : int {
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4
};

struct LogTag {
    const char* name;

    constexpr explicit LogTag(const char* n) : name(n) {}
};

#ifndef STRATA_MIN_LOG_LEVEL
#define STRATA_MIN_LOG_LEVEL 2  // INFO
#endif

constexpr LogLevel kMinLevel = static_cast<LogLevel>(STRATA_MIN_LOG_LEVEL);

// Serializes lines from concurrent writers onto stderr
class LogSink {
public:
    static LogSink& Instance() {
        static LogSink sink;
        return sink;
    }

    void Write(const LogTag& tag, LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[strata] [" << LevelName(level) << "] [" << tag.name << "] " << message << "\n";
    }

private:
    LogSink() = default;

    static const char* LevelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
        }
        return "?????";
    }

    std::mutex mutex_;
};

#ifdef STRATA_ENABLE_DEBUG_LOGGING

template<LogLevel Level>
class LogStream {
public:
    explicit LogStream(const LogTag& tag) : tag_(tag) {}

    ~LogStream() {
        if constexpr (Level >= kMinLevel) {
            LogSink::Instance().Write(tag_, Level, oss_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if constexpr (Level >= kMinLevel) {
            oss_ << value;
        }
        return *this;
    }

private:
    const LogTag& tag_;
    std::ostringstream oss_;
};

#else

template<LogLevel Level>
class LogStream {
public:
    explicit LogStream(const LogTag&) {}

    template<typename T>
    LogStream& operator<<(const T&) {
        return *this;
    }
};

#endif // STRATA_ENABLE_DEBUG_LOGGING

} // namespace logging
} // namespace strata

#define STRATA_LOG_TAG(name) \
    static constexpr ::strata::logging::LogTag name##Tag(#name)

#define STRATA_LOG_DEBUG(component) \
    ::strata::logging::LogStream<::strata::logging::LogLevel::DEBUG>(component##Tag)

#define STRATA_LOG_INFO(component) \
    ::strata::logging::LogStream<::strata::logging::LogLevel::INFO>(component##Tag)

#define STRATA_LOG_WARN(component) \
    ::strata::logging::LogStream<::strata::logging::LogLevel::WARN>(component##Tag)

#define STRATA_LOG_ERROR(component) \
    ::strata::logging::LogStream<::strata::logging::LogLevel::ERROR>(component##Tag)
