/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A host application that
 * embeds the fixed-point library can route messages into its own sink
 * via Log::setLogger() at startup.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef LOCKSTEP_CORE_LOG_HPP
    #define LOCKSTEP_CORE_LOG_HPP

    #include "Constants.hpp"
    #include "Types.hpp"

    #include <string_view>

namespace lockstep::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "math").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 * The logger and minimum level are meant to be configured once before any
 * concurrent use.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Install a sink; nullptr restores the stderr logger.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug(kDefaultLogTag, msg); }
    static void info (std::string_view msg) { info (kDefaultLogTag, msg); }
    static void warn (std::string_view msg) { warn (kDefaultLogTag, msg); }
    static void error(std::string_view msg) { error(kDefaultLogTag, msg); }
    static void fatal(std::string_view msg) { fatal(kDefaultLogTag, msg); }
};

} // namespace lockstep::core

#endif // LOCKSTEP_CORE_LOG_HPP
