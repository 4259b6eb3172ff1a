/******************************************************************************
 *
 *    This file is part of the hammernav project
 *    Copyright (C) 2026 hammernav team
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/
/** @file logger.h
 * @brief Leveled printf-style logger with pluggable listeners.
 */

#ifndef __LOGGER_H
#define __LOGGER_H

#include <atomic>
#include <cstdarg>
#include <mutex>
#include <string>
#include <vector>

namespace HammerNav {

class LogListener;

/** @brief Process-wide logger. Messages below the current level threshold are
 * dropped, the rest are formatted once and dispatched to every listener.
 * With no listener registered nothing is printed.
 */
class Logger {
public:
    /// LEVELS: fatal error info debug verbose
    enum LogLevel {
        LOG_LEVEL_FATAL = 0,
        LOG_LEVEL_ERROR,
        LOG_LEVEL_INFO,
        LOG_LEVEL_DEBUG,
        LOG_LEVEL_VERBOSE
    };

    static Logger &getSingleton();

    /// Log a printf-style message at the given level
    void log(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    void vlog(LogLevel level, const char *fmt, va_list args);

    void registerLogListener(LogListener *listener);
    void unregisterLogListener(LogListener *listener);

    void setLogLevel(LogLevel level) { mLogLevel = level; }
    LogLevel getLogLevel() const { return mLogLevel; }

    bool isLevelEnabled(LogLevel level) const { return level <= mLogLevel; }

    /// Level name as used in config files ("info", "debug", ...)
    static const char *levelName(LogLevel level);

    /// Parses a level name. Returns false and leaves level untouched on
    /// unknown input.
    static bool parseLevel(const std::string &name, LogLevel &level);

private:
    Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    std::atomic<LogLevel> mLogLevel;
    std::vector<LogListener *> mListeners;
    std::mutex mMutex;
};

/// Receives formatted log messages
class LogListener {
public:
    virtual ~LogListener() {}

    virtual void logMessage(Logger::LogLevel level,
                            const std::string &msg) = 0;
};

} // namespace HammerNav

#define LOG_FATAL(...)                                                         \
    ::HammerNav::Logger::getSingleton().log(                                   \
        ::HammerNav::Logger::LOG_LEVEL_FATAL, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    ::HammerNav::Logger::getSingleton().log(                                   \
        ::HammerNav::Logger::LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    ::HammerNav::Logger::getSingleton().log(                                   \
        ::HammerNav::Logger::LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
    ::HammerNav::Logger::getSingleton().log(                                   \
        ::HammerNav::Logger::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_VERBOSE(...)                                                       \
    ::HammerNav::Logger::getSingleton().log(                                   \
        ::HammerNav::Logger::LOG_LEVEL_VERBOSE, __VA_ARGS__)

#endif
