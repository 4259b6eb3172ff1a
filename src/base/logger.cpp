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

#include "logger.h"

#include <algorithm>
#include <cstdio>

namespace HammerNav {

/*----------------------------------------------------*/
/*----------------------- Logger ---------------------*/
/*----------------------------------------------------*/
Logger::Logger() : mLogLevel(LOG_LEVEL_INFO) {}

//------------------------------------------------------
Logger &Logger::getSingleton() {
    static Logger instance;
    return instance;
}

//------------------------------------------------------
void Logger::log(LogLevel level, const char *fmt, ...) {
    if (!isLevelEnabled(level))
        return;

    va_list args;
    va_start(args, fmt);
    vlog(level, fmt, args);
    va_end(args);
}

//------------------------------------------------------
void Logger::vlog(LogLevel level, const char *fmt, va_list args) {
    if (!isLevelEnabled(level))
        return;

    // format once, then hand the same text to all listeners
    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, args);

    std::string msg(buf);

    std::lock_guard<std::mutex> lock(mMutex);
    for (LogListener *listener : mListeners)
        listener->logMessage(level, msg);
}

//------------------------------------------------------
void Logger::registerLogListener(LogListener *listener) {
    std::lock_guard<std::mutex> lock(mMutex);

    if (std::find(mListeners.begin(), mListeners.end(), listener) ==
        mListeners.end())
        mListeners.push_back(listener);
}

//------------------------------------------------------
void Logger::unregisterLogListener(LogListener *listener) {
    std::lock_guard<std::mutex> lock(mMutex);

    mListeners.erase(
        std::remove(mListeners.begin(), mListeners.end(), listener),
        mListeners.end());
}

//------------------------------------------------------
const char *Logger::levelName(LogLevel level) {
    switch (level) {
    case LOG_LEVEL_FATAL:
        return "fatal";
    case LOG_LEVEL_ERROR:
        return "error";
    case LOG_LEVEL_INFO:
        return "info";
    case LOG_LEVEL_DEBUG:
        return "debug";
    case LOG_LEVEL_VERBOSE:
        return "verbose";
    default:
        return "unknown";
    }
}

//------------------------------------------------------
bool Logger::parseLevel(const std::string &name, LogLevel &level) {
    static const LogLevel levels[] = {LOG_LEVEL_FATAL, LOG_LEVEL_ERROR,
                                      LOG_LEVEL_INFO, LOG_LEVEL_DEBUG,
                                      LOG_LEVEL_VERBOSE};

    for (LogLevel l : levels) {
        if (name == levelName(l)) {
            level = l;
            return true;
        }
    }

    return false;
}

} // namespace HammerNav
