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

#include "stdlog.h"

#include <cstdio>

namespace HammerNav {

//------------------------------------------------------
StdLog::StdLog() { Logger::getSingleton().registerLogListener(this); }

//------------------------------------------------------
StdLog::~StdLog() { Logger::getSingleton().unregisterLogListener(this); }

//------------------------------------------------------
void StdLog::logMessage(Logger::LogLevel level, const std::string &msg) {
    static const char *prefixes[] = {"FATAL", "ERROR", "INFO", "DEBUG",
                                     "VERBOSE"};

    std::fprintf(stderr, "[%s] %s\n", prefixes[level], msg.c_str());
}

} // namespace HammerNav
