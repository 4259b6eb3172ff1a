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
/** @file NavException.h
 * @brief Exception thrown by every failing nav operation.
 */

#ifndef __NAVEXCEPTION_H
#define __NAVEXCEPTION_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace HammerNav {

/** @brief Nav mesh error. Carries the failure class and, for decode errors,
 * the byte offset in the input buffer where the problem was detected.
 */
class NavException : public std::runtime_error {
public:
    enum ErrorType {
        INVALID_MAGIC,
        UNSUPPORTED_VERSION,
        UNEXPECTED_EOF,
        CORRUPT_COUNT,
        DANGLING_REFERENCE,
        DUPLICATE_AREA,
        INVALID_AREA,
        AREA_NOT_FOUND
    };

    /// Offset value used when the error has no position in the input
    static const size_t NO_OFFSET = SIZE_MAX;

    NavException(ErrorType type, const std::string &detail,
                 size_t offset = NO_OFFSET);

    ErrorType getType() const { return mType; }

    size_t getOffset() const { return mOffset; }

    bool hasOffset() const { return mOffset != NO_OFFSET; }

    /// Short detail text without the type/offset prefix
    const std::string &getDetail() const { return mDetail; }

    /// Printable name of an error type ("UnexpectedEof", ...)
    static const char *typeName(ErrorType type);

private:
    static std::string format(ErrorType type, const std::string &detail,
                              size_t offset);

    ErrorType mType;
    size_t mOffset;
    std::string mDetail;
};

} // namespace HammerNav

#endif
