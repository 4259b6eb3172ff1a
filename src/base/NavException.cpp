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

#include "NavException.h"

#include <cstdio>

namespace HammerNav {

const size_t NavException::NO_OFFSET;

//------------------------------------------------------
NavException::NavException(ErrorType type, const std::string &detail,
                           size_t offset)
    : std::runtime_error(format(type, detail, offset)), mType(type),
      mOffset(offset), mDetail(detail) {}

//------------------------------------------------------
const char *NavException::typeName(ErrorType type) {
    switch (type) {
    case INVALID_MAGIC:
        return "InvalidMagic";
    case UNSUPPORTED_VERSION:
        return "UnsupportedVersion";
    case UNEXPECTED_EOF:
        return "UnexpectedEof";
    case CORRUPT_COUNT:
        return "CorruptCount";
    case DANGLING_REFERENCE:
        return "DanglingReference";
    case DUPLICATE_AREA:
        return "DuplicateArea";
    case INVALID_AREA:
        return "InvalidArea";
    case AREA_NOT_FOUND:
        return "AreaNotFound";
    default:
        return "Unknown";
    }
}

//------------------------------------------------------
std::string NavException::format(ErrorType type, const std::string &detail,
                                 size_t offset) {
    std::string res = typeName(type);

    if (offset != NO_OFFSET) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), " at offset 0x%zX", offset);
        res += buf;
    }

    res += ": ";
    res += detail;
    return res;
}

} // namespace HammerNav
