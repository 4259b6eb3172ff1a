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
/** @file ByteCursor.h
 * @brief Bounds-checked little-endian reader over an in-memory byte buffer.
 */

#ifndef __BYTECURSOR_H
#define __BYTECURSOR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "NavMath.h"

namespace HammerNav {

/** @brief Sequential reader over a byte buffer it does not own.
 *
 * Every read either consumes exactly the width of the value or throws
 * NavException(UNEXPECTED_EOF) with the offset of the failed read, leaving
 * the position untouched. The buffer must outlive the cursor.
 */
class ByteCursor {
public:
    ByteCursor(const uint8_t *data, size_t size);
    explicit ByteCursor(const std::vector<uint8_t> &data);

    uint8_t readU8();
    uint16_t readU16();
    uint32_t readU32();
    uint64_t readU64();

    int8_t readS8() { return static_cast<int8_t>(readU8()); }
    int16_t readS16() { return static_cast<int16_t>(readU16()); }
    int32_t readS32() { return static_cast<int32_t>(readU32()); }
    int64_t readS64() { return static_cast<int64_t>(readU64()); }

    float readFloat();
    double readDouble();

    /// u16 byte count followed by the characters. NUL padding inside the
    /// counted bytes is stripped from the end.
    std::string readString();

    /// Copies count bytes into dest
    void readBytes(void *dest, size_t count);

    std::vector<uint8_t> readBytes(size_t count);

    void skip(size_t count);

    /// Current offset from the start of the buffer
    size_t tell() const { return mPos; }

    size_t size() const { return mSize; }

    size_t remaining() const { return mSize - mPos; }

    bool eof() const { return mPos >= mSize; }

    // stream style reads, mirroring File's operator>>
    ByteCursor &operator>>(uint8_t &val) { val = readU8(); return *this; }
    ByteCursor &operator>>(uint16_t &val) { val = readU16(); return *this; }
    ByteCursor &operator>>(uint32_t &val) { val = readU32(); return *this; }
    ByteCursor &operator>>(uint64_t &val) { val = readU64(); return *this; }
    ByteCursor &operator>>(int8_t &val) { val = readS8(); return *this; }
    ByteCursor &operator>>(int16_t &val) { val = readS16(); return *this; }
    ByteCursor &operator>>(int32_t &val) { val = readS32(); return *this; }
    ByteCursor &operator>>(int64_t &val) { val = readS64(); return *this; }
    ByteCursor &operator>>(float &val) { val = readFloat(); return *this; }
    ByteCursor &operator>>(double &val) { val = readDouble(); return *this; }

private:
    /// Throws UNEXPECTED_EOF unless count more bytes are available
    void require(size_t count, const char *what) const;

    const uint8_t *mData;
    size_t mSize;
    size_t mPos;
};

/// Reads three consecutive floats (x, y, z)
ByteCursor &operator>>(ByteCursor &st, Vector3 &val);

} // namespace HammerNav

#endif
