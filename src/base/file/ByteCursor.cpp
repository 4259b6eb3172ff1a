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

/** @file ByteCursor.cpp
 * @brief Bounds-checked little-endian reader - implementation
 */

#include "ByteCursor.h"
#include "NavException.h"

#include <cstring>

namespace HammerNav {

/*----------------------------------------------------*/
/*--------------------- ByteCursor -------------------*/
/*----------------------------------------------------*/
ByteCursor::ByteCursor(const uint8_t *data, size_t size)
    : mData(data), mSize(data ? size : 0), mPos(0) {}

//------------------------------------------------------
ByteCursor::ByteCursor(const std::vector<uint8_t> &data)
    : mData(data.data()), mSize(data.size()), mPos(0) {}

//------------------------------------------------------
void ByteCursor::require(size_t count, const char *what) const {
    if (count > remaining()) {
        throw NavException(NavException::UNEXPECTED_EOF,
                           std::string("need ") + std::to_string(count) +
                               " byte(s) for " + what + ", " +
                               std::to_string(remaining()) + " left",
                           mPos);
    }
}

//------------------------------------------------------
uint8_t ByteCursor::readU8() {
    require(1, "u8");
    return mData[mPos++];
}

//------------------------------------------------------
uint16_t ByteCursor::readU16() {
    require(2, "u16");
    const uint8_t *p = mData + mPos;
    mPos += 2;
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

//------------------------------------------------------
uint32_t ByteCursor::readU32() {
    require(4, "u32");
    const uint8_t *p = mData + mPos;
    mPos += 4;
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

//------------------------------------------------------
uint64_t ByteCursor::readU64() {
    require(8, "u64");
    uint64_t res = 0;
    for (int i = 7; i >= 0; --i)
        res = (res << 8) | mData[mPos + i];
    mPos += 8;
    return res;
}

//------------------------------------------------------
float ByteCursor::readFloat() {
    require(4, "float");
    uint32_t bits = readU32();
    float res;
    std::memcpy(&res, &bits, sizeof(res));
    return res;
}

//------------------------------------------------------
double ByteCursor::readDouble() {
    require(8, "double");
    uint64_t bits = readU64();
    double res;
    std::memcpy(&res, &bits, sizeof(res));
    return res;
}

//------------------------------------------------------
std::string ByteCursor::readString() {
    size_t start = mPos;
    uint16_t len = readU16();

    if (len > remaining()) {
        // rewind so the failed read leaves no trace
        mPos = start;
        require(static_cast<size_t>(len) + 2, "string");
    }

    std::string res(reinterpret_cast<const char *>(mData + mPos), len);
    mPos += len;

    while (!res.empty() && res.back() == '\0')
        res.pop_back();

    return res;
}

//------------------------------------------------------
void ByteCursor::readBytes(void *dest, size_t count) {
    require(count, "raw bytes");
    if (count > 0)
        std::memcpy(dest, mData + mPos, count);
    mPos += count;
}

//------------------------------------------------------
std::vector<uint8_t> ByteCursor::readBytes(size_t count) {
    require(count, "raw bytes");
    std::vector<uint8_t> res(mData + mPos, mData + mPos + count);
    mPos += count;
    return res;
}

//------------------------------------------------------
void ByteCursor::skip(size_t count) {
    require(count, "skip");
    mPos += count;
}

//------------------------------------------------------
ByteCursor &operator>>(ByteCursor &st, Vector3 &val) {
    // all three components or nothing
    if (st.remaining() < 12) {
        throw NavException(NavException::UNEXPECTED_EOF,
                           "need 12 byte(s) for vector, " +
                               std::to_string(st.remaining()) + " left",
                           st.tell());
    }

    st >> val.x >> val.y >> val.z;
    return st;
}

} // namespace HammerNav
