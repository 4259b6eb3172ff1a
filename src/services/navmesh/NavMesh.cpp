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

#include "NavMesh.h"
#include "NavException.h"

#include <utility>

namespace HammerNav {

/*----------------------------------------------------*/
/*----------------------- NavMesh --------------------*/
/*----------------------------------------------------*/
NavMesh::NavMesh(const NavHeader &header, std::vector<NavArea> areas,
                 std::vector<std::string> places,
                 std::vector<NavLadder> ladders,
                 std::vector<uint8_t> customData)
    : mHeader(header), mAreas(std::move(areas)), mAreaIndex(), mBounds(),
      mPlaces(std::move(places)), mLadders(std::move(ladders)),
      mCustomData(std::move(customData)) {
    mAreaIndex.reserve(mAreas.size());

    for (size_t i = 0; i < mAreas.size(); ++i) {
        const NavArea &area = mAreas[i];

        if (!mAreaIndex.emplace(area.getID(), i).second) {
            throw NavException(NavException::DUPLICATE_AREA,
                               "area id " + std::to_string(area.getID()) +
                                   " is used more than once");
        }

        mBounds.merge(area.getBounds());
    }
}

//------------------------------------------------------
const NavArea &NavMesh::getArea(NavAreaID id) const {
    return mAreas[getAreaIndex(id)];
}

//------------------------------------------------------
const NavArea *NavMesh::findArea(NavAreaID id) const {
    auto it = mAreaIndex.find(id);
    if (it == mAreaIndex.end())
        return nullptr;

    return &mAreas[it->second];
}

//------------------------------------------------------
size_t NavMesh::getAreaIndex(NavAreaID id) const {
    auto it = mAreaIndex.find(id);
    if (it == mAreaIndex.end()) {
        throw NavException(NavException::AREA_NOT_FOUND,
                           "no area with id " + std::to_string(id));
    }

    return it->second;
}

//------------------------------------------------------
const std::string &NavMesh::getPlaceName(uint16_t place) const {
    static const std::string empty;

    if (place == 0 || place > mPlaces.size())
        return empty;

    return mPlaces[place - 1];
}

//------------------------------------------------------
const NavLadder *NavMesh::findLadder(NavLadderID id) const {
    // ladder tables are short, a scan is enough
    for (const NavLadder &ladder : mLadders) {
        if (ladder.id == id)
            return &ladder;
    }

    return nullptr;
}

} // namespace HammerNav
