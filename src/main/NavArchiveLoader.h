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

// Nav archive loader: reads .nav files out of ZIP archives (map packs,
// packed BSP lumps extracted to zip) via zziplib.

#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include <zzip/zzip.h>

#include "logger.h"

namespace HammerNav {

class NavArchiveLoader {
public:
    explicit NavArchiveLoader(const std::string &zipPath)
        : mPath(zipPath), mDir(nullptr) {
        zzip_error_t err = ZZIP_NO_ERROR;
        mDir = zzip_dir_open(zipPath.c_str(), &err);
        if (!mDir) {
            LOG_ERROR("NavArchive: Failed to open %s (error %d)",
                      zipPath.c_str(), static_cast<int>(err));
        } else {
            LOG_DEBUG("NavArchive: Opened %s", zipPath.c_str());
        }
    }

    ~NavArchiveLoader() {
        if (mDir) {
            zzip_dir_close(mDir);
        }
    }

    NavArchiveLoader(const NavArchiveLoader &) = delete;
    NavArchiveLoader &operator=(const NavArchiveLoader &) = delete;

    // Read an entry by name, case-insensitive (e.g. "maps/de_dust2.nav").
    // A name without extension also tries name + ".nav".
    // Returns the raw file contents, or empty vector if not found.
    std::vector<uint8_t> loadEntry(const std::string &name) {
        if (!mDir) return {};

        ZZIP_FILE *fp = zzip_file_open(mDir, name.c_str(), ZZIP_CASELESS);
        if (!fp && !hasNavExtension(name)) {
            std::string withExt = name + ".nav";
            fp = zzip_file_open(mDir, withExt.c_str(), ZZIP_CASELESS);
        }

        if (!fp) {
            LOG_DEBUG("NavArchive: %s not found in %s", name.c_str(),
                      mPath.c_str());
            return {};
        }

        // Read entire file into buffer
        std::vector<uint8_t> buf;
        uint8_t tmp[4096];
        zzip_ssize_t n;
        while ((n = zzip_file_read(fp, tmp, sizeof(tmp))) > 0) {
            buf.insert(buf.end(), tmp, tmp + n);
        }
        zzip_file_close(fp);

        return buf;
    }

    // Names of all entries ending in .nav (any case), in archive order
    std::vector<std::string> listNavEntries() {
        std::vector<std::string> names;
        if (!mDir) return names;

        zzip_rewinddir(mDir);

        ZZIP_DIRENT dirent;
        while (zzip_dir_read(mDir, &dirent)) {
            std::string entry(dirent.d_name);
            if (hasNavExtension(entry))
                names.push_back(entry);
        }

        return names;
    }

    bool isOpen() const { return mDir != nullptr; }

    const std::string &getPath() const { return mPath; }

    static bool hasNavExtension(const std::string &name) {
        if (name.size() < 4) return false;

        static const char ext[] = ".nav";
        for (size_t i = 0; i < 4; ++i) {
            char c = static_cast<char>(
                std::tolower(static_cast<unsigned char>(name[name.size() - 4 + i])));
            if (c != ext[i]) return false;
        }
        return true;
    }

private:
    std::string mPath;
    ZZIP_DIR *mDir;
};

} // namespace HammerNav
