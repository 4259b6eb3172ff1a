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

// NavConfig.h: YAML + CLI configuration for navinfo
// Config precedence: CLI flags > YAML config file > hardcoded defaults
#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "logger.h"
#include "navquery/AreaQuadTree.h"

namespace HammerNav {

// All configurable settings of the loader and the inspector.
struct NavConfig {
    // -- spatial_index --
    size_t   leafCapacity = 8;   // areas per leaf before a split, [1, 1024]
    unsigned maxDepth     = 10;  // split depth limit, [0, 24]

    // -- logging --
    Logger::LogLevel logLevel = Logger::LOG_LEVEL_INFO;

    // -- query --
    float zHint = 0.0f;  // used by --height queries that give no z

    AreaQuadTree::Params treeParams() const {
        AreaQuadTree::Params p;
        p.leafCapacity = leafCapacity;
        p.maxDepth = maxDepth;
        return p;
    }
};

// One --height request. Without z the config zHint applies.
struct HeightRequest {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    bool  hasZ = false;
};

// Result of CLI parsing: values that are CLI-only (not in YAML).
struct CliResult {
    std::string navPath;        // positional arg: .nav file, or entry in --archive
    std::string archivePath;    // --archive <zip>
    std::string configPath;     // --config <path>
    std::vector<HeightRequest> heightQueries; // --height X Y Z (repeatable)
    bool listAreas     = false; // --list-areas
    bool helpRequested = false; // --help / -h
    std::string error;          // first usage error, empty if none
};

const size_t   NAV_CFG_MIN_LEAF_CAPACITY = 1;
const size_t   NAV_CFG_MAX_LEAF_CAPACITY = 1024;
const unsigned NAV_CFG_MAX_DEPTH = 24;

inline size_t clampLeafCapacity(long val) {
    if (val < static_cast<long>(NAV_CFG_MIN_LEAF_CAPACITY))
        return NAV_CFG_MIN_LEAF_CAPACITY;
    if (val > static_cast<long>(NAV_CFG_MAX_LEAF_CAPACITY))
        return NAV_CFG_MAX_LEAF_CAPACITY;
    return static_cast<size_t>(val);
}

inline unsigned clampMaxDepth(long val) {
    if (val < 0) return 0;
    if (val > static_cast<long>(NAV_CFG_MAX_DEPTH)) return NAV_CFG_MAX_DEPTH;
    return static_cast<unsigned>(val);
}

// Strict float parse, the whole token must be a number.
inline bool parseFloatArg(const char *s, float &out) {
    if (!s || !*s) return false;
    char *end = nullptr;
    double v = std::strtod(s, &end);
    if (*end != '\0') return false;
    out = static_cast<float>(v);
    return true;
}

inline bool parseIntArg(const char *s, long &out) {
    if (!s || !*s) return false;
    char *end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (*end != '\0') return false;
    out = v;
    return true;
}

// Load settings from a YAML config file into cfg.
// Returns true if the file was loaded successfully.
// Returns false (silently) if the file doesn't exist.
// Logs a warning and returns false on parse errors; cfg keeps the values
// read before the error.
inline bool loadConfigFromYAML(const std::string &path, NavConfig &cfg) {
    FILE *f = std::fopen(path.c_str(), "r");
    if (!f) return false;
    std::fclose(f);

    try {
        YAML::Node root = YAML::LoadFile(path);

        // spatial_index section
        if (YAML::Node idx = root["spatial_index"]) {
            if (idx["leaf_capacity"])
                cfg.leafCapacity = clampLeafCapacity(idx["leaf_capacity"].as<long>());
            if (idx["max_depth"])
                cfg.maxDepth = clampMaxDepth(idx["max_depth"].as<long>());
        }

        // logging section
        if (YAML::Node logging = root["logging"]) {
            if (logging["level"]) {
                std::string name = logging["level"].as<std::string>();
                if (!Logger::parseLevel(name, cfg.logLevel))
                    LOG_ERROR("Config %s: unknown log level '%s'", path.c_str(),
                              name.c_str());
            }
        }

        // query section
        if (YAML::Node query = root["query"]) {
            if (query["z_hint"]) cfg.zHint = query["z_hint"].as<float>();
        }

        LOG_INFO("Loaded config from %s", path.c_str());
        return true;
    } catch (const YAML::Exception &e) {
        LOG_ERROR("Failed to parse config %s: %s", path.c_str(), e.what());
        return false;
    }
}

// Parse CLI arguments into the config struct and extract CLI-only values.
// Processes all flags in a single pass using else-if chain.
inline CliResult applyCliOverrides(int argc, char *argv[], NavConfig &cfg) {
    CliResult cli;

    auto fail = [&cli](const std::string &msg) {
        if (cli.error.empty()) cli.error = msg;
    };

    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            cli.helpRequested = true;
        } else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (std::strcmp(arg, "--archive") == 0 && i + 1 < argc) {
            cli.archivePath = argv[++i];
        } else if (std::strcmp(arg, "--leaf-capacity") == 0 && i + 1 < argc) {
            long val = 0;
            if (parseIntArg(argv[++i], val))
                cfg.leafCapacity = clampLeafCapacity(val);
            else
                fail(std::string("bad --leaf-capacity value '") + argv[i] + "'");
        } else if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            long val = 0;
            if (parseIntArg(argv[++i], val))
                cfg.maxDepth = clampMaxDepth(val);
            else
                fail(std::string("bad --max-depth value '") + argv[i] + "'");
        } else if (std::strcmp(arg, "--log-level") == 0 && i + 1 < argc) {
            const char *val = argv[++i];
            if (!Logger::parseLevel(val, cfg.logLevel))
                fail(std::string("unknown log level '") + val + "'");
        } else if (std::strcmp(arg, "--list-areas") == 0) {
            cli.listAreas = true;
        } else if (std::strcmp(arg, "--height") == 0 && i + 2 < argc) {
            // --height X Y [Z], Z is optional
            HeightRequest req;
            if (!parseFloatArg(argv[i + 1], req.x) ||
                !parseFloatArg(argv[i + 2], req.y)) {
                fail(std::string("bad --height coordinates '") + argv[i + 1] +
                     " " + argv[i + 2] + "'");
                i += 2;
                continue;
            }
            i += 2;
            if (i + 1 < argc && parseFloatArg(argv[i + 1], req.z)) {
                req.hasZ = true;
                ++i;
            }
            cli.heightQueries.push_back(req);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fail(std::string("unknown or incomplete option '") + arg + "'");
        } else if (cli.navPath.empty()) {
            // First non-flag argument is the nav file
            cli.navPath = arg;
        } else {
            fail(std::string("unexpected argument '") + arg + "'");
        }
    }

    return cli;
}

} // namespace HammerNav
