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

// navinfo: command line inspector for Source engine .nav files.
// Decodes a mesh from disk or from a ZIP archive, prints its summary and
// answers ground height queries.

#include "NavArchiveLoader.h"
#include "NavConfig.h"
#include "NavException.h"
#include "NavLoader.h"
#include "logger.h"
#include "stdlog.h"

#include <cstdio>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace HammerNav;

namespace {

const int EXIT_OK = 0;
const int EXIT_USAGE = 1;
const int EXIT_LOAD_FAILED = 2;

// ---------- Input ----------

bool readFile(const std::string &path, std::vector<uint8_t> &out) {
    FILE *f = std::fopen(path.c_str(), "rb");
    if (!f) return false;

    uint8_t tmp[16384];
    size_t n;
    while ((n = std::fread(tmp, 1, sizeof(tmp), f)) > 0)
        out.insert(out.end(), tmp, tmp + n);

    bool ok = !std::ferror(f);
    std::fclose(f);
    return ok;
}

bool readInput(const CliResult &cli, std::vector<uint8_t> &data) {
    if (cli.archivePath.empty()) {
        if (!readFile(cli.navPath, data)) {
            LOG_ERROR("Cannot read %s", cli.navPath.c_str());
            return false;
        }
        return true;
    }

    NavArchiveLoader archive(cli.archivePath);
    if (!archive.isOpen())
        return false;

    std::string entry = cli.navPath;
    if (entry.empty()) {
        // no entry given: take the only .nav of the archive
        std::vector<std::string> entries = archive.listNavEntries();
        if (entries.size() != 1) {
            LOG_ERROR("%s holds %zu .nav entries, name one of them",
                      cli.archivePath.c_str(), entries.size());
            for (const std::string &name : entries)
                std::cerr << "  " << name << std::endl;
            return false;
        }
        entry = entries.front();
    }

    data = archive.loadEntry(entry);
    if (data.empty()) {
        LOG_ERROR("No entry %s in %s", entry.c_str(), cli.archivePath.c_str());
        return false;
    }

    return true;
}

// ---------- Output ----------

void printSummary(const LoadedNavMesh &loaded) {
    const NavMesh &mesh = *loaded.mesh;
    const NavHeader &hdr = mesh.getHeader();

    std::cout << "Version: " << hdr.version << " (sub " << hdr.subVersion
              << ")" << std::endl;
    std::cout << "BSP size: " << hdr.bspSize << std::endl;
    std::cout << "Analyzed: " << (hdr.isAnalyzed ? "yes" : "no") << std::endl;
    std::cout << "Areas: " << mesh.getAreaCount() << std::endl;
    std::cout << "Places: " << mesh.getPlaces().size() << std::endl;
    std::cout << "Ladders: " << mesh.getLadders().size() << std::endl;
    std::cout << "Custom data: " << mesh.getCustomData().size() << " bytes"
              << std::endl;

    const BBox2 &b = mesh.getBounds();
    if (!b.isEmpty()) {
        std::cout << "Bounds: (" << b.min.x << ", " << b.min.y << ") - ("
                  << b.max.x << ", " << b.max.y << ")" << std::endl;
    }

    const AreaQuadTree &tree = *loaded.tree;
    std::cout << "Quad-tree: " << tree.getNodeCount() << " nodes, "
              << tree.getLeafCount() << " leaves, depth " << tree.getDepth()
              << ", " << tree.getEntryCount() << " entries" << std::endl;
}

void printAreas(const NavMesh &mesh) {
    for (const NavArea &area : mesh.getAreas()) {
        const BBox2 &b = area.getBounds();
        std::cout << std::setw(8) << area.getID() << "  flags 0x" << std::hex
                  << area.getFlags() << std::dec << "  (" << b.min.x << ", "
                  << b.min.y << ") - (" << b.max.x << ", " << b.max.y << ")"
                  << "  links " << area.getConnectionCount();

        const std::string &place =
            mesh.getPlaceName(area.getMetadata().place);
        if (!place.empty())
            std::cout << "  " << place;

        std::cout << std::endl;
    }
}

void printHeights(const AreaQuadTree &tree, const NavConfig &cfg,
                  const std::vector<HeightRequest> &requests) {
    for (const HeightRequest &req : requests) {
        float hint = req.hasZ ? req.z : cfg.zHint;

        std::cout << "height(" << req.x << ", " << req.y << ", hint " << hint
                  << "): ";

        const NavArea *area = tree.findBestArea(req.x, req.y, hint);
        if (!area) {
            std::cout << "no match" << std::endl;
            continue;
        }

        std::cout << area->getZHeight(req.x, req.y) << " (area "
                  << area->getID() << ")" << std::endl;
    }
}

void printHelp() {
    std::cerr << "hammernav nav mesh inspector" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Usage: navinfo [options] <file.nav>" << std::endl;
    std::cerr << "       navinfo [options] --archive <maps.zip> [entry.nav]"
              << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --config <yaml>       Config file (default: navinfo.yaml)" << std::endl;
    std::cerr << "  --archive <zip>       Read the nav file from a ZIP archive" << std::endl;
    std::cerr << "  --leaf-capacity N     Areas per quad-tree leaf (1-1024)" << std::endl;
    std::cerr << "  --max-depth N         Quad-tree depth limit (0-24)" << std::endl;
    std::cerr << "  --log-level L         fatal|error|info|debug|verbose" << std::endl;
    std::cerr << "  --list-areas          Print every area" << std::endl;
    std::cerr << "  --height X Y [Z]      Ground height at X Y, Z is the hint (repeatable)" << std::endl;
    std::cerr << "  --help, -h            This text" << std::endl;
}

} // namespace

// ---------- Main ----------

int main(int argc, char *argv[]) {
    StdLog stdlog;
    Logger &logger = Logger::getSingleton();

    // Parse config: hardcoded defaults -> YAML file -> CLI overrides
    NavConfig cfg;

    // First CLI pass: extract --config path (and detect --help early)
    CliResult cli = applyCliOverrides(argc, argv, cfg);

    if (cli.helpRequested) {
        printHelp();
        return EXIT_OK;
    }

    if (!cli.error.empty()) {
        std::cerr << "Error: " << cli.error << std::endl << std::endl;
        printHelp();
        return EXIT_USAGE;
    }

    if (cli.navPath.empty() && cli.archivePath.empty()) {
        std::cerr << "Error: no nav file specified." << std::endl << std::endl;
        printHelp();
        return EXIT_USAGE;
    }

    std::string configPath =
        cli.configPath.empty() ? "navinfo.yaml" : cli.configPath;
    loadConfigFromYAML(configPath, cfg);

    // Re-apply CLI so flags always win over YAML values
    cli = applyCliOverrides(argc, argv, cfg);
    logger.setLogLevel(cfg.logLevel);

    std::vector<uint8_t> data;
    if (!readInput(cli, data))
        return EXIT_LOAD_FAILED;

    LoadedNavMesh loaded;
    try {
        loaded = loadNavMesh(data, cfg.treeParams());
    } catch (const NavException &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_LOAD_FAILED;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_LOAD_FAILED;
    }

    printSummary(loaded);

    if (cli.listAreas)
        printAreas(*loaded.mesh);

    printHeights(*loaded.tree, cfg, cli.heightQueries);

    return EXIT_OK;
}
