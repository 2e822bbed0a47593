/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "gamedata/DefinitionStore.hpp"
#include "managers/SettingsManager.hpp"
#include "overmap/GridProjector.hpp"
#include "overmap/OvermapTile.hpp"
#include "utils/ResourcePath.hpp"
#include <boost/program_options.hpp>
#include <exception>
#include <format>
#include <iostream>
#include <string>

namespace po = boost::program_options;
using namespace OvermapAtlas;

namespace {

const std::string DEFAULT_SETTINGS_FILE{"res/atlas_settings.json"};

void printUsage(const po::options_description& options) {
  std::cout << "Usage: " << ATLAS_APP_NAME << " [options] <overmap tile file>\n"
            << "Prints one z-level of a saved overmap tile as text.\n\n"
            << options << '\n';
}

} // namespace

int main(int argc, char* argv[]) {
  po::options_description options("Options");
  options.add_options()
      ("help,h", "show this help and exit")
      ("gamepath,p", po::value<std::string>(), "game install directory or its data/json directory")
      ("zlevel,z", po::value<int>(), "z-level to print, -10 to 10 (use -z-3 or --zlevel=-3 for negatives)")
      ("directories,d", po::value<std::string>(), "comma separated content directories to load")
      ("settings,s", po::value<std::string>()->default_value(DEFAULT_SETTINGS_FILE), "settings file")
      ("quiet,q", "suppress all log output");

  po::options_description hidden;
  hidden.add_options()("tile", po::value<std::string>(), "overmap tile file");

  po::options_description allOptions;
  allOptions.add(options).add(hidden);

  po::positional_options_description positional;
  positional.add("tile", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(allOptions).positional(positional).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << ATLAS_APP_NAME << ": " << e.what() << '\n';
    printUsage(options);
    return -1;
  }

  if (vm.count("help")) {
    printUsage(options);
    return 0;
  }
  if (!vm.count("tile")) {
    std::cerr << ATLAS_APP_NAME << ": no overmap tile file given\n";
    printUsage(options);
    return -1;
  }
  if (vm.count("quiet")) {
    ATLAS_ENABLE_BENCHMARK_MODE();
  }

  ResourcePath::init();

  auto& settings = SettingsManager::Instance();
  const std::string settingsFile = vm["settings"].as<std::string>();
  if (!settings.loadFromFile(ResourcePath::resolve(settingsFile))) {
    ATLAS_MAIN_WARN(std::format("Failed to load {} - using defaults", settingsFile));
  }

  // Command line flags take precedence over the settings file
  if (vm.count("gamepath")) {
    settings.set("content", "game_path", vm["gamepath"].as<std::string>());
  }
  if (vm.count("directories")) {
    settings.set("content", "directories", vm["directories"].as<std::string>());
  }
  if (vm.count("zlevel")) {
    settings.set("render", "z_level", vm["zlevel"].as<int>());
  }

  const std::string gamePath = settings.get<std::string>("content", "game_path", "");
  if (gamePath.empty()) {
    ATLAS_MAIN_CRITICAL("No game path configured; pass --gamepath or set content.game_path");
    std::cerr << ATLAS_APP_NAME << ": no game path configured\n";
    return -1;
  }

  const int zLevel = settings.get<int>("render", "z_level", 0);
  if (!isValidZLevel(zLevel)) {
    ATLAS_MAIN_CRITICAL(std::format("z-level {} is outside [{}, {}]", zLevel, MIN_Z_LEVEL, MAX_Z_LEVEL));
    std::cerr << ATLAS_APP_NAME << ": z-level out of range\n";
    return -1;
  }

  try {
    const auto jsonRoot = ResourcePath::gameDataDir(gamePath);
    const auto directories = settings.getList("content", "directories", DefinitionStore::defaultDirectories());
    ATLAS_MAIN_INFO(std::format("Loading game data from {}", jsonRoot.string()));

    DefinitionStore store;
    const size_t failedFiles = store.load(jsonRoot, directories);
    store.resolve();

    const LoadReport& report = store.getReport();
    ATLAS_MAIN_INFO(std::format("Loaded {} definitions from {} files ({} failed, {} collisions, "
                                "{} missing dependencies, {} cycles)",
                                report.definitionsLoaded, report.filesLoaded, failedFiles,
                                report.collisions, report.missingDependencies, report.cycles));

    const std::string tilePath = vm["tile"].as<std::string>();
    const auto coords = OvermapTile::coordsFromFilename(tilePath);
    if (!coords) {
      ATLAS_MAIN_WARN(std::format("Cannot read overmap coordinates from {}, assuming <0, 0>", tilePath));
    }

    OvermapTile tile(coords ? coords->first : 0, coords ? coords->second : 0);
    if (!tile.loadFromFile(tilePath)) {
      ATLAS_MAIN_CRITICAL(std::format("Failed to load overmap tile {}", tilePath));
      std::cerr << ATLAS_APP_NAME << ": failed to load " << tilePath << '\n';
      return -1;
    }

    if (!tile.resolveSymbols(store)) {
      ATLAS_MAIN_CRITICAL("No overmap_terrain definitions found under " + jsonRoot.string());
      std::cerr << ATLAS_APP_NAME << ": no overmap_terrain definitions loaded\n";
      return -1;
    }

    std::cout << GridProjector::toText(GridProjector::project(tile, zLevel));
  } catch (const std::exception& e) {
    ATLAS_MAIN_CRITICAL(std::format("Unhandled exception: {}", e.what()));
    std::cerr << ATLAS_APP_NAME << ": " << e.what() << '\n';
    return -1;
  }

  return 0;
}
