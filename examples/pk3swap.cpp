#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <pk3/pk3.hpp>

namespace {

// Directories the Movie Battles II asset package ships that clients strip out
const std::vector<std::string> defaultPrefixes = {
    "ext_data/mb2/character/",
    "ext_data/mb2/teamconfig/",
};

void printUsage(const char *program) {
  std::cerr << "Usage:\n"
            << "  " << program
            << " backup  <archive.pk3> [--prefix P]... [--no-overwrite] [--verbose]\n"
            << "  " << program << " restore <archive.pk3> [--verbose]\n"
            << "  " << program << " status  <archive.pk3>\n";
}

int report(const pk3::OperationResult &result) {
  for (const auto &warning : result.warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }
  if (!result) {
    std::cerr << "Error (" << pk3::toString(result.error) << "): " << result.message << "\n";
    return 2;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 3) {
    printUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];
  std::vector<std::string> prefixes;
  bool refuseOverwrite = false;
  bool verbose = false;

  for (int i = 3; i < argc; ++i) {
    if (std::strcmp(argv[i], "--prefix") == 0 && i + 1 < argc) {
      prefixes.emplace_back(argv[++i]);
    } else if (std::strcmp(argv[i], "--no-overwrite") == 0) {
      refuseOverwrite = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

  auto config =
      pk3::SwapConfig::forArchive(argv[2], prefixes.empty() ? defaultPrefixes : prefixes);
  if (refuseOverwrite) {
    config.backupPolicy = pk3::BackupPolicy::Refuse;
  }

  if (command == "backup") {
    auto result = pk3::backupAndStrip(config);
    if (result) {
      std::cout << "Backup created: " << config.backupPath.string() << "\n"
                << "Kept " << result.stats.copied << " entries, removed "
                << result.stats.excluded << ", skipped " << result.stats.skipped << "\n";
    }
    return report(result);
  }

  if (command == "restore") {
    auto result = pk3::restore(config);
    if (result) {
      std::cout << "Restored from backup: " << config.archivePath.string() << "\n";
    }
    return report(result);
  }

  if (command == "status") {
    std::cout << config.archivePath.string() << ": " << pk3::toString(pk3::queryState(config))
              << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << command << "\n";
  printUsage(argv[0]);
  return 1;
}
