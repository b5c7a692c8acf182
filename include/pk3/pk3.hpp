#pragma once

// pk3swap
// Backs up a ZIP-based game asset package (.pk3), strips selected directory
// subtrees out of it, and restores it from the backup on demand.

#include "reader.hpp"
#include "swapper.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: Reader / Writer classes
//    - Reader::open() maps a ZIP archive and lists its entries
//    - Writer builds a new ZIP archive from in-memory entries
//
// 2. High-level: swap operations
//    - backupAndStrip() copies the archive aside and rewrites it without
//      the configured prefixes, leaving a "<prefix>.keep" marker for each
//    - restore() puts the backup back
//
// Example usage:
//
//   auto config = pk3::SwapConfig::forArchive(
//       "MBAssets3.pk3", {"ext_data/mb2/character/", "ext_data/mb2/teamconfig/"});
//
//   auto result = pk3::backupAndStrip(config);
//   if (!result) {
//     std::cerr << result.message << std::endl;
//   }
//   for (const auto& warning : result.warnings) {
//     std::cerr << "warning: " << warning << std::endl;
//   }
//
//   // Later
//   pk3::restore(config);

namespace pk3 {}
