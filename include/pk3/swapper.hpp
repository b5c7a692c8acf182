#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace pk3 {

// What to do when Backup-and-Strip finds a backup already in place
enum class BackupPolicy {
  Overwrite, // Replace it and record a warning
  Refuse,    // Fail with ErrorKind::AlreadyExists, touching nothing
};

// Everything one operation needs. There is no process-wide state: build one of
// these per call.
struct SwapConfig {
  std::filesystem::path archivePath;
  std::filesystem::path backupPath;
  std::filesystem::path tempPath; // Scratch file for the rewrite, same directory as the archive
  std::vector<std::string> exclusionPrefixes;
  BackupPolicy backupPolicy = BackupPolicy::Overwrite;

  // Derive the conventional sibling paths: "<archive>.bak" and "temp_<archive name>"
  static SwapConfig forArchive(const std::filesystem::path &archivePath,
                               std::vector<std::string> exclusionPrefixes = {});

  // Where the new backup is written before it replaces `backupPath`: "<backup>.part"
  std::filesystem::path backupStagingPath() const;

  // Returns a description of the first problem, or std::nullopt if usable.
  // Prefixes are only checked when `forStrip` is set.
  std::optional<std::string> validate(bool forStrip) const;
};

// Counters filled in by a rewrite
struct RewriteStats {
  size_t copied = 0;       // Entries carried over
  size_t excluded = 0;     // Entries dropped because of a prefix
  size_t skipped = 0;      // Entries that failed to copy
  size_t placeholders = 0; // Placeholder entries added
};

// Outcome of an operation. A successful result may still carry warnings
// (skipped entries, an overwritten backup); a failed one says why it aborted.
struct OperationResult {
  ErrorKind error = ErrorKind::None;
  std::string message; // Failure description, empty on success
  std::vector<std::string> warnings;
  RewriteStats stats;

  bool succeeded() const { return error == ErrorKind::None; }
  explicit operator bool() const { return succeeded(); }
};

// Where an archive/backup pair stands
enum class SwapState {
  Missing,            // Neither file exists
  Original,           // Archive only
  StrippedWithBackup, // Archive and backup
  BackupOnly,         // Backup only; restore() recovers the archive
};

std::string_view toString(SwapState state);

// True if `name` starts with any of `prefixes` (plain string prefix, not path-segment aware)
bool isExcluded(std::string_view name, const std::vector<std::string> &prefixes);

// Name of the empty marker entry that keeps `prefix` listed as a directory
std::string placeholderName(const std::string &prefix);

// Write a copy of the archive at `source` to `dest`, leaving out every entry
// under one of `prefixes` and appending one placeholder per prefix.
// Entries or placeholders that cannot be copied are skipped with a warning.
// Fails with Format if `source` is not a ZIP archive, IO if `dest` cannot be written.
OperationResult rewriteArchive(const std::filesystem::path &source,
                               const std::filesystem::path &dest,
                               const std::vector<std::string> &prefixes);

// Copy the archive to its backup path, then replace the archive with a
// stripped rewrite. The copy only replaces an existing backup once the rewrite
// has succeeded; a failed strip leaves any earlier backup as it was.
OperationResult backupAndStrip(const SwapConfig &config);

// Replace the archive with its backup. The backup no longer exists at its
// path afterwards.
OperationResult restore(const SwapConfig &config);

SwapState queryState(const SwapConfig &config);

} // namespace pk3
