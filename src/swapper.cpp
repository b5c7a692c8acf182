#include <exception>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <pk3/reader.hpp>
#include <pk3/swapper.hpp>
#include <pk3/writer.hpp>

namespace pk3 {

namespace fs = std::filesystem;

namespace {

OperationResult failure(ErrorKind kind, std::string message) {
  spdlog::error("{}", message);
  OperationResult result;
  result.error = kind;
  result.message = std::move(message);
  return result;
}

void warn(OperationResult &result, std::string message) {
  spdlog::warn("{}", message);
  result.warnings.push_back(std::move(message));
}

// Undoes the side effects of a strip that did not get as far as replacing
// the archive. Whatever is still armed when it goes out of scope is removed.
// An existing backup is never armed: it is only ever replaced by a complete copy.
class StripRollback {
public:
  StripRollback(const SwapConfig &config, OperationResult &result)
      : config_(config), staging_(config.backupStagingPath()), result_(result) {}

  StripRollback(const StripRollback &) = delete;
  StripRollback &operator=(const StripRollback &) = delete;

  ~StripRollback() {
    if (removeTemp_) {
      removeQuietly(config_.tempPath, "temporary archive");
    }
    if (removeStaging_) {
      removeQuietly(staging_, "incomplete backup");
    }
  }

  void armStaging() { removeStaging_ = true; }
  void armTemp() { removeTemp_ = true; }
  void keepStaging() { removeStaging_ = false; }
  void keepTemp() { removeTemp_ = false; }

private:
  void removeQuietly(const fs::path &path, std::string_view what) noexcept {
    std::error_code ec;
    if (fs::remove(path, ec)) {
      spdlog::warn("Removed {} {}", what, path);
    } else if (ec) {
      try {
        warn(result_, fmt::format("Failed to remove {} {}: {}", what, path, ec.message()));
      } catch (const std::exception &e) {
        spdlog::error("Failed to record rollback warning: {}", e.what());
      }
    }
  }

  const SwapConfig &config_;
  const fs::path staging_;
  OperationResult &result_;
  bool removeStaging_ = false;
  bool removeTemp_ = false;
};

// Backup, rewrite and swap. Failures are recorded in `result`; the rollback
// has run by the time this returns.
void replaceWithStripped(const SwapConfig &config, OperationResult &result) {
  StripRollback rollback(config, result);
  std::error_code ec;
  const fs::path staging = config.backupStagingPath();

  // Step 1: verbatim copy, kept under the staging name until the rewrite is done
  rollback.armStaging();
  if (!fs::copy_file(config.archivePath, staging, fs::copy_options::overwrite_existing, ec)) {
    result.error = ErrorKind::IO;
    result.message = fmt::format("Error creating backup file {}: {}", staging,
                                 ec ? ec.message() : std::string("copy did not complete"));
    spdlog::error("{}", result.message);
    return;
  }

  // Step 2: rewrite into the temporary archive
  rollback.armTemp();
  OperationResult rewrite =
      rewriteArchive(config.archivePath, config.tempPath, config.exclusionPrefixes);
  result.stats = rewrite.stats;
  for (auto &warning : rewrite.warnings) {
    result.warnings.push_back(std::move(warning));
  }
  if (!rewrite.succeeded()) {
    result.error = rewrite.error;
    result.message = std::move(rewrite.message);
    return;
  }

  // Step 3: commit the backup, replacing any previous one in a single rename
  fs::rename(staging, config.backupPath, ec);
  if (ec) {
    result.error = ErrorKind::IO;
    result.message = fmt::format("Error creating backup file {}: {}", config.backupPath,
                                 ec.message());
    spdlog::error("{}", result.message);
    return;
  }
  rollback.keepStaging();
  spdlog::info("Backup created: {}", config.backupPath);

  // Step 4: swap the rewrite in. rename() replaces the target atomically, so
  // the archive is either the original or the rewrite, never absent.
  fs::rename(config.tempPath, config.archivePath, ec);
  if (ec) {
    // The original archive is untouched and the backup is a faithful copy of it
    result.error = ErrorKind::IO;
    result.message = fmt::format("Error replacing the original file {}: {}", config.archivePath,
                                 ec.message());
    spdlog::error("{}", result.message);
    return;
  }
  rollback.keepTemp();

  spdlog::info("The original file {} has been modified ({} kept, {} removed, {} skipped)",
               config.archivePath, result.stats.copied, result.stats.excluded,
               result.stats.skipped);
}

OperationResult stripImpl(const SwapConfig &config) {
  if (auto problem = config.validate(true)) {
    return failure(ErrorKind::InvalidArgument, *problem);
  }

  std::error_code ec;
  auto archiveStatus = fs::status(config.archivePath, ec);
  if (archiveStatus.type() == fs::file_type::not_found) {
    return failure(ErrorKind::NotFound,
                   fmt::format("The file {} was not found", config.archivePath));
  }
  if (ec) {
    return failure(ErrorKind::IO,
                   fmt::format("Failed to stat {}: {}", config.archivePath, ec.message()));
  }
  if (!fs::is_regular_file(archiveStatus)) {
    return failure(ErrorKind::NotFound,
                   fmt::format("{} is not a regular file", config.archivePath));
  }

  OperationResult result;

  if (fs::exists(config.backupPath, ec)) {
    if (config.backupPolicy == BackupPolicy::Refuse) {
      return failure(ErrorKind::AlreadyExists,
                     fmt::format("A backup file {} already exists; refusing to overwrite it",
                                 config.backupPath));
    }
    warn(result, fmt::format("A backup file {} already exists. Overwriting...",
                             config.backupPath));
  }

  replaceWithStripped(config, result);
  return result;
}

OperationResult restoreImpl(const SwapConfig &config) {
  if (auto problem = config.validate(false)) {
    return failure(ErrorKind::InvalidArgument, *problem);
  }

  std::error_code ec;
  auto backupStatus = fs::status(config.backupPath, ec);
  if (backupStatus.type() == fs::file_type::not_found) {
    return failure(ErrorKind::NotFound,
                   fmt::format("The backup file {} was not found", config.backupPath));
  }
  if (ec) {
    return failure(ErrorKind::IO,
                   fmt::format("Failed to stat {}: {}", config.backupPath, ec.message()));
  }

  // Make sure the backup is something worth restoring before discarding anything
  {
    std::string error;
    ErrorKind kind = ErrorKind::None;
    auto reader = Reader::open(config.backupPath, &error, &kind);
    if (!reader) {
      return failure(kind == ErrorKind::Format ? ErrorKind::Format : ErrorKind::IO,
                     fmt::format("Backup {} cannot be restored: {}", config.backupPath, error));
    }
  }

  OperationResult result;

  if (fs::exists(config.archivePath, ec)) {
    warn(result, fmt::format("Removing existing {}", config.archivePath));
  }

  // rename() replaces an existing archive atomically, so a failure leaves
  // both files where they were
  fs::rename(config.backupPath, config.archivePath, ec);
  if (ec) {
    result.error = ErrorKind::IO;
    result.message = fmt::format("Error restoring {} from {}: {}", config.archivePath,
                                 config.backupPath, ec.message());
    spdlog::error("{}", result.message);
    return result;
  }

  spdlog::info("Restored from backup: {}", config.archivePath);
  return result;
}

} // namespace

SwapConfig SwapConfig::forArchive(const fs::path &archivePath,
                                  std::vector<std::string> exclusionPrefixes) {
  SwapConfig config;
  config.archivePath = archivePath;
  config.backupPath = archivePath;
  config.backupPath += ".bak";
  config.tempPath = archivePath.parent_path() / ("temp_" + archivePath.filename().string());
  config.exclusionPrefixes = std::move(exclusionPrefixes);
  return config;
}

std::optional<std::string> SwapConfig::validate(bool forStrip) const {
  if (archivePath.empty()) {
    return "Archive path is empty";
  }
  if (backupPath.empty()) {
    return "Backup path is empty";
  }
  if (backupPath == archivePath) {
    return fmt::format("Backup path must differ from the archive path ({})", archivePath);
  }
  if (!forStrip) {
    return std::nullopt;
  }

  if (tempPath.empty()) {
    return "Temporary path is empty";
  }
  const auto staging = backupStagingPath();
  if (tempPath == archivePath || tempPath == backupPath || tempPath == staging) {
    return fmt::format("Temporary path {} collides with the archive or backup", tempPath);
  }
  if (staging == archivePath) {
    return fmt::format("Archive path {} collides with the backup staging file", archivePath);
  }
  if (exclusionPrefixes.empty()) {
    return "No exclusion prefixes given";
  }
  for (const auto &prefix : exclusionPrefixes) {
    // An empty prefix would match every entry
    if (prefix.empty()) {
      return "Exclusion prefixes must not be empty";
    }
  }
  return std::nullopt;
}

std::filesystem::path SwapConfig::backupStagingPath() const {
  auto staging = backupPath;
  staging += ".part";
  return staging;
}

std::string_view toString(SwapState state) {
  switch (state) {
  case SwapState::Missing:
    return "missing";
  case SwapState::Original:
    return "original";
  case SwapState::StrippedWithBackup:
    return "stripped (backup present)";
  case SwapState::BackupOnly:
    return "backup only";
  }
  return "unknown";
}

bool isExcluded(std::string_view name, const std::vector<std::string> &prefixes) {
  for (const auto &prefix : prefixes) {
    if (name.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

std::string placeholderName(const std::string &prefix) {
  if (!prefix.empty() && prefix.back() == '/') {
    return prefix + ".keep";
  }
  return prefix + "/.keep";
}

OperationResult rewriteArchive(const fs::path &source, const fs::path &dest,
                               const std::vector<std::string> &prefixes) {
  std::string error;
  ErrorKind kind = ErrorKind::None;
  auto reader = Reader::open(source, &error, &kind);
  if (!reader) {
    return failure(kind, std::move(error));
  }

  OperationResult result;
  Writer writer;

  for (const auto &entry : reader->files()) {
    if (isExcluded(entry.path, prefixes)) {
      spdlog::debug("Excluding {}", entry.path);
      ++result.stats.excluded;
      continue;
    }

    auto data = reader->extractToMemory(entry, &error);
    if (!data) {
      warn(result, fmt::format("Error copying file '{}': {}", entry.path, error));
      ++result.stats.skipped;
      continue;
    }

    if (!writer.addEntry(entry, *data, &error)) {
      warn(result, fmt::format("Error copying file '{}': {}", entry.path, error));
      ++result.stats.skipped;
      continue;
    }
    ++result.stats.copied;
  }

  for (const auto &prefix : prefixes) {
    std::string keep = placeholderName(prefix);
    if (!writer.addFile({}, keep, &error)) {
      warn(result, fmt::format("Error adding placeholder file '{}': {}", keep, error));
      continue;
    }
    spdlog::info("Added placeholder file to: '{}'", keep);
    ++result.stats.placeholders;
  }

  // Release the source mapping before the caller replaces the file
  reader->close();

  if (!writer.write(dest, &error)) {
    auto message = fmt::format("An error occurred while writing {}: {}", dest, error);
    spdlog::error("{}", message);
    result.error = ErrorKind::IO;
    result.message = std::move(message);
    return result;
  }

  return result;
}

OperationResult backupAndStrip(const SwapConfig &config) {
  try {
    return stripImpl(config);
  } catch (const std::exception &e) {
    return failure(ErrorKind::IO,
                   fmt::format("Unexpected error while stripping {}: {}", config.archivePath,
                               e.what()));
  }
}

OperationResult restore(const SwapConfig &config) {
  try {
    return restoreImpl(config);
  } catch (const std::exception &e) {
    return failure(ErrorKind::IO,
                   fmt::format("Unexpected error while restoring {}: {}", config.archivePath,
                               e.what()));
  }
}

SwapState queryState(const SwapConfig &config) {
  std::error_code ec;
  bool haveArchive = fs::exists(config.archivePath, ec);
  bool haveBackup = fs::exists(config.backupPath, ec);

  if (haveArchive) {
    return haveBackup ? SwapState::StrippedWithBackup : SwapState::Original;
  }
  return haveBackup ? SwapState::BackupOnly : SwapState::Missing;
}

} // namespace pk3
