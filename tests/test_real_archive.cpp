#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <pk3/reader.hpp>
#include <pk3/swapper.hpp>

#include <gtest/gtest.h>

// Fallback if TEST_DATA_DIR is not defined by CMake
#ifndef TEST_DATA_DIR
#define TEST_DATA_DIR "tests/data"
#endif

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> readFile(const fs::path &path) {
  std::ifstream stream(path, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(stream)),
                              std::istreambuf_iterator<char>());
}

} // namespace

// sample.pk3 was produced by an independent ZIP implementation. It holds
// deflated and stored entries, a directory record and an archive comment.
TEST(RealArchiveTest, ListsAllEntries) {
  fs::path archivePath = fs::path(TEST_DATA_DIR) / "sample.pk3";
  ASSERT_TRUE(fs::exists(archivePath)) << "Archive file not found: " << archivePath;

  std::string error;
  auto reader = pk3::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << "Failed to open archive: " << error;

  std::vector<std::string> names;
  for (const auto &file : reader->files()) {
    names.push_back(file.path);
  }

  std::vector<std::string> expected = {
      "ext_data/",
      "ext_data/mb2/character/jedi.mbch",
      "ext_data/mb2/teamconfig/rebels.mbtc",
      "models/players/readme.txt",
      "shaders/base.shader",
  };
  EXPECT_EQ(names, expected);

  EXPECT_TRUE(reader->findFile("ext_data/")->isDirectory());
  EXPECT_EQ(reader->findFile("shaders/base.shader")->method, pk3::zip::methodDeflate);
  EXPECT_EQ(reader->findFile("models/players/readme.txt")->method, pk3::zip::methodStored);
}

TEST(RealArchiveTest, ExtractAndVerifyAgainstReference) {
  fs::path testDataDir(TEST_DATA_DIR);
  fs::path archivePath = testDataDir / "sample.pk3";
  fs::path referenceFile = testDataDir / "base.shader";

  ASSERT_TRUE(fs::exists(archivePath)) << "Archive file not found: " << archivePath;
  ASSERT_TRUE(fs::exists(referenceFile)) << "Reference file not found: " << referenceFile;

  std::string error;
  auto reader = pk3::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << "Failed to open archive: " << error;

  const auto *entry = reader->findFile("shaders/base.shader");
  ASSERT_NE(entry, nullptr);

  auto extracted = reader->extractToMemory(*entry, &error);
  ASSERT_TRUE(extracted.has_value()) << "Failed to extract file: " << error;

  auto reference = readFile(referenceFile);
  ASSERT_EQ(extracted->size(), reference.size());
  EXPECT_EQ(*extracted, reference) << "Extracted content does not match reference file";
}

// Every entry of the foreign archive decodes with a matching CRC
TEST(RealArchiveTest, AllEntriesDecode) {
  fs::path archivePath = fs::path(TEST_DATA_DIR) / "sample.pk3";

  std::string error;
  auto reader = pk3::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error;

  for (const auto &file : reader->files()) {
    auto data = reader->extractToMemory(file, &error);
    ASSERT_TRUE(data.has_value()) << file.path << ": " << error;
    EXPECT_EQ(data->size(), file.size) << file.path;
  }
}

// Strip a copy of the fixture and restore it
TEST(RealArchiveTest, StripAndRestoreCopy) {
  fs::path workDir = fs::temp_directory_path() / "pk3_test_real_archive";
  fs::remove_all(workDir);
  fs::create_directories(workDir);

  fs::path archivePath = workDir / "MBAssets3.pk3";
  fs::copy_file(fs::path(TEST_DATA_DIR) / "sample.pk3", archivePath);
  auto original = readFile(archivePath);

  auto config = pk3::SwapConfig::forArchive(
      archivePath, {"ext_data/mb2/character/", "ext_data/mb2/teamconfig/"});

  auto stripped = pk3::backupAndStrip(config);
  ASSERT_TRUE(stripped.succeeded()) << stripped.message;
  EXPECT_TRUE(stripped.warnings.empty());
  EXPECT_EQ(stripped.stats.copied, 3);
  EXPECT_EQ(stripped.stats.excluded, 2);

  std::string error;
  {
    auto reader = pk3::Reader::open(archivePath, &error);
    ASSERT_TRUE(reader.has_value()) << error;
    EXPECT_NE(reader->findFile("ext_data/"), nullptr);
    EXPECT_NE(reader->findFile("ext_data/mb2/character/.keep"), nullptr);
    EXPECT_EQ(reader->findFile("ext_data/mb2/character/jedi.mbch"), nullptr);

    // Carried-over entries keep their original timestamp
    const auto *shader = reader->findFile("shaders/base.shader");
    ASSERT_NE(shader, nullptr);
    EXPECT_EQ(shader->modDate, ((2024 - 1980) << 9) | (5 << 5) | 17);
    EXPECT_EQ(shader->modTime, (12 << 11) | (30 << 5) | 5);
  }

  auto restored = pk3::restore(config);
  ASSERT_TRUE(restored.succeeded()) << restored.message;
  EXPECT_EQ(readFile(archivePath), original);

  fs::remove_all(workDir);
}
