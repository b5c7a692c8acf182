#include <string>
#include <vector>

#include <pk3/deflate.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> bytes(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

// Reference value from the ZIP appnote / zlib
TEST(DeflateTest, Crc32KnownValue) {
  EXPECT_EQ(pk3::crc32(bytes("123456789")), 0xCBF43926u);
  EXPECT_EQ(pk3::crc32({}), 0u);
}

TEST(DeflateTest, CompressesRepetitiveData) {
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "ext_data/mb2/character/trooper.mbch\n";
  }
  auto input = bytes(text);

  std::string error;
  auto compressed = pk3::deflateRaw(input, &error);
  ASSERT_TRUE(compressed.has_value()) << error;
  EXPECT_LT(compressed->size(), input.size() / 4);

  auto restored = pk3::inflateRaw(*compressed, input.size(), &error);
  ASSERT_TRUE(restored.has_value()) << error;
  EXPECT_EQ(*restored, input);
}

// An empty input still produces a valid (tiny) deflate stream
TEST(DeflateTest, EmptyInput) {
  std::string error;
  auto compressed = pk3::deflateRaw({}, &error);
  ASSERT_TRUE(compressed.has_value()) << error;
  EXPECT_FALSE(compressed->empty());

  auto restored = pk3::inflateRaw(*compressed, 0, &error);
  ASSERT_TRUE(restored.has_value()) << error;
  EXPECT_TRUE(restored->empty());
}

TEST(DeflateTest, InflateRejectsWrongSize) {
  auto input = bytes("The quick brown fox jumps over the lazy dog");
  std::string error;
  auto compressed = pk3::deflateRaw(input, &error);
  ASSERT_TRUE(compressed.has_value()) << error;

  EXPECT_FALSE(pk3::inflateRaw(*compressed, input.size() + 5, &error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(pk3::inflateRaw(*compressed, input.size() - 5, &error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(DeflateTest, InflateRejectsGarbage) {
  std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x12, 0x34};
  std::string error;
  EXPECT_FALSE(pk3::inflateRaw(garbage, 64, &error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(DeflateTest, InflateRejectsTruncatedStream) {
  std::vector<uint8_t> input(4096);
  for (size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<uint8_t>((i * 7919) % 256);
  }

  std::string error;
  auto compressed = pk3::deflateRaw(input, &error);
  ASSERT_TRUE(compressed.has_value()) << error;
  compressed->resize(compressed->size() / 2);

  EXPECT_FALSE(pk3::inflateRaw(*compressed, input.size(), &error).has_value());
}
