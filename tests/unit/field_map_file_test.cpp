#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/config/field_map_file.hpp"
#include "bitlens/field/field_map.hpp"

namespace bitlens::config {
namespace {

TEST(FieldMapFileTest, DecodesTopLevelArray) {
  auto defs = DecodeFieldMap(
      R"([
        {"name": "opcode", "low": 8, "high": 12},
        {"name": "en", "bit": 0}
      ])",
      "test");
  ASSERT_TRUE(defs.has_value()) << defs.error().message;
  ASSERT_EQ(defs->size(), 2);
  EXPECT_EQ((*defs)[0].name, "opcode");
  EXPECT_EQ((*defs)[0].low, 8);
  EXPECT_EQ((*defs)[0].high, 12);
  EXPECT_FALSE((*defs)[0].bit.has_value());
  EXPECT_EQ((*defs)[1].bit, 0);
}

TEST(FieldMapFileTest, DecodesFieldsObjectWithComments) {
  auto defs = DecodeFieldMap(
      R"({
        // control register
        "fields": [
          {"name": "mode", "low": 0, "high": 1} /* two bits */
        ]
      })",
      "test");
  ASSERT_TRUE(defs.has_value()) << defs.error().message;
  ASSERT_EQ(defs->size(), 1);
  EXPECT_EQ((*defs)[0].name, "mode");
}

TEST(FieldMapFileTest, SyntaxErrorIsHostError) {
  auto defs = DecodeFieldMap("[{\"name\": ", "broken.jsonc");
  ASSERT_FALSE(defs.has_value());
  EXPECT_EQ(defs.error().kind, DiagKind::kHostError);
  EXPECT_NE(defs.error().message.find("broken.jsonc"), std::string::npos);
}

TEST(FieldMapFileTest, WrongShapesAreInvalidFieldMap) {
  for (const char* text :
       {R"({"other": []})", R"("fields")", R"([42])", R"([{"low": 1}])",
        R"([{"name": "x", "low": "1", "high": 2}])",
        R"([{"name": "x", "bit": 1.5}])"}) {
    auto defs = DecodeFieldMap(text, "test");
    ASSERT_FALSE(defs.has_value()) << text;
    EXPECT_EQ(defs.error().kind, DiagKind::kInvalidFieldMap) << text;
  }
}

TEST(FieldMapFileTest, NegativeBoundsPassThroughForValidation) {
  auto defs = DecodeFieldMap(R"([{"name": "neg", "low": -1, "high": 3}])", "t");
  ASSERT_TRUE(defs.has_value());
  EXPECT_EQ((*defs)[0].low, -1);

  auto map = field::LoadFieldMap(*defs);
  ASSERT_FALSE(map.has_value());
  EXPECT_EQ(map.error().kind, DiagKind::kInvalidFieldMap);
}

TEST(FieldMapFileTest, HugeBoundIsRejected) {
  auto defs = DecodeFieldMap(
      R"([{"name": "huge", "bit": 18446744073709551615}])", "t");
  ASSERT_FALSE(defs.has_value());
  EXPECT_NE(defs.error().message.find("out of range"), std::string::npos);
}

TEST(FieldMapFileTest, ReadFromDisk) {
  auto dir = std::filesystem::temp_directory_path() / "bitlens_field_map_test";
  std::filesystem::create_directories(dir);
  auto path = dir / "fields.jsonc";
  {
    std::ofstream out(path);
    out << R"({"fields": [{"name": "nibble", "low": 0, "high": 3}]})";
  }

  auto defs = ReadFieldMapFile(path);
  ASSERT_TRUE(defs.has_value()) << defs.error().message;
  EXPECT_EQ(defs->size(), 1);

  std::filesystem::remove_all(dir);
}

TEST(FieldMapFileTest, MissingFileIsHostError) {
  auto defs = ReadFieldMapFile("/nonexistent/bitlens/fields.jsonc");
  ASSERT_FALSE(defs.has_value());
  EXPECT_EQ(defs.error().kind, DiagKind::kHostError);
}

}  // namespace
}  // namespace bitlens::config
