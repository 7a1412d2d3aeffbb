#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace bitlens::test {
namespace {

class ConfigTest : public CliTestFixture {};

// Test: bitlens.toml display settings apply without flags
TEST_F(ConfigTest, DisplaySettingsFromConfig) {
  WriteBitlensToml(R"([display]
format = "bin"
align = "byte_align"
)");

  auto result = Run({"show", "0x1234"});

  EXPECT_TRUE(result.Success()) << result.stderr_output;
  EXPECT_EQ(result.stdout_output, "16'b00010010_00110100\n");
}

// Test: flags win over bitlens.toml
TEST_F(ConfigTest, FlagsOverrideConfig) {
  WriteBitlensToml("[display]\nformat = \"bin\"\n");

  auto result = Run({"show", "--format", "hex", "0x1234"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "16'h12_34\n");
}

// Test: input radix from bitlens.toml
TEST_F(ConfigTest, InputRadixFromConfig) {
  WriteBitlensToml("[input]\nradix = \"bin\"\n");

  auto result = Run({"show", "--format", "dec", "1010"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "10\n");
}

// Test: config found from a nested directory
TEST_F(ConfigTest, ConfigFoundFromSubdirectory) {
  WriteBitlensToml("[display]\nformat = \"dec\"\n");
  WriteFile("a/b/.keep", "");

  auto result = RunIn(TestDir() / "a" / "b", {"show", "0xff"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "255\n");
}

// Test: field map path is relative to bitlens.toml
TEST_F(ConfigTest, FieldMapFromConfig) {
  WriteBitlensToml("[fields]\nmap = \"regs/ctrl.jsonc\"\n");
  WriteFile(
      "regs/ctrl.jsonc", R"({"fields": [{"name": "lo", "low": 0, "high": 3}]})");
  WriteFile("work/.keep", "");

  auto result = RunIn(TestDir() / "work", {"extract", "8'hA3", "lo"});

  EXPECT_TRUE(result.Success()) << result.stderr_output;
  EXPECT_EQ(result.stdout_output, "bit 3-0 [lo] = 4'b0011 (dec = 3)\n");
}

// Test: malformed bitlens.toml is reported
TEST_F(ConfigTest, MalformedConfig) {
  WriteBitlensToml("[display\n");

  auto result = Run({"show", "1"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.stderr_output.find("bitlens: error:"), std::string::npos);
}

// Test: unknown alignment value in bitlens.toml
TEST_F(ConfigTest, UnknownAlignmentInConfig) {
  WriteBitlensToml("[display]\nalign = \"qword\"\n");

  auto result = Run({"show", "1"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.stderr_output.find("qword"), std::string::npos);
}

// Test: max_width too narrow for the built-in map
TEST_F(ConfigTest, NarrowMaxWidthRejectsBuiltinMap) {
  WriteBitlensToml("[fields]\nmax_width = 16\n");

  auto result = Run({"fields"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.stderr_output.find("needs max_width of at least 32"),
      std::string::npos);
}

}  // namespace
}  // namespace bitlens::test
