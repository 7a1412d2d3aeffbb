#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace bitlens::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string stdout_output;
  std::string stderr_output;
  std::string combined_output;  // stdout followed by stderr

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Test fixture for CLI integration tests
//
// Provides utilities for:
// - Running the bitlens binary with arguments, optionally feeding stdin
// - Managing temporary directories for test isolation
// - Creating test files (bitlens.toml, field maps)
//
// Usage:
//   TEST_F(CliTest, MyTest) {
//     auto result = Run({"show", "8'hA3"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run bitlens with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run bitlens from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, std::initializer_list<std::string> args)
      -> CliResult;

  // Run bitlens with `input` on stdin (never a terminal)
  auto RunWithInput(
      std::initializer_list<std::string> args, const std::string& input)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a bitlens.toml in the test directory
  void WriteBitlensToml(const std::string& content);

  // Get path to test directory
  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path bitlens_bin_;

  auto RunImpl(
      const std::filesystem::path& working_dir,
      const std::vector<std::string>& args,
      const std::optional<std::string>& input) -> CliResult;
};

}  // namespace bitlens::test
