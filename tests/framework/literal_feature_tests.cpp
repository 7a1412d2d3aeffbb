#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "bitlens/analysis/comparator.hpp"
#include "bitlens/analysis/extractor.hpp"
#include "bitlens/common/diagnostic.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/renderer.hpp"
#include "bitlens/value/literal_parser.hpp"
#include "tests/framework/test_case.hpp"
#include "tests/framework/yaml_loader.hpp"

namespace bitlens::test {
namespace {

// e.g., "tests/cases/render.yaml" -> "render"
auto ExtractCategory(const std::filesystem::path& yaml_path) -> std::string {
  return yaml_path.stem().string();
}

// Get YAML file paths to load test cases from.
// Priority:
// 1. BITLENS_CASES_YAML env var (single file)
// 2. BITLENS_CASES_DIR env var
// 3. Case directory compiled in by the build
auto GetYamlPaths() -> std::vector<std::filesystem::path> {
  if (const char* yaml_path = std::getenv("BITLENS_CASES_YAML")) {
    return {yaml_path};
  }

  std::filesystem::path yaml_dir;
  if (const char* cases_dir = std::getenv("BITLENS_CASES_DIR")) {
    yaml_dir = cases_dir;
  } else {
#ifdef BITLENS_DEFAULT_CASES_DIR
    yaml_dir = BITLENS_DEFAULT_CASES_DIR;
#else
    throw std::runtime_error(
        "Neither BITLENS_CASES_YAML nor BITLENS_CASES_DIR set");
#endif
  }

  std::vector<std::filesystem::path> yaml_paths;
  for (const auto& entry :
       std::filesystem::recursive_directory_iterator(yaml_dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
      yaml_paths.push_back(entry.path());
    }
  }

  // Sort for deterministic test order
  std::ranges::sort(yaml_paths);
  return yaml_paths;
}

auto KindName(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kInvalidLiteral:
      return "invalid_literal";
    case DiagKind::kInvalidFieldMap:
      return "invalid_field_map";
    case DiagKind::kFieldNotFound:
      return "field_not_found";
    case DiagKind::kRangeOutOfBounds:
      return "range_out_of_bounds";
    case DiagKind::kHostError:
      return "host_error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "unknown";
}

void AssertOutput(const std::string& actual, const ExpectedOutput& expected) {
  if (expected.IsExact()) {
    EXPECT_EQ(actual, expected.exact.value());
    return;
  }
  for (const auto& substring : expected.contains) {
    EXPECT_TRUE(actual.find(substring) != std::string::npos)
        << "Expected output to contain: \"" << substring << "\"\n"
        << "Actual output: \"" << actual << "\"";
  }
  for (const auto& substring : expected.not_contains) {
    EXPECT_TRUE(actual.find(substring) == std::string::npos)
        << "Expected output not to contain: \"" << substring << "\"\n"
        << "Actual output: \"" << actual << "\"";
  }
}

void AssertError(const Diagnostic& actual, const ExpectedError& expected) {
  if (expected.kind.has_value()) {
    EXPECT_EQ(KindName(actual.kind), *expected.kind);
  }
  if (expected.message.has_value()) {
    EXPECT_EQ(actual.message, *expected.message);
  }
  if (expected.subject.has_value()) {
    EXPECT_EQ(actual.subject, *expected.subject);
  }
}

class LiteralFeatureTest : public testing::TestWithParam<LiteralCase> {};

TEST_P(LiteralFeatureTest, Evaluate) {
  const auto& tc = GetParam();
  SCOPED_TRACE(tc.source_yaml);

  auto parsed = value::Parse(tc.input, tc.parse);
  bool expect_parse_error =
      tc.expected_error.has_value() && !tc.extract.has_value();
  if (expect_parse_error) {
    ASSERT_FALSE(parsed.has_value())
        << "Expected parse failure, got " << DebugString(*parsed);
    AssertError(parsed.error(), *tc.expected_error);
    return;
  }
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

  if (tc.expected_width.has_value()) {
    EXPECT_EQ(parsed->BitWidth(), *tc.expected_width);
  }
  if (tc.expected_value.has_value()) {
    EXPECT_EQ(parsed->Magnitude().ToDecimalString(), *tc.expected_value);
  }
  if (tc.expected_render.has_value()) {
    EXPECT_EQ(render::Render(*parsed, tc.display), *tc.expected_render);
  }
  if (tc.expected_breakdown.has_value()) {
    AssertOutput(
        render::RenderBreakdown(*parsed, tc.display), *tc.expected_breakdown);
  }

  if (tc.extract.has_value()) {
    auto extracted =
        analysis::ExtractRange(*parsed, tc.extract->low, tc.extract->high);
    if (tc.expected_error.has_value()) {
      ASSERT_FALSE(extracted.has_value());
      AssertError(extracted.error(), *tc.expected_error);
    } else {
      ASSERT_TRUE(extracted.has_value()) << extracted.error().message;
      EXPECT_EQ(extracted->BitWidth(), tc.extract->Width());
      if (tc.expected_extracted.has_value()) {
        EXPECT_EQ(
            extracted->Magnitude().ToDecimalString(), *tc.expected_extracted);
      }
    }
  }

  if (tc.compare_with.has_value()) {
    auto other = value::Parse(*tc.compare_with, tc.parse);
    ASSERT_TRUE(other.has_value()) << other.error().message;
    auto diff = analysis::Compare(*parsed, *other, field::DefaultFieldMap());
    if (tc.expected_diff.has_value()) {
      AssertOutput(analysis::FormatDiff(diff, tc.display), *tc.expected_diff);
    }
  }
}

auto LoadTestCases() -> std::vector<LiteralCase> {
  std::vector<LiteralCase> all_cases;
  auto yaml_paths = GetYamlPaths();

  for (const auto& yaml_path : yaml_paths) {
    auto cases = LoadLiteralCasesFromYaml(yaml_path.string());
    auto category = ExtractCategory(yaml_path);

    // Prefix test names with category for uniqueness across YAML files
    for (auto& tc : cases) {
      tc.name = category + "_" + tc.name;
    }

    all_cases.insert(
        all_cases.end(), std::make_move_iterator(cases.begin()),
        std::make_move_iterator(cases.end()));
  }

  return all_cases;
}

INSTANTIATE_TEST_SUITE_P(
    LiteralFeatures, LiteralFeatureTest, testing::ValuesIn(LoadTestCases()),
    [](const testing::TestParamInfo<LiteralCase>& info) {
      return info.param.name;
    });

}  // namespace
}  // namespace bitlens::test
