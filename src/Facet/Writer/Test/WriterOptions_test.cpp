//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <Facet/Testing/GTest.h>

#include <Facet/Writer/WriterOptions.h>

namespace {

using facet::writer::ContainerMode;
using facet::writer::ResourceCategory;
using facet::writer::WriterOptions;
using nlohmann::json;
using testing::HasSubstr;

//=== FromJson ===------------------------------------------------------------//

//! An empty document keeps every default.
NOLINT_TEST(WriterOptionsTest, FromJson_Empty_UsesDefaults)
{
  std::ostringstream errors;

  const auto options = WriterOptions::FromJson(json::object(), errors);

  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->container_mode, ContainerMode::kExternal);
  EXPECT_EQ(options->image_basename, "texture");
  EXPECT_EQ(options->buffer_basename, "buffer");
  EXPECT_TRUE(options->multiple_images);
  EXPECT_FALSE(options->multiple_buffers);
  EXPECT_EQ(options->blob_alignment, 1U);
  EXPECT_TRUE(errors.str().empty());
}

NOLINT_TEST(WriterOptionsTest, FromJson_AllKeys_AreApplied)
{
  // Arrange
  const json data = {
    { "container", "embedded" },
    { "image_basename", "img" },
    { "buffer_basename", "scene" },
    { "multiple_images", false },
    { "multiple_buffers", true },
    { "blob_alignment", 4 },
  };
  std::ostringstream errors;

  // Act
  const auto options = WriterOptions::FromJson(data, errors);

  // Assert
  ASSERT_TRUE(options.has_value()) << errors.str();
  EXPECT_EQ(options->container_mode, ContainerMode::kEmbedded);
  EXPECT_EQ(options->BasenameFor(ResourceCategory::kImage), "img");
  EXPECT_EQ(options->BasenameFor(ResourceCategory::kBuffer), "scene");
  EXPECT_FALSE(options->MultipleFor(ResourceCategory::kImage));
  EXPECT_TRUE(options->MultipleFor(ResourceCategory::kBuffer));
  EXPECT_EQ(options->blob_alignment, 4U);
}

NOLINT_TEST(WriterOptionsTest, FromJson_UnknownContainer_Fails)
{
  std::ostringstream errors;

  const auto options
    = WriterOptions::FromJson(json { { "container", "zip" } }, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("ERROR"));
}

NOLINT_TEST(WriterOptionsTest, FromJson_UnknownKey_Fails)
{
  std::ostringstream errors;

  const auto options
    = WriterOptions::FromJson(json { { "compression", true } }, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("ERROR"));
}

NOLINT_TEST(WriterOptionsTest, FromJson_WrongType_Fails)
{
  std::ostringstream errors;

  const auto options
    = WriterOptions::FromJson(json { { "multiple_images", "yes" } }, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("ERROR"));
}

//! Base names must be non-empty and must not contain a path separator.
NOLINT_TEST(WriterOptionsTest, FromJson_BadBasename_Fails)
{
  std::ostringstream empty_errors;
  std::ostringstream path_errors;

  EXPECT_FALSE(
    WriterOptions::FromJson(json { { "image_basename", "" } }, empty_errors)
      .has_value());
  EXPECT_FALSE(WriterOptions::FromJson(
    json { { "buffer_basename", "out/scene" } }, path_errors)
      .has_value());
  EXPECT_THAT(empty_errors.str(), HasSubstr("ERROR"));
  EXPECT_THAT(path_errors.str(), HasSubstr("ERROR"));
}

//! Each violation gets its own line, naming the offending key.
NOLINT_TEST(WriterOptionsTest, FromJson_SeveralViolations_ReportsEach)
{
  const json data = {
    { "container", "zip" },
    { "multiple_buffers", 1 },
  };
  std::ostringstream errors;

  EXPECT_FALSE(WriterOptions::FromJson(data, errors).has_value());

  const auto text = errors.str();
  EXPECT_THAT(text, HasSubstr("/container"));
  EXPECT_THAT(text, HasSubstr("/multiple_buffers"));
  size_t lines = 0;
  for (size_t pos = text.find("ERROR:"); pos != std::string::npos;
    pos = text.find("ERROR:", pos + 1)) {
    ++lines;
  }
  EXPECT_GE(lines, 2U);
}

NOLINT_TEST(WriterOptionsTest, FromJson_NonPowerOfTwoAlignment_Fails)
{
  std::ostringstream errors;

  const auto options
    = WriterOptions::FromJson(json { { "blob_alignment", 12 } }, errors);

  EXPECT_FALSE(options.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("power of two"));
}

NOLINT_TEST(WriterOptionsTest, FromJson_ZeroAlignment_Fails)
{
  std::ostringstream errors;

  EXPECT_FALSE(WriterOptions::FromJson(json { { "blob_alignment", 0 } }, errors)
      .has_value());
  EXPECT_THAT(errors.str(), HasSubstr("ERROR"));
}

//=== Load ===----------------------------------------------------------------//

class WriterOptionsFileTest : public testing::Test {
protected:
  void SetUp() override
  {
    dir_ = std::filesystem::temp_directory_path()
      / "facet_writer_options_tests";
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  auto WriteFile(const std::string& name, const std::string& content)
    -> std::filesystem::path
  {
    const auto path = dir_ / name;
    std::ofstream out(path);
    out << content;
    return path;
  }

  std::filesystem::path dir_;
};

NOLINT_TEST_F(WriterOptionsFileTest, Load_ValidFile_ReturnsOptions)
{
  const auto path = WriteFile("options.json",
    R"({ "container": "embedded", "blob_alignment": 8 })");
  std::ostringstream errors;

  const auto options = WriterOptions::Load(path, errors);

  ASSERT_TRUE(options.has_value()) << errors.str();
  EXPECT_EQ(options->container_mode, ContainerMode::kEmbedded);
  EXPECT_EQ(options->blob_alignment, 8U);
}

NOLINT_TEST_F(WriterOptionsFileTest, Load_MalformedJson_Fails)
{
  const auto path = WriteFile("broken.json", R"({ "container": )");
  std::ostringstream errors;

  EXPECT_FALSE(WriterOptions::Load(path, errors).has_value());
  EXPECT_THAT(errors.str(), HasSubstr("invalid writer options JSON"));
}

NOLINT_TEST_F(WriterOptionsFileTest, Load_MissingFile_Fails)
{
  std::ostringstream errors;

  EXPECT_FALSE(
    WriterOptions::Load(dir_ / "does_not_exist.json", errors).has_value());
  EXPECT_THAT(errors.str(), HasSubstr("failed to open"));
}

} // namespace
