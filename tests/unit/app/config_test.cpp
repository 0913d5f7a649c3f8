#include <labelnorm/app/config.hpp>
#include <labelnorm/core/error.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace na = labelnorm::app;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / ("labelnorm_config_" + name);
  std::ofstream f(path);
  f << content;
  return path;
}

}  // namespace

TEST(Config, Defaults) {
  const auto c = na::default_config();
  const std::vector<std::string> brands = {"CRF", "CARF", "CARREFOUR", "PAPERMATE",
                                           "PM", "SHARPIE", "ROTRING"};
  EXPECT_EQ(c.brands, brands);
  EXPECT_EQ(c.pacing_min_ms, 0u);
  EXPECT_EQ(c.pacing_max_ms, 0u);
  EXPECT_EQ(c.export_format, na::ExportFormat::Tsv);
  EXPECT_TRUE(c.write_header);
  EXPECT_EQ(c.preview_count, 5u);
  EXPECT_TRUE(na::validate_config(c).has_value());
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = na::load_config("/nonexistent/labelnorm.conf");
  EXPECT_EQ(c.brands.size(), 7u);
  EXPECT_EQ(c.export_format, na::ExportFormat::Tsv);
}

TEST(Config, LoadsKeys) {
  const auto path = write_temp("keys.conf",
                               "# catalog\n"
                               "brands = acme, CRF ,\n"
                               "pacing_min_ms=200\n"
                               "pacing_max_ms = 500\n"
                               "export_format = CSV\n"
                               "write_header = false\n"
                               "preview_count = 3\n"
                               "unknown_key = 1\n"
                               "no equals sign here\n");
  const auto c = na::load_config(path.string());
  EXPECT_EQ(c.brands, (std::vector<std::string>{"acme", "CRF"}));
  EXPECT_EQ(c.pacing_min_ms, 200u);
  EXPECT_EQ(c.pacing_max_ms, 500u);
  EXPECT_EQ(c.export_format, na::ExportFormat::Csv);
  EXPECT_FALSE(c.write_header);
  EXPECT_EQ(c.preview_count, 3u);
  EXPECT_TRUE(na::validate_config(c).has_value());
  std::filesystem::remove(path);
}

TEST(Config, UnknownFormatKeepsDefault) {
  const auto path = write_temp("format.conf", "export_format = xlsx\n");
  EXPECT_EQ(na::load_config(path.string()).export_format, na::ExportFormat::Tsv);
  std::filesystem::remove(path);
}

TEST(Config, MalformedNumberThrows) {
  const auto path = write_temp("bad.conf", "pacing_min_ms = soon\n");
  EXPECT_THROW(na::load_config(path.string()), std::invalid_argument);
  std::filesystem::remove(path);
}

TEST(Config, ValidateRejects) {
  auto c = na::default_config();
  c.pacing_min_ms = 500;
  c.pacing_max_ms = 200;
  auto r = na::validate_config(c);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), labelnorm::core::LabelError::InvalidConfig);

  c = na::default_config();
  c.brands = {" ", ""};
  EXPECT_FALSE(na::validate_config(c).has_value());
}

TEST(Config, ParseExportFormat) {
  EXPECT_EQ(na::parse_export_format("tsv"), na::ExportFormat::Tsv);
  EXPECT_EQ(na::parse_export_format("Csv"), na::ExportFormat::Csv);
  EXPECT_FALSE(na::parse_export_format("xlsx").has_value());
}
