#include <labelnorm/app/config.hpp>
#include <labelnorm/app/label_io.hpp>
#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_record.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace na = labelnorm::app;
namespace nc = labelnorm::core;

namespace {

std::filesystem::path temp_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("labelnorm_io_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string slurp(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  std::ostringstream buf;
  buf << f.rdbuf();
  return buf.str();
}

const std::vector<nc::LabelRecord> kRecords = {
    {"1L PET PUR JUS POMME CRF EXTRA", "CRF PET PUR JUS POMME EXTRA 1L", false},
    {"Sauce \"maison\" 1,5L", "SAUCE MAISON 1,5L", false},
};

}  // namespace

TEST(LabelIo, ParseLabelsTrimsAndDropsBlankLines) {
  EXPECT_EQ(na::parse_labels("a\r\n\n  b  \n\n"), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(na::parse_labels("single"), (std::vector<std::string>{"single"}));
  EXPECT_TRUE(na::parse_labels("").empty());
  EXPECT_TRUE(na::parse_labels("\n \n\t\n").empty());
}

TEST(LabelIo, ReadLabelsFromFile) {
  const auto dir = temp_dir("read");
  const auto path = dir / "labels.txt";
  {
    std::ofstream f(path, std::ios::binary);
    f << "6X30G CHIPS LISSE NAT CRF CLAS\r\n\r\nDésodorisant 2.5ml 4scent\n";
  }
  auto labels = na::read_labels(path.string());
  ASSERT_TRUE(labels.has_value());
  EXPECT_EQ(*labels, (std::vector<std::string>{"6X30G CHIPS LISSE NAT CRF CLAS",
                                               "Désodorisant 2.5ml 4scent"}));
  std::filesystem::remove_all(dir);
}

TEST(LabelIo, ReadLabelsMissingFile) {
  auto labels = na::read_labels("/nonexistent/labels.txt");
  ASSERT_FALSE(labels.has_value());
  EXPECT_EQ(labels.error(), nc::LabelError::LoadFailed);
}

TEST(LabelIo, WriteTsv) {
  std::ostringstream out;
  na::write_records(out, kRecords, na::ExportFormat::Tsv);
  EXPECT_EQ(out.str(),
            "Libellé Original\tLibellé Corrigé\n"
            "1L PET PUR JUS POMME CRF EXTRA\tCRF PET PUR JUS POMME EXTRA 1L\n"
            "Sauce \"maison\" 1,5L\tSAUCE MAISON 1,5L\n");
}

TEST(LabelIo, WriteCsvQuotesFields) {
  std::ostringstream out;
  na::write_records(out, kRecords, na::ExportFormat::Csv, false);
  EXPECT_EQ(out.str(),
            "\"1L PET PUR JUS POMME CRF EXTRA\",\"CRF PET PUR JUS POMME EXTRA 1L\"\n"
            "\"Sauce \"\"maison\"\" 1,5L\",\"SAUCE MAISON 1,5L\"\n");
}

TEST(LabelIo, ExportCreatesDirectories) {
  const auto dir = temp_dir("export");
  const auto path = dir / "nested" / "out.csv";
  auto written = na::export_records(path.string(), kRecords, na::ExportFormat::Csv);
  ASSERT_TRUE(written.has_value());
  const std::string text = slurp(path);
  EXPECT_EQ(text.rfind("Libellé Original,Libellé Corrigé\n", 0), 0u);
  std::filesystem::remove_all(dir);
}

TEST(LabelIo, ExportToDirectoryFails) {
  const auto dir = temp_dir("export_fail");
  auto written = na::export_records(dir.string(), kRecords, na::ExportFormat::Tsv);
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error(), nc::LabelError::WriteFailed);
  std::filesystem::remove_all(dir);
}
