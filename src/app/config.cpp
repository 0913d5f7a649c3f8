#include <labelnorm/app/config.hpp>
#include <labelnorm/text/brand_catalog.hpp>
#include <labelnorm/text/word_ops.hpp>
#include <fstream>
#include <sstream>
#include <string_view>

namespace labelnorm::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> split_brands(const std::string& value) {
  std::vector<std::string> out;
  std::istringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool parse_bool(const std::string& value, bool fallback) {
  const std::string v = labelnorm::text::to_upper(value);
  if (v == "TRUE" || v == "1" || v == "YES") return true;
  if (v == "FALSE" || v == "0" || v == "NO") return false;
  return fallback;
}

}  // namespace

LabelConfig default_config() {
  LabelConfig c;
  c.brands = labelnorm::text::BrandCatalog::default_catalog().brands();
  c.pacing_min_ms = 0;
  c.pacing_max_ms = 0;
  c.export_format = ExportFormat::Tsv;
  c.write_header = true;
  c.preview_count = 5;
  return c;
}

std::expected<ExportFormat, labelnorm::core::LabelError> parse_export_format(
    const std::string& value) {
  const std::string v = labelnorm::text::to_upper(value);
  if (v == "TSV") return ExportFormat::Tsv;
  if (v == "CSV") return ExportFormat::Csv;
  return std::unexpected(labelnorm::core::LabelError::InvalidConfig);
}

LabelConfig load_config(const std::string& path) {
  LabelConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "brands") c.brands = split_brands(value);
    else if (key == "pacing_min_ms") c.pacing_min_ms = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "pacing_max_ms") c.pacing_max_ms = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "export_format") {
      if (auto fmt = parse_export_format(value)) c.export_format = *fmt;
    }
    else if (key == "write_header") c.write_header = parse_bool(value, c.write_header);
    else if (key == "preview_count") c.preview_count = static_cast<std::uint32_t>(std::stoul(value));
  }
  return c;
}

std::expected<void, labelnorm::core::LabelError> validate_config(const LabelConfig& config) {
  if (labelnorm::text::BrandCatalog(config.brands).empty()) {
    return std::unexpected(labelnorm::core::LabelError::InvalidConfig);
  }
  if (config.pacing_min_ms > config.pacing_max_ms) {
    return std::unexpected(labelnorm::core::LabelError::InvalidConfig);
  }
  return {};
}

}  // namespace labelnorm::app
