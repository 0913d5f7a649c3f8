#include <labelnorm/app/label_io.hpp>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace labelnorm::app {

namespace {

std::string_view trim_view(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string csv_quote(std::string_view field) {
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

}  // namespace

std::vector<std::string> parse_labels(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const auto nl = text.find('\n', pos);
    const auto line = trim_view(text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos));
    if (!line.empty()) out.emplace_back(line);
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  return out;
}

std::expected<std::vector<std::string>, labelnorm::core::LabelError> read_labels(
    const std::string& path) {
  if (path == "-") {
    const std::string text{std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>()};
    if (std::cin.bad()) {
      return std::unexpected(labelnorm::core::LabelError::LoadFailed);
    }
    return parse_labels(text);
  }

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(labelnorm::core::LabelError::LoadFailed);
  }
  std::ostringstream buf;
  buf << f.rdbuf();
  if (f.bad()) {
    return std::unexpected(labelnorm::core::LabelError::LoadFailed);
  }
  return parse_labels(buf.str());
}

void write_records(std::ostream& out,
                   const std::vector<labelnorm::core::LabelRecord>& records,
                   ExportFormat format,
                   bool header) {
  if (format == ExportFormat::Tsv) {
    if (header) out << kOriginalColumn << '\t' << kCorrectedColumn << '\n';
    for (const auto& r : records) {
      out << r.original << '\t' << r.corrected << '\n';
    }
    return;
  }
  if (header) out << kOriginalColumn << ',' << kCorrectedColumn << '\n';
  for (const auto& r : records) {
    out << csv_quote(r.original) << ',' << csv_quote(r.corrected) << '\n';
  }
}

std::expected<void, labelnorm::core::LabelError> export_records(
    const std::string& path,
    const std::vector<labelnorm::core::LabelRecord>& records,
    ExportFormat format,
    bool header) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      return std::unexpected(labelnorm::core::LabelError::WriteFailed);
    }
  }
  std::ofstream f(p, std::ios::binary);
  if (!f) {
    return std::unexpected(labelnorm::core::LabelError::WriteFailed);
  }
  write_records(f, records, format, header);
  f.flush();
  if (!f) {
    return std::unexpected(labelnorm::core::LabelError::WriteFailed);
  }
  return {};
}

}  // namespace labelnorm::app
