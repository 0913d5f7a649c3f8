#pragma once

#include <labelnorm/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace labelnorm::app {

/// Export file layout.
enum class ExportFormat {
  Tsv,
  Csv,
};

/// Batch configuration: brand catalog, pacing, export layout.
struct LabelConfig {
  std::vector<std::string> brands;  // order is match priority
  std::uint32_t pacing_min_ms{0};
  std::uint32_t pacing_max_ms{0};   // 0/0 = no pacing
  ExportFormat export_format{ExportFormat::Tsv};
  bool write_header{true};
  std::uint32_t preview_count{5};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Throws std::invalid_argument / std::out_of_range on malformed numbers.
LabelConfig load_config(const std::string& path);

/// Default config when no file is provided.
LabelConfig default_config();

/// Rejects an empty brand list or pacing_min_ms > pacing_max_ms.
[[nodiscard]] std::expected<void, labelnorm::core::LabelError> validate_config(
    const LabelConfig& config);

/// "tsv" / "csv" (case-insensitive); anything else is InvalidConfig.
[[nodiscard]] std::expected<ExportFormat, labelnorm::core::LabelError>
parse_export_format(const std::string& value);

}  // namespace labelnorm::app
