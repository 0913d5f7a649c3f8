#pragma once

#include <labelnorm/app/config.hpp>
#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_record.hpp>
#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace labelnorm::app {

/// Column titles of exported files.
inline constexpr std::string_view kOriginalColumn = "Libellé Original";
inline constexpr std::string_view kCorrectedColumn = "Libellé Corrigé";

/// One label per line; lines are trimmed (CR included) and blank lines dropped.
[[nodiscard]] std::vector<std::string> parse_labels(std::string_view text);

/// Read labels from a UTF-8 text file, or from stdin when \p path is "-".
[[nodiscard]] std::expected<std::vector<std::string>, labelnorm::core::LabelError>
read_labels(const std::string& path);

/// TSV: "original\tcorrected" rows. CSV: both fields double-quoted, inner
/// quotes doubled. Rows end with '\n'.
void write_records(std::ostream& out,
                   const std::vector<labelnorm::core::LabelRecord>& records,
                   ExportFormat format,
                   bool header = true);

/// write_records() into a file; parent directories are created.
[[nodiscard]] std::expected<void, labelnorm::core::LabelError> export_records(
    const std::string& path,
    const std::vector<labelnorm::core::LabelRecord>& records,
    ExportFormat format,
    bool header = true);

}  // namespace labelnorm::app
