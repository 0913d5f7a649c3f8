#pragma once

#include <optional>
#include <string>
#include <vector>

namespace labelnorm::core {

/// Working state of one label while it moves through the pipeline.
/// Each stage fills in its part; the assembly stage sets corrected.
struct LabelDraft {
  std::string original;
  std::string normalized;
  std::optional<std::string> brand;
  std::vector<std::string> quantities;
  std::string product_name;

  /// Final label. Unset until the last stage has run.
  std::optional<std::string> corrected;
};

}  // namespace labelnorm::core
