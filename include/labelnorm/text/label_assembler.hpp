#pragma once

#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/core/pipeline_stage.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labelnorm::text {

/// Product name and final label built from a normalized label.
struct AssembledLabel {
  std::string product_name;
  std::string corrected;
};

/// Remove the brand and quantity tokens from \p normalized to isolate the
/// product name, then rebuild "BRAND PRODUCT QTY1 QTY2 ..." in uppercase.
///
/// Each quantity is removed both as written ("1,5L") and with a period
/// separator ("1.5L"). Periods left in the product name are turned into
/// spaces unless they sit between two digits ("NAT." -> "NAT", "V2.0" kept).
[[nodiscard]] AssembledLabel assemble_label(
    std::string_view normalized,
    const std::optional<std::string>& brand,
    const std::vector<std::string>& quantities);

/// Product-name remainder only (steps shared with assemble_label).
[[nodiscard]] std::string extract_product_name(
    std::string_view normalized,
    const std::optional<std::string>& brand,
    const std::vector<std::string>& quantities);

/// Sets LabelDraft::product_name and LabelDraft::corrected.
class LabelAssemblyStage : public labelnorm::core::ILabelStage {
 public:
  [[nodiscard]] labelnorm::core::LabelDraft process(
      labelnorm::core::LabelDraft draft) const override;

  [[nodiscard]] std::string_view name() const noexcept override {
    return "label_assembly";
  }
};

}  // namespace labelnorm::text
