#pragma once

#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/core/pipeline_stage.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace labelnorm::text {

/// One pattern family of the quantity cascade.
/// \p upper is the uppercased normalized label; \p recorded holds every
/// candidate produced by earlier matchers (and earlier matches of this one),
/// in order and before deduplication. Returns new candidates in text order.
using QuantityMatcher = std::function<std::vector<std::string>(
    std::string_view upper, const std::vector<std::string>& recorded)>;

/// Units recognised after a quantity: KG, G, L, ML, CL.

/// "1.5L", "1,5 KG" -> "1,5L", "1,5 KG".
[[nodiscard]] std::vector<std::string> match_decimal_quantities(
    std::string_view upper, const std::vector<std::string>& recorded);

/// "6X30G", "4X1.5L" -> "6X30G", "4X1,5L".
[[nodiscard]] std::vector<std::string> match_multiplier_quantities(
    std::string_view upper, const std::vector<std::string>& recorded);

/// Integers of 10 and above followed by a unit: "500G", "75 CL".
[[nodiscard]] std::vector<std::string> match_large_quantities(
    std::string_view upper, const std::vector<std::string>& recorded);

/// A single digit 1-9 at the start of the text or after whitespace, then a
/// unit. The token drops any space: "1 L" -> "1L".
[[nodiscard]] std::vector<std::string> match_small_quantities(
    std::string_view upper, const std::vector<std::string>& recorded);

/// "1/2L", "3/4 KG".
[[nodiscard]] std::vector<std::string> match_unit_fractions(
    std::string_view upper, const std::vector<std::string>& recorded);

/// "1/2" without a unit, skipped when a recorded token already contains it.
[[nodiscard]] std::vector<std::string> match_bare_fractions(
    std::string_view upper, const std::vector<std::string>& recorded);

/// The six matchers above, in that order.
[[nodiscard]] std::vector<QuantityMatcher> default_quantity_cascade();

/// Extracts pack-size tokens from a normalized label.
///
/// Every matcher runs over the same text; nothing a matcher finds is removed
/// before the next one runs, so one substring can yield several different
/// tokens ("20CL" and "1/20CL" from "1/20CL"). Candidates are then
/// deduplicated by exact string equality, keeping first-discovery order.
class QuantityExtractor {
 public:
  QuantityExtractor();
  explicit QuantityExtractor(std::vector<QuantityMatcher> cascade);

  [[nodiscard]] std::vector<std::string> extract(std::string_view text) const;

  [[nodiscard]] std::size_t cascade_size() const noexcept { return cascade_.size(); }

 private:
  std::vector<QuantityMatcher> cascade_;
};

/// Fills LabelDraft::quantities from LabelDraft::normalized.
class QuantityExtractionStage : public labelnorm::core::ILabelStage {
 public:
  QuantityExtractionStage() = default;
  explicit QuantityExtractionStage(QuantityExtractor extractor);

  [[nodiscard]] labelnorm::core::LabelDraft process(
      labelnorm::core::LabelDraft draft) const override;

  [[nodiscard]] std::string_view name() const noexcept override {
    return "quantity_extraction";
  }

 private:
  QuantityExtractor extractor_;
};

}  // namespace labelnorm::text
