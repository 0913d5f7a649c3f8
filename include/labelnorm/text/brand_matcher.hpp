#pragma once

#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/core/pipeline_stage.hpp>
#include <labelnorm/text/brand_catalog.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace labelnorm::text {

/// Finds the brand of a normalized label: the first catalog entry, in catalog
/// order, present as a whole word (case-insensitive).
class BrandMatcher {
 public:
  explicit BrandMatcher(BrandCatalog catalog);

  [[nodiscard]] std::optional<std::string> match(std::string_view text) const;

  [[nodiscard]] const BrandCatalog& catalog() const noexcept { return catalog_; }

 private:
  BrandCatalog catalog_;
};

/// Fills LabelDraft::brand from LabelDraft::normalized.
class BrandMatchStage : public labelnorm::core::ILabelStage {
 public:
  explicit BrandMatchStage(BrandCatalog catalog);

  [[nodiscard]] labelnorm::core::LabelDraft process(
      labelnorm::core::LabelDraft draft) const override;

  [[nodiscard]] std::string_view name() const noexcept override {
    return "brand_match";
  }

 private:
  BrandMatcher matcher_;
};

}  // namespace labelnorm::text
