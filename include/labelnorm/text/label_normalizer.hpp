#pragma once

#include <labelnorm/core/pipeline.hpp>
#include <labelnorm/text/brand_catalog.hpp>
#include <labelnorm/text/brand_matcher.hpp>
#include <string>
#include <string_view>

namespace labelnorm::text {

/// Correct one raw label: "6X30g chips lisse nat. CRF clas" -> "CRF CHIPS LISSE NAT CLAS 6X30G".
/// Pure and deterministic; empty or all-symbol input gives "".
[[nodiscard]] std::string normalize(std::string_view label);

/// Same, recognising brands with \p brands. Build the matcher once and reuse
/// it across a batch.
[[nodiscard]] std::string normalize(std::string_view label, const BrandMatcher& brands);

/// Convenience for one-off calls; builds a BrandMatcher on \p catalog.
[[nodiscard]] std::string normalize(std::string_view label, const BrandCatalog& catalog);

/// Pipeline of the four stages: text_normalize, brand_match,
/// quantity_extraction, label_assembly.
[[nodiscard]] labelnorm::core::LabelPipeline build_label_pipeline(BrandCatalog catalog);

/// Shared pipeline built on BrandCatalog::default_catalog().
[[nodiscard]] const labelnorm::core::LabelPipeline& default_pipeline();

}  // namespace labelnorm::text
