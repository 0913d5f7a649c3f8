#include <labelnorm/text/label_normalizer.hpp>
#include <labelnorm/text/brand_matcher.hpp>
#include <labelnorm/text/label_assembler.hpp>
#include <labelnorm/text/quantity_extractor.hpp>
#include <labelnorm/text/text_normalizer.hpp>
#include <memory>
#include <utility>

namespace labelnorm::text {

namespace {

const QuantityExtractor& shared_extractor() {
  static const QuantityExtractor extractor;
  return extractor;
}

}  // namespace

std::string normalize(std::string_view label) {
  static const BrandMatcher brands(BrandCatalog::default_catalog());
  return normalize(label, brands);
}

std::string normalize(std::string_view label, const BrandMatcher& brands) {
  const std::string normalized = normalize_text(label);
  if (normalized.empty()) return {};

  return assemble_label(normalized, brands.match(normalized),
                        shared_extractor().extract(normalized))
      .corrected;
}

std::string normalize(std::string_view label, const BrandCatalog& catalog) {
  return normalize(label, BrandMatcher(catalog));
}

labelnorm::core::LabelPipeline build_label_pipeline(BrandCatalog catalog) {
  labelnorm::core::LabelPipeline pipeline;
  pipeline.add_stage(std::make_unique<TextNormalizeStage>());
  pipeline.add_stage(std::make_unique<BrandMatchStage>(std::move(catalog)));
  pipeline.add_stage(std::make_unique<QuantityExtractionStage>());
  pipeline.add_stage(std::make_unique<LabelAssemblyStage>());
  return pipeline;
}

const labelnorm::core::LabelPipeline& default_pipeline() {
  static const labelnorm::core::LabelPipeline pipeline =
      build_label_pipeline(BrandCatalog::default_catalog());
  return pipeline;
}

}  // namespace labelnorm::text
