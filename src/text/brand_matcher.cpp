#include <labelnorm/text/brand_matcher.hpp>
#include <labelnorm/text/word_ops.hpp>
#include <utility>

namespace labelnorm::text {

BrandMatcher::BrandMatcher(BrandCatalog catalog) : catalog_(std::move(catalog)) {}

std::optional<std::string> BrandMatcher::match(std::string_view text) const {
  if (text.empty()) return std::nullopt;
  const std::string upper = to_upper(text);
  for (const auto& brand : catalog_.brands()) {
    if (contains_whole_word(upper, brand)) {
      return brand;
    }
  }
  return std::nullopt;
}

BrandMatchStage::BrandMatchStage(BrandCatalog catalog)
    : matcher_(std::move(catalog)) {}

labelnorm::core::LabelDraft BrandMatchStage::process(
    labelnorm::core::LabelDraft draft) const {
  draft.brand = matcher_.match(draft.normalized);
  return draft;
}

}  // namespace labelnorm::text
