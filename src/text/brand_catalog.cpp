#include <labelnorm/text/brand_catalog.hpp>
#include <labelnorm/text/word_ops.hpp>
#include <utility>

namespace labelnorm::text {

BrandCatalog::BrandCatalog(std::vector<std::string> brands) {
  brands_.reserve(brands.size());
  for (auto& b : brands) {
    std::string entry = to_upper(collapse_whitespace(b));
    if (!entry.empty()) {
      brands_.push_back(std::move(entry));
    }
  }
}

const BrandCatalog& BrandCatalog::default_catalog() {
  static const BrandCatalog catalog(
      {"CRF", "CARF", "CARREFOUR", "PAPERMATE", "PM", "SHARPIE", "ROTRING"});
  return catalog;
}

}  // namespace labelnorm::text
