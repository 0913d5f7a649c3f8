#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace labelnorm::text {

/// Ordered, immutable list of known brand tokens. Entries are stored
/// uppercase; blank entries are dropped. Order is the match priority.
class BrandCatalog {
 public:
  BrandCatalog() = default;
  explicit BrandCatalog(std::vector<std::string> brands);

  /// CRF, CARF, CARREFOUR, PAPERMATE, PM, SHARPIE, ROTRING.
  [[nodiscard]] static const BrandCatalog& default_catalog();

  [[nodiscard]] const std::vector<std::string>& brands() const noexcept {
    return brands_;
  }
  [[nodiscard]] bool empty() const noexcept { return brands_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return brands_.size(); }

 private:
  std::vector<std::string> brands_;
};

}  // namespace labelnorm::text
