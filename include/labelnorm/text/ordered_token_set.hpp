#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace labelnorm::text {

/// Insertion-ordered set of strings: a repeated insert is ignored and
/// iteration follows first-insertion order.
class OrderedTokenSet {
 public:
  /// Returns false if an identical token is already present.
  bool insert(std::string token) {
    if (seen_.contains(token)) return false;
    seen_.insert(token);
    tokens_.push_back(std::move(token));
    return true;
  }

  [[nodiscard]] bool contains(const std::string& token) const {
    return seen_.contains(token);
  }

  [[nodiscard]] std::size_t size() const noexcept { return tokens_.size(); }
  [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }

  [[nodiscard]] const std::vector<std::string>& items() const& noexcept {
    return tokens_;
  }
  [[nodiscard]] std::vector<std::string> items() && noexcept {
    return std::move(tokens_);
  }

 private:
  std::vector<std::string> tokens_;
  std::unordered_set<std::string> seen_;
};

}  // namespace labelnorm::text
