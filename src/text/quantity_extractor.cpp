#include <labelnorm/text/quantity_extractor.hpp>
#include <labelnorm/text/ordered_token_set.hpp>
#include <labelnorm/text/word_ops.hpp>
#include <algorithm>
#include <iterator>
#include <regex>
#include <utility>

namespace labelnorm::text {

namespace {

using SvIterator = std::string_view::const_iterator;
using SvRegexIterator = std::regex_iterator<SvIterator>;

std::vector<std::string> find_all(std::string_view text, const std::regex& re) {
  std::vector<std::string> out;
  for (SvRegexIterator it(text.begin(), text.end(), re), end; it != end; ++it) {
    out.push_back(it->str());
  }
  return out;
}

/// "1.5" -> "1,5" inside a matched token.
std::string comma_decimal(const std::string& token) {
  static const std::regex kDecimalPoint(R"((\d+)\.(\d+))");
  return std::regex_replace(token, kDecimalPoint, "$1,$2");
}

}  // namespace

std::vector<std::string> match_decimal_quantities(
    std::string_view upper, const std::vector<std::string>& /*recorded*/) {
  static const std::regex kPattern(R"(\b\d+[.,]\d+\s*(?:KG|G|L|ML|CL)\b)");
  auto out = find_all(upper, kPattern);
  std::transform(out.begin(), out.end(), out.begin(), comma_decimal);
  return out;
}

std::vector<std::string> match_multiplier_quantities(
    std::string_view upper, const std::vector<std::string>& /*recorded*/) {
  static const std::regex kPattern(R"(\b\d+X\d+[.,]?\d*\s*(?:KG|G|L|ML|CL)\b)");
  auto out = find_all(upper, kPattern);
  std::transform(out.begin(), out.end(), out.begin(), comma_decimal);
  return out;
}

std::vector<std::string> match_large_quantities(
    std::string_view upper, const std::vector<std::string>& /*recorded*/) {
  static const std::regex kPattern(R"(\b(?:[1-9]\d{2,}|[1-9]\d)\s*(?:KG|G|L|ML|CL)\b)");
  return find_all(upper, kPattern);
}

std::vector<std::string> match_small_quantities(
    std::string_view upper, const std::vector<std::string>& /*recorded*/) {
  static const std::regex kPattern(R"((?:^|\s)([1-9])\s*(KG|G|L|ML|CL)\b)");
  std::vector<std::string> out;
  for (SvRegexIterator it(upper.begin(), upper.end(), kPattern), end; it != end; ++it) {
    out.push_back((*it)[1].str() + (*it)[2].str());
  }
  return out;
}

std::vector<std::string> match_unit_fractions(
    std::string_view upper, const std::vector<std::string>& /*recorded*/) {
  static const std::regex kPattern(R"(\b\d+/\d+\s*(?:KG|G|L|ML|CL)\b)");
  return find_all(upper, kPattern);
}

std::vector<std::string> match_bare_fractions(
    std::string_view upper, const std::vector<std::string>& recorded) {
  static const std::regex kPattern(R"(\b\d+/\d+\b)");
  std::vector<std::string> out;
  for (auto& fraction : find_all(upper, kPattern)) {
    const auto holds_fraction = [&fraction](const std::string& token) {
      return token.find(fraction) != std::string::npos;
    };
    if (std::any_of(recorded.begin(), recorded.end(), holds_fraction) ||
        std::any_of(out.begin(), out.end(), holds_fraction)) {
      continue;
    }
    out.push_back(std::move(fraction));
  }
  return out;
}

std::vector<QuantityMatcher> default_quantity_cascade() {
  return {
      &match_decimal_quantities,
      &match_multiplier_quantities,
      &match_large_quantities,
      &match_small_quantities,
      &match_unit_fractions,
      &match_bare_fractions,
  };
}

QuantityExtractor::QuantityExtractor() : cascade_(default_quantity_cascade()) {}

QuantityExtractor::QuantityExtractor(std::vector<QuantityMatcher> cascade)
    : cascade_(std::move(cascade)) {}

std::vector<std::string> QuantityExtractor::extract(std::string_view text) const {
  if (text.empty()) return {};
  const std::string upper = to_upper(text);

  std::vector<std::string> candidates;
  for (const auto& matcher : cascade_) {
    if (!matcher) continue;
    auto found = matcher(upper, candidates);
    candidates.insert(candidates.end(),
                      std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
  }

  OrderedTokenSet unique;
  for (auto& c : candidates) {
    unique.insert(std::move(c));
  }
  return std::move(unique).items();
}

QuantityExtractionStage::QuantityExtractionStage(QuantityExtractor extractor)
    : extractor_(std::move(extractor)) {}

labelnorm::core::LabelDraft QuantityExtractionStage::process(
    labelnorm::core::LabelDraft draft) const {
  draft.quantities = extractor_.extract(draft.normalized);
  return draft;
}

}  // namespace labelnorm::text
