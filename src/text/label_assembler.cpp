#include <labelnorm/text/label_assembler.hpp>
#include <labelnorm/text/word_ops.hpp>
#include <cctype>
#include <cstddef>
#include <utility>

namespace labelnorm::text {

namespace {

bool is_alpha_at(std::string_view s, std::size_t i) {
  return i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]));
}

bool is_word_end(std::string_view s, std::size_t i) {
  return i >= s.size() || std::isspace(static_cast<unsigned char>(s[i]));
}

// "NAT." becomes "NAT"; a period followed by more text ("NAT.5L", "2.0") stays,
// so no new standalone token is exposed to a later pass.
std::string drop_abbreviation_periods(std::string_view text) {
  std::string out(text);
  for (std::size_t i = 1; i < out.size(); ++i) {
    if (out[i] != '.') continue;
    if (is_alpha_at(out, i - 1) && is_word_end(out, i + 1)) out[i] = ' ';
  }
  return out;
}

}  // namespace

std::string extract_product_name(
    std::string_view normalized,
    const std::optional<std::string>& brand,
    const std::vector<std::string>& quantities) {
  std::string name(normalized);

  if (brand && !brand->empty()) {
    name = erase_whole_word(name, *brand);
  }

  for (const auto& q : quantities) {
    name = erase_whole_word(name, q);
    name = erase_whole_word(name, with_period_separator(q));
  }

  return collapse_whitespace(drop_abbreviation_periods(name));
}

AssembledLabel assemble_label(
    std::string_view normalized,
    const std::optional<std::string>& brand,
    const std::vector<std::string>& quantities) {
  AssembledLabel out;
  out.product_name = extract_product_name(normalized, brand, quantities);

  std::string joined;
  const auto append = [&joined](std::string_view part) {
    if (part.empty()) return;
    if (!joined.empty()) joined.push_back(' ');
    joined.append(part);
  };

  if (brand) append(*brand);
  append(out.product_name);
  for (const auto& q : quantities) append(q);

  out.corrected = collapse_whitespace(to_upper(joined));
  return out;
}

labelnorm::core::LabelDraft LabelAssemblyStage::process(
    labelnorm::core::LabelDraft draft) const {
  auto assembled = assemble_label(draft.normalized, draft.brand, draft.quantities);
  draft.product_name = std::move(assembled.product_name);
  draft.corrected = std::move(assembled.corrected);
  return draft;
}

}  // namespace labelnorm::text
