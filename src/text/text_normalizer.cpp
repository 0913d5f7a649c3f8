#include <labelnorm/text/text_normalizer.hpp>
#include <labelnorm/text/word_ops.hpp>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <string>
#include <utility>

namespace labelnorm::text {

namespace {

bool is_allowed_ascii(UChar32 c) {
  if (c >= 'A' && c <= 'Z') return true;
  if (c >= 'a' && c <= 'z') return true;
  if (c >= '0' && c <= '9') return true;
  switch (c) {
  case ',':
  case '.':
  case '/':
  case '+':
  case '-':
    return true;
  default:
    return false;
  }
}

icu::UnicodeString decompose(const icu::UnicodeString& input) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
  if (U_FAILURE(status) || nfd == nullptr) {
    // Accented letters then map to spaces instead of their base letter.
    return input;
  }
  icu::UnicodeString out = nfd->normalize(input, status);
  if (U_FAILURE(status)) {
    return input;
  }
  return out;
}

}  // namespace

std::string normalize_text(std::string_view utf8) {
  if (utf8.empty()) return {};

  const icu::UnicodeString decomposed = decompose(icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size()))));

  std::string ascii;
  ascii.reserve(utf8.size());
  for (int32_t i = 0; i < decomposed.length(); i = decomposed.moveIndex32(i, 1)) {
    const UChar32 c = decomposed.char32At(i);
    if (u_charType(c) == U_NON_SPACING_MARK) continue;
    if (is_allowed_ascii(c)) {
      ascii.push_back(static_cast<char>(c));
    } else {
      ascii.push_back(' ');
    }
  }
  return collapse_whitespace(ascii);
}

labelnorm::core::LabelDraft TextNormalizeStage::process(
    labelnorm::core::LabelDraft draft) const {
  draft.normalized = normalize_text(draft.original);
  return draft;
}

}  // namespace labelnorm::text
