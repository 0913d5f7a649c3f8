#pragma once

#include <string>
#include <string_view>

namespace labelnorm::text {

/// Whole-word helpers shared by brand matching and label assembly.
/// A whole word starts and ends on a word boundary ([A-Za-z0-9_] on exactly
/// one side), so "1L" is not found inside "10L" and "PM" not inside "PMU".
/// Inputs are expected to be ASCII (output of normalize_text).

/// True if \p word occurs in \p text as a whole word, ignoring case.
[[nodiscard]] bool contains_whole_word(std::string_view text, std::string_view word);

/// Delete every whole-word, case-insensitive occurrence of \p word from \p text.
/// Surrounding whitespace is left alone; run collapse_whitespace afterwards.
/// An empty \p word leaves \p text unchanged.
[[nodiscard]] std::string erase_whole_word(std::string_view text, std::string_view word);

/// Collapse runs of whitespace to a single space and trim both ends.
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

/// ASCII uppercase copy.
[[nodiscard]] std::string to_upper(std::string_view text);

/// Token with every comma decimal separator written as a period ("1,5L" -> "1.5L").
[[nodiscard]] std::string with_period_separator(std::string_view token);

}  // namespace labelnorm::text
