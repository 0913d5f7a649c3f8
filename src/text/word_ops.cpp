#include <labelnorm/text/word_ops.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace labelnorm::text {

namespace {

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Word boundary at position i, as "\b" defines it.
bool is_boundary(std::string_view text, std::size_t i) {
  const bool before = i > 0 && is_word_char(text[i - 1]);
  const bool after = i < text.size() && is_word_char(text[i]);
  return before != after;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
    return std::toupper(static_cast<unsigned char>(x)) ==
           std::toupper(static_cast<unsigned char>(y));
  });
}

bool whole_word_at(std::string_view text, std::string_view word, std::size_t i) {
  return i + word.size() <= text.size() &&
         equals_ignore_case(text.substr(i, word.size()), word) &&
         is_boundary(text, i) && is_boundary(text, i + word.size());
}

}  // namespace

bool contains_whole_word(std::string_view text, std::string_view word) {
  if (word.empty()) return false;
  for (std::size_t i = 0; i + word.size() <= text.size(); ++i) {
    if (whole_word_at(text, word, i)) return true;
  }
  return false;
}

std::string erase_whole_word(std::string_view text, std::string_view word) {
  if (word.empty()) return std::string(text);
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (whole_word_at(text, word, i)) {
      i += word.size();
    } else {
      out.push_back(text[i++]);
    }
  }
  return out;
}

std::string collapse_whitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string to_upper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

std::string with_period_separator(std::string_view token) {
  std::string out(token);
  std::replace(out.begin(), out.end(), ',', '.');
  return out;
}

}  // namespace labelnorm::text
