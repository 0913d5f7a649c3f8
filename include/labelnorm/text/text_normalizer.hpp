#pragma once

#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/core/pipeline_stage.hpp>
#include <string>
#include <string_view>

namespace labelnorm::text {

/// Strip a UTF-8 label down to ASCII letters, digits, spaces and , . / + -.
/// Accented letters keep their base letter (NFD, then nonspacing marks are
/// dropped); every other character becomes a space. Whitespace is collapsed
/// and trimmed. Case is preserved. Never fails: malformed UTF-8 turns into spaces.
[[nodiscard]] std::string normalize_text(std::string_view utf8);

/// Fills LabelDraft::normalized from LabelDraft::original.
class TextNormalizeStage : public labelnorm::core::ILabelStage {
 public:
  [[nodiscard]] labelnorm::core::LabelDraft process(
      labelnorm::core::LabelDraft draft) const override;

  [[nodiscard]] std::string_view name() const noexcept override {
    return "text_normalize";
  }
};

}  // namespace labelnorm::text
