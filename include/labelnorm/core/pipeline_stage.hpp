#pragma once

#include <labelnorm/core/label_draft.hpp>
#include <string_view>

namespace labelnorm::core {

/// Abstract pipeline stage: takes a draft, returns it with its own part filled in.
/// Stages are total over any input and hold only immutable state, so process()
/// is const and may be called from several threads at once.
class ILabelStage {
 public:
  virtual ~ILabelStage() = default;

  [[nodiscard]] virtual LabelDraft process(LabelDraft draft) const = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace labelnorm::core
