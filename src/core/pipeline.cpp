#include <labelnorm/core/pipeline.hpp>
#include <chrono>
#include <string>
#include <utility>

namespace labelnorm::core {

void LabelPipeline::add_stage(std::unique_ptr<ILabelStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::string_view LabelPipeline::stage_name(std::size_t index) const noexcept {
  if (index >= stages_.size()) return {};
  return stages_[index]->name();
}

std::expected<LabelDraft, LabelError> LabelPipeline::run(
    std::string_view label,
    StageTimingCallback* timing_cb) const {
  if (stages_.empty()) {
    return std::unexpected(LabelError::InvalidConfig);
  }

  LabelDraft draft;
  draft.original = std::string(label);

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    draft = stages_[i]->process(std::move(draft));
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }
  }

  if (!draft.corrected.has_value()) {
    return std::unexpected(LabelError::InvalidConfig);
  }
  return draft;
}

}  // namespace labelnorm::core
