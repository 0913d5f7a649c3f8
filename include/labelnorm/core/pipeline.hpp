#pragma once

#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace labelnorm::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages over one label.
class LabelPipeline {
 public:
  LabelPipeline() = default;

  void add_stage(std::unique_ptr<ILabelStage> stage);

  /// Run every stage on one raw label; returns the finished draft.
  /// Fails with InvalidConfig if there are no stages or none of them set
  /// corrected. If timing_cb is non-null, it is called after each stage with
  /// (stage_index, duration_ms).
  /// Thread-safe: stages are not modified during process().
  [[nodiscard]] std::expected<LabelDraft, LabelError> run(
      std::string_view label,
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

  [[nodiscard]] std::string_view stage_name(std::size_t index) const noexcept;

 private:
  std::vector<std::unique_ptr<ILabelStage>> stages_;
};

}  // namespace labelnorm::core
