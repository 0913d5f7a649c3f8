#pragma once

#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_record.hpp>
#include <labelnorm/core/pipeline.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace labelnorm::app {

/// Progress notification: a copy of the whole record list and the index of
/// the record that just changed.
using LabelProgressCallback =
    std::function<void(std::vector<labelnorm::core::LabelRecord> records, std::size_t index)>;

/// Called with the record index before each result is computed. Used to pace
/// interactive output; it has no effect on the result.
using PacingPolicy = std::function<void(std::size_t index)>;

/// Does nothing. Default for tests and headless runs.
[[nodiscard]] PacingPolicy no_pacing();

/// Sleeps a uniformly random duration in [min, max] before each record.
[[nodiscard]] PacingPolicy random_pacing(std::chrono::milliseconds min,
                                         std::chrono::milliseconds max);

/// Corrects labels one at a time, in input order, reporting progress.
///
/// For each record: is_processing is set and on_progress fires, the pacing
/// policy runs, the pipeline computes the correction, is_processing is
/// cleared and on_progress fires again. Two notifications per record, never
/// interleaved across records.
class BatchRunner {
 public:
  /// \p pipeline must outlive the runner.
  explicit BatchRunner(const labelnorm::core::LabelPipeline& pipeline,
                       PacingPolicy pacing = no_pacing());

  /// Returns every record. If \p stop is requested the runner does not pick
  /// up another record: finished records keep their correction and the rest
  /// are returned untouched. Fails with InvalidConfig (before any
  /// notification) if the pipeline has no stages.
  [[nodiscard]] std::expected<std::vector<labelnorm::core::LabelRecord>,
                              labelnorm::core::LabelError>
  run(const std::vector<std::string>& labels,
      const LabelProgressCallback& on_progress,
      std::stop_token stop = {}) const;

 private:
  const labelnorm::core::LabelPipeline& pipeline_;
  PacingPolicy pacing_;
};

/// BatchRunner over the default pipeline.
[[nodiscard]] std::expected<std::vector<labelnorm::core::LabelRecord>,
                            labelnorm::core::LabelError>
process_batch(const std::vector<std::string>& labels,
              const LabelProgressCallback& on_progress,
              PacingPolicy pacing = no_pacing(),
              std::stop_token stop = {});

}  // namespace labelnorm::app
