#pragma once

#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_record.hpp>
#include <labelnorm/core/pipeline.hpp>
#include <expected>
#include <string>
#include <vector>

#ifdef LABELNORM_HAS_TBB

namespace labelnorm::app {

/// Corrects a batch of labels in parallel using TBB, without progress notifications.
///
/// Headless bulk path only (CLI --parallel). It is not a BatchRunner: there is
/// no progress callback, no pacing and no cancellation, and records are never
/// observed while busy. Interactive callers use BatchRunner.
///
/// Records are written into a pre-sized vector by index, so the result is in
/// input order and identical to BatchRunner::run() on the same pipeline.
/// LabelPipeline::run() is const and its stages hold no mutable state, so
/// one pipeline is shared by all TBB tasks.
///
/// \param pipeline Pipeline to run; caller keeps ownership.
/// \param labels Raw labels; read only.
/// \return Completed records, or the first pipeline error (InvalidConfig).
[[nodiscard]] std::expected<std::vector<labelnorm::core::LabelRecord>,
                            labelnorm::core::LabelError>
correct_labels_tbb(const labelnorm::core::LabelPipeline& pipeline,
                   const std::vector<std::string>& labels);

}  // namespace labelnorm::app

#endif  // LABELNORM_HAS_TBB
