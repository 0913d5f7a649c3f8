#include <labelnorm/app/batch_runner_tbb.hpp>

#ifdef LABELNORM_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <atomic>
#include <cstddef>
#include <utility>

namespace labelnorm::app {

std::expected<std::vector<labelnorm::core::LabelRecord>, labelnorm::core::LabelError>
correct_labels_tbb(const labelnorm::core::LabelPipeline& pipeline,
                   const std::vector<std::string>& labels) {
  if (pipeline.stage_count() == 0) {
    return std::unexpected(labelnorm::core::LabelError::InvalidConfig);
  }

  const std::size_t n = labels.size();
  std::vector<labelnorm::core::LabelRecord> records(n);
  std::atomic<bool> failed{false};

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&pipeline, &labels, &records, &failed](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          records[i].original = labels[i];
          auto draft = pipeline.run(labels[i]);
          if (!draft) {
            failed = true;
            continue;
          }
          records[i].corrected = std::move(*draft->corrected);
        }
      });

  if (failed.load()) {
    return std::unexpected(labelnorm::core::LabelError::InvalidConfig);
  }
  return records;
}

}  // namespace labelnorm::app

#endif  // LABELNORM_HAS_TBB
