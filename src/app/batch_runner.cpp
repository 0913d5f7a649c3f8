#include <labelnorm/app/batch_runner.hpp>
#include <labelnorm/text/label_normalizer.hpp>
#include <random>
#include <thread>
#include <utility>

namespace labelnorm::app {

namespace {

void notify(const LabelProgressCallback& on_progress,
            const std::vector<labelnorm::core::LabelRecord>& records,
            std::size_t index) {
  if (on_progress) on_progress(records, index);
}

}  // namespace

PacingPolicy no_pacing() {
  return [](std::size_t) {};
}

PacingPolicy random_pacing(std::chrono::milliseconds min,
                           std::chrono::milliseconds max) {
  if (max < min) std::swap(min, max);
  return [min, max, engine = std::mt19937(std::random_device{}())](std::size_t) mutable {
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(min.count(), max.count());
    std::this_thread::sleep_for(std::chrono::milliseconds(dist(engine)));
  };
}

BatchRunner::BatchRunner(const labelnorm::core::LabelPipeline& pipeline,
                         PacingPolicy pacing)
    : pipeline_(pipeline), pacing_(std::move(pacing)) {}

std::expected<std::vector<labelnorm::core::LabelRecord>, labelnorm::core::LabelError>
BatchRunner::run(const std::vector<std::string>& labels,
                 const LabelProgressCallback& on_progress,
                 std::stop_token stop) const {
  if (pipeline_.stage_count() == 0) {
    return std::unexpected(labelnorm::core::LabelError::InvalidConfig);
  }

  std::vector<labelnorm::core::LabelRecord> records;
  records.reserve(labels.size());
  for (const auto& label : labels) {
    records.push_back({label, std::string{}, false});
  }

  for (std::size_t i = 0; i < records.size(); ++i) {
    if (stop.stop_requested()) break;

    records[i].is_processing = true;
    notify(on_progress, records, i);

    if (pacing_) pacing_(i);

    auto draft = pipeline_.run(records[i].original);
    if (!draft) {
      return std::unexpected(draft.error());
    }

    records[i].corrected = std::move(*draft->corrected);
    records[i].is_processing = false;
    notify(on_progress, records, i);
  }
  return records;
}

std::expected<std::vector<labelnorm::core::LabelRecord>, labelnorm::core::LabelError>
process_batch(const std::vector<std::string>& labels,
              const LabelProgressCallback& on_progress,
              PacingPolicy pacing,
              std::stop_token stop) {
  const BatchRunner runner(labelnorm::text::default_pipeline(), std::move(pacing));
  return runner.run(labels, on_progress, std::move(stop));
}

}  // namespace labelnorm::app
