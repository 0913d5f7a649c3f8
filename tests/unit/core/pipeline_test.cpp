#include <labelnorm/core/error.hpp>
#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/core/pipeline.hpp>
#include <labelnorm/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nc = labelnorm::core;

namespace {

class CopyOriginalStage : public nc::ILabelStage {
 public:
  nc::LabelDraft process(nc::LabelDraft draft) const override {
    draft.normalized = draft.original;
    return draft;
  }
  std::string_view name() const noexcept override { return "copy"; }
};

class FinishStage : public nc::ILabelStage {
 public:
  nc::LabelDraft process(nc::LabelDraft draft) const override {
    draft.corrected = "[" + draft.normalized + "]";
    return draft;
  }
  std::string_view name() const noexcept override { return "finish"; }
};

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsError) {
  nc::LabelPipeline p;
  auto result = p.run("CRF JUS 1L");
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::LabelError::InvalidConfig);
}

TEST(Pipeline, NoStageSetsCorrectedReturnsError) {
  nc::LabelPipeline p;
  p.add_stage(std::make_unique<CopyOriginalStage>());
  auto result = p.run("abc");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::LabelError::InvalidConfig);
}

TEST(Pipeline, StagesRunInOrder) {
  nc::LabelPipeline p;
  p.add_stage(std::make_unique<CopyOriginalStage>());
  p.add_stage(std::make_unique<FinishStage>());
  auto result = p.run("abc");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->original, "abc");
  EXPECT_EQ(result->normalized, "abc");
  ASSERT_TRUE(result->corrected.has_value());
  EXPECT_EQ(*result->corrected, "[abc]");
}

TEST(Pipeline, NullStageIgnored) {
  nc::LabelPipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
  p.add_stage(std::make_unique<FinishStage>());
  EXPECT_EQ(p.stage_count(), 1u);
  EXPECT_EQ(p.stage_name(0), "finish");
  EXPECT_TRUE(p.stage_name(1).empty());
}

TEST(Pipeline, TimingCallbackPerStage) {
  nc::LabelPipeline p;
  p.add_stage(std::make_unique<CopyOriginalStage>());
  p.add_stage(std::make_unique<FinishStage>());

  std::vector<std::pair<std::size_t, double>> timings;
  nc::StageTimingCallback timing_cb = [&](std::size_t idx, double ms) {
    timings.emplace_back(idx, ms);
  };
  auto result = p.run("x", &timing_cb);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(timings.size(), 2u);
  EXPECT_EQ(timings[0].first, 0u);
  EXPECT_EQ(timings[1].first, 1u);
  EXPECT_GE(timings[1].second, 0.0);
}

TEST(LabelError, Names) {
  EXPECT_EQ(nc::error_name(nc::LabelError::InvalidConfig), "InvalidConfig");
  EXPECT_EQ(nc::error_name(nc::LabelError::WriteFailed), "WriteFailed");
}
