#include <motlib/render/frame_sampling.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

using namespace motlib::render;

TEST(frame_sampling, samples_spread_over_whole_sequence) {
  // act
  std::vector<std::size_t> const indices = sampleFrameIndices(120, 30);

  // assert
  ASSERT_EQ(indices.size(), 30u);
  EXPECT_EQ(indices.front(), 0u);
  EXPECT_EQ(indices[1], 4u);
  EXPECT_EQ(indices[2], 8u);
  EXPECT_EQ(indices[28], 114u);
  EXPECT_EQ(indices.back(), 119u);

  for (std::size_t i = 1; i < indices.size(); ++i) {
    EXPECT_LT(indices[i - 1], indices[i]);
  }
}

TEST(frame_sampling, exact_division) {
  std::vector<std::size_t> const expected = {0, 3, 6, 9};
  EXPECT_EQ(sampleFrameIndices(10, 4), expected);
}

TEST(frame_sampling, single_sample_is_first_frame) {
  std::vector<std::size_t> const expected = {0};
  EXPECT_EQ(sampleFrameIndices(50, 1), expected);
}

TEST(frame_sampling, more_samples_than_frames_returns_every_frame) {
  std::vector<std::size_t> const expected = {0, 1, 2, 3, 4};
  EXPECT_EQ(sampleFrameIndices(5, 5), expected);
  EXPECT_EQ(sampleFrameIndices(5, 30), expected);
}

TEST(frame_sampling, empty_inputs) {
  EXPECT_TRUE(sampleFrameIndices(0, 30).empty());
  EXPECT_TRUE(sampleFrameIndices(120, 0).empty());
}

TEST(frame_sampling, two_samples_are_endpoints) {
  std::vector<std::size_t> const expected = {0, 119};
  EXPECT_EQ(sampleFrameIndices(120, 2), expected);
}
