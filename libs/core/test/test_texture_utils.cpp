#include <motlib/core/utils/texture_utils.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <vector>

struct RGB {
  unsigned char r, g, b;
};

TEST(texture_utils, downsample_linear_channels_averages_blocks) {
  // arrange
  constexpr std::size_t w = 4, h = 2;

  constexpr std::array<RGB, w * h> pixels{
      RGB{0, 100, 200},  RGB{10, 100, 200}, RGB{40, 0, 0}, RGB{40, 0, 0},
      RGB{20, 100, 200}, RGB{30, 100, 200}, RGB{40, 0, 0}, RGB{40, 8, 0},
  };
  constexpr std::size_t reductionFactor = 2;
  constexpr std::size_t nonLinearChannelCnt = 0;

  // act
  std::vector<unsigned char> const result =
      motlib::core::utils::downsamplePixels(
          reinterpret_cast<unsigned char const*>(pixels.data()), sizeof(RGB),
          w, h, reductionFactor, nonLinearChannelCnt);

  // assert
  ASSERT_EQ(result.size(), 2 * sizeof(RGB));

  RGB const* resultData = reinterpret_cast<RGB const*>(result.data());

  EXPECT_EQ(resultData[0].r, 15);
  EXPECT_EQ(resultData[0].g, 100);
  EXPECT_EQ(resultData[0].b, 200);

  EXPECT_EQ(resultData[1].r, 40);
  EXPECT_EQ(resultData[1].g, 2);
  EXPECT_EQ(resultData[1].b, 0);
}

TEST(texture_utils, downsample_srgb_channels_preserves_flat_color) {
  // arrange
  constexpr std::size_t w = 2, h = 2;

  constexpr std::array<RGB, w * h> pixels{RGB{128, 64, 255}, RGB{128, 64, 255},
                                          RGB{128, 64, 255}, RGB{128, 64, 255}};

  // act
  std::vector<unsigned char> const result =
      motlib::core::utils::downsamplePixels(
          reinterpret_cast<unsigned char const*>(pixels.data()), sizeof(RGB),
          w, h, 2, sizeof(RGB));

  // assert
  ASSERT_EQ(result.size(), sizeof(RGB));
  EXPECT_NEAR(result[0], 128, 1);
  EXPECT_NEAR(result[1], 64, 1);
  EXPECT_NEAR(result[2], 255, 1);
}

TEST(texture_utils, downsample_srgb_averages_in_linear_light) {
  // arrange
  constexpr std::array<unsigned char, 4> pixels{0, 255, 0, 255};

  // act
  std::vector<unsigned char> const result =
      motlib::core::utils::downsamplePixels(pixels.data(), 1, 2, 2, 2, 1);

  // assert
  // a gamma-naive average would give 128
  ASSERT_EQ(result.size(), 1);
  EXPECT_NEAR(result[0], 188, 1);
}

TEST(texture_utils, downsample_rejects_indivisible_extent) {
  // arrange
  std::vector<unsigned char> const pixels(3 * 3 * 3, 0);

  // act
  std::vector<unsigned char> const result =
      motlib::core::utils::downsamplePixels(pixels.data(), 3, 3, 3, 2, 3);

  // assert
  EXPECT_TRUE(result.empty());
}

TEST(texture_utils, flip_rows_in_place) {
  // arrange
  std::vector<unsigned char> rows{1, 1, 2, 2, 3, 3};

  // act
  motlib::core::utils::flipRowsInPlace(rows.data(), 2, 3);

  // assert
  EXPECT_EQ(rows, (std::vector<unsigned char>{3, 3, 2, 2, 1, 1}));
}
