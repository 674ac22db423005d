#include <gtest/gtest.h>

#include <numeric>

#include "artmatch_core/vision/color_palette.hpp"
#include "../../common/utilities_test.hpp"

namespace artmatch_core {

using artmatch_tests::TestUtilities;

TEST(ColorPaletteTest, UniformImageYieldsSingleSwatch) {
  auto palette = extract_palette(TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128)));

  ASSERT_EQ(palette.size(), 1u);
  EXPECT_EQ(palette[0].hex, "#808080");
  EXPECT_EQ(palette[0].name, "Gray");
  EXPECT_FLOAT_EQ(palette[0].percentage, 100.0f);
}

TEST(ColorPaletteTest, TwoToneImageIsRankedByShare) {
  // BGR: left 3/4 teal-ish blue, right 1/4 warm orange
  cv::Mat image = TestUtilities::solid_image(200, 200, cv::Scalar(160, 100, 40));
  image(cv::Rect(150, 0, 50, 200)).setTo(cv::Scalar(40, 120, 200));

  auto palette = extract_palette(image);

  ASSERT_EQ(palette.size(), 2u);
  EXPECT_EQ(palette[0].hex, "#2864a0");
  EXPECT_EQ(palette[1].hex, "#c87828");
  EXPECT_NEAR(palette[0].percentage, 75.0f, 0.5f);
  EXPECT_NEAR(palette[1].percentage, 25.0f, 0.5f);
}

TEST(ColorPaletteTest, IsDeterministic) {
  cv::Mat image(100, 100, CV_8UC3);
  cv::randu(image, cv::Scalar(30, 30, 30), cv::Scalar(220, 220, 220));

  auto first = extract_palette(image);
  auto second = extract_palette(image);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].hex, second[i].hex);
    EXPECT_FLOAT_EQ(first[i].percentage, second[i].percentage);
  }
}

TEST(ColorPaletteTest, VeryDarkImageFallsBackToAllPixels) {
  // Every pixel is trimmed as a shadow, so clustering uses the untrimmed set
  auto palette = extract_palette(TestUtilities::solid_image(50, 50, cv::Scalar(5, 5, 5)));

  ASSERT_EQ(palette.size(), 1u);
  EXPECT_EQ(palette[0].name, "Dark Black");
}

TEST(ColorPaletteTest, ColorNameUsesBrightnessPrefixes) {
  EXPECT_EQ(color_name(255, 255, 255), "Light White");
  EXPECT_EQ(color_name(10, 10, 10), "Dark Black");
  EXPECT_EQ(color_name(0, 128, 128), "Teal");
  EXPECT_EQ(color_name(250, 160, 10), "Orange");
}

TEST(ColorPaletteTest, DefaultPaletteIsFiveNeutralsSummingToHundred) {
  auto palette = default_palette();

  ASSERT_EQ(palette.size(), 5u);
  EXPECT_EQ(palette[0].hex, "#ffffff");
  EXPECT_EQ(palette[4].hex, "#f59e0b");
  float total = std::accumulate(palette.begin(), palette.end(), 0.0f,
                                [](float sum, const PaletteColor &c) { return sum + c.percentage; });
  EXPECT_FLOAT_EQ(total, 100.0f);
}

}  // namespace artmatch_core
