#include "ColorGrader.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace testing_util;

namespace {
float HueGap(float a, float b) {
  const float d = std::fabs(a - b);
  return std::min(d, 1.0f - d);
}
} // namespace

TEST(ColorGraderTest, ClassifiesHueBands) {
  EXPECT_EQ(ColorGrader::Classify(0.5f, 0.05f), HueCategory::Neutral);
  EXPECT_EQ(ColorGrader::Classify(0.0f, 0.5f), HueCategory::SkinWarm);
  EXPECT_EQ(ColorGrader::Classify(0.97f, 0.5f), HueCategory::SkinWarm);
  EXPECT_EQ(ColorGrader::Classify(0.15f, 0.5f), HueCategory::YellowGold);
  EXPECT_EQ(ColorGrader::Classify(1.0f / 3.0f, 0.5f), HueCategory::Green);
  EXPECT_EQ(ColorGrader::Classify(0.5f, 0.5f), HueCategory::TealCyan);
  EXPECT_EQ(ColorGrader::Classify(0.6f, 0.5f), HueCategory::Blue);
  EXPECT_EQ(ColorGrader::Classify(0.75f, 0.5f), HueCategory::Purple);
  EXPECT_EQ(ColorGrader::Classify(0.9f, 0.5f), HueCategory::MagentaPink);
}

TEST(ColorGraderTest, CloseUpPortraitsDampenSkinGrading) {
  EXPECT_FLOAT_EQ(ColorGrader::SkinDampen({{0, 0, 60, 60}}, cv::Size(100, 100)), 0.78f);
  EXPECT_FLOAT_EQ(ColorGrader::SkinDampen({{0, 0, 20, 20}}, cv::Size(100, 100)), 1.0f);
  EXPECT_FLOAT_EQ(ColorGrader::SkinDampen({}, cv::Size(100, 100)), 1.0f);

  ColorGrader::Params params;
  params.warmth = 1.0f;
  const Hsl in{0.1f, 0.5f, 0.5f};
  const Hsl full = ColorGrader::GradePixel(in, HueCategory::SkinWarm, true, params, 1.0f);
  const Hsl damped = ColorGrader::GradePixel(in, HueCategory::SkinWarm, true, params, 0.78f);
  EXPECT_LT(HueGap(damped.h, in.h), HueGap(full.h, in.h));
}

TEST(ColorGraderTest, GradedComponentsStayInRange) {
  ColorGrader::Params params;
  params.warmth = 1.0f;
  params.saturation = 1.0f;
  for (float l = 0.0f; l <= 1.0f; l += 0.05f) {
    for (float s = 0.0f; s <= 1.0f; s += 0.25f) {
      for (float h = 0.0f; h < 1.0f; h += 0.1f) {
        const Hsl in{h, s, l};
        for (bool skin : {false, true}) {
          const Hsl out = ColorGrader::GradePixel(in, ColorGrader::Classify(h, s), skin, params, 1.0f);
          EXPECT_GE(out.h, 0.0f);
          EXPECT_LT(out.h, 1.0f);
          EXPECT_GE(out.s, 0.0f);
          EXPECT_LE(out.s, 1.0f);
          EXPECT_GE(out.l, 0.0f);
          EXPECT_LE(out.l, 1.0f);
        }
      }
    }
  }
}

TEST(ColorGraderTest, NeutralGrayStaysGrayWithoutWarmth) {
  ColorGrader::Params params;
  params.warmth = 0.0f;
  const cv::Mat out = ColorGrader::Apply(Solid(4, 4, 128, 128, 128), params, {});
  const cv::Vec4b p = out.at<cv::Vec4b>(2, 2);
  EXPECT_EQ(p[0], p[1]);
  EXPECT_EQ(p[1], p[2]);
}

TEST(ColorGraderTest, WarmthTintsNeutralMidtonesAmber) {
  ColorGrader::Params params;
  params.warmth = 1.0f;
  params.saturation = 1.0f;
  const cv::Vec4b p = ColorGrader::Apply(Solid(4, 4, 128, 128, 128), params, {}).at<cv::Vec4b>(0, 0);
  EXPECT_GT(p[0], p[2]);
}

TEST(ColorGraderTest, FaceBoxForcesTheSkinRamp) {
  ColorGrader::Params params;
  params.warmth = 0.8f;
  const cv::Mat in = Solid(10, 10, 40, 60, 200);
  const cv::Mat out = ColorGrader::Apply(in, params, {{0, 0, 3, 3}});
  EXPECT_NE(out.at<cv::Vec4b>(1, 1), out.at<cv::Vec4b>(8, 8));
}

TEST(ColorGraderTest, WithoutFacesOnlyTheHeuristicDecidesSkin) {
  ColorGrader::Params params;
  const cv::Mat in = Noise(16, 12);
  const cv::Mat out = ColorGrader::Apply(in, params, {});
  ASSERT_EQ(out.size(), in.size());
  EXPECT_TRUE(SameAlpha(in, out));
  for (int y = 0; y < in.rows; ++y) {
    for (int x = 0; x < in.cols; ++x) {
      const cv::Vec4b& px = in.at<cv::Vec4b>(y, x);
      const Hsl hsl = ColorSpace::RgbToHsl(px[0], px[1], px[2]);
      const bool skin = ColorGrader::LooksLikeSkin(px[0], px[1], px[2], hsl);
      const cv::Vec3b expected = ColorSpace::HslToRgb(
          ColorGrader::GradePixel(hsl, ColorGrader::Classify(hsl.h, hsl.s), skin, params, 1.0f));
      const cv::Vec4b& got = out.at<cv::Vec4b>(y, x);
      EXPECT_EQ(cv::Vec3b(got[0], got[1], got[2]), expected);
    }
  }
}

TEST(ColorGraderTest, InvalidInputYieldsEmpty) {
  EXPECT_TRUE(ColorGrader::Apply(cv::Mat(), ColorGrader::Params(), {}).empty());
}
