#include "PaintStages.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace testing_util;

TEST(PaintStagesTest, InvalidInputYieldsEmpty) {
  const cv::Mat bgr(8, 8, CV_8UC3, cv::Scalar::all(10));
  EXPECT_TRUE(PaintStages::Bilateral(cv::Mat(), PaintStages::BilateralParams(), {}).empty());
  EXPECT_TRUE(PaintStages::Bilateral(bgr, PaintStages::BilateralParams(), {}).empty());
  EXPECT_TRUE(PaintStages::OilPaint(bgr, 4, {}).empty());
  EXPECT_TRUE(PaintStages::Brushstrokes(cv::Mat(), 3).empty());
  EXPECT_TRUE(PaintStages::RecoverDetail(Solid(4, 4, 0, 0, 0), Solid(5, 4, 0, 0, 0), 0.9f, {}).empty());
}

TEST(PaintStagesTest, BilateralKeepsFlatColor) {
  const cv::Mat in = Solid(12, 9, 140, 90, 40, 200);
  const cv::Mat out = PaintStages::Bilateral(in, PaintStages::BilateralParams(), {{2, 2, 4, 4}});
  EXPECT_TRUE(Identical(in, out));
}

TEST(PaintStagesTest, StagesPreserveSizeAndAlpha) {
  const cv::Mat in = Noise(17, 11);
  const FaceRegions faces = {{3, 3, 5, 5}};
  const cv::Mat bilateral = PaintStages::Bilateral(in, PaintStages::BilateralParams(), faces);
  const cv::Mat oil = PaintStages::OilPaint(in, 4, faces);
  const cv::Mat strokes = PaintStages::Brushstrokes(in, 3);
  const cv::Mat detail = PaintStages::RecoverDetail(oil, in, 0.9f, faces);
  for (const cv::Mat* m : {&bilateral, &oil, &strokes, &detail}) {
    ASSERT_EQ(m->size(), in.size());
    ASSERT_EQ(m->type(), CV_8UC4);
    EXPECT_TRUE(SameAlpha(in, *m));
  }
}

TEST(PaintStagesTest, OilPaintOfConstantRasterIsConstant) {
  const cv::Mat in = Solid(10, 10, 77, 150, 201);
  EXPECT_TRUE(Identical(in, PaintStages::OilPaint(in, 5, {})));
  EXPECT_TRUE(Identical(in, PaintStages::OilPaint(in, 5, {{0, 0, 9, 9}})));
}

TEST(PaintStagesTest, OilPaintKeepsAStepEdgeSharp) {
  const cv::Mat in = Step(16, 8);
  const cv::Mat out = PaintStages::OilPaint(in, 3, {});
  // Each side finds a flat quadrant, so the edge does not smear.
  EXPECT_EQ(out.at<cv::Vec4b>(4, 7)[0], 30);
  EXPECT_EQ(out.at<cv::Vec4b>(4, 8)[0], 220);
}

TEST(PaintStagesTest, BrushstrokesLeaveTheBorderUntouched) {
  const cv::Mat in = Noise(9, 7);
  const cv::Mat out = PaintStages::Brushstrokes(in, 3);
  for (int x = 0; x < in.cols; ++x) {
    EXPECT_EQ(in.at<cv::Vec4b>(0, x), out.at<cv::Vec4b>(0, x));
    EXPECT_EQ(in.at<cv::Vec4b>(in.rows - 1, x), out.at<cv::Vec4b>(in.rows - 1, x));
  }
  for (int y = 0; y < in.rows; ++y) {
    EXPECT_EQ(in.at<cv::Vec4b>(y, 0), out.at<cv::Vec4b>(y, 0));
    EXPECT_EQ(in.at<cv::Vec4b>(y, in.cols - 1), out.at<cv::Vec4b>(y, in.cols - 1));
  }
}

TEST(PaintStagesTest, BrushstrokesOnFlatColorIsIdentity) {
  const cv::Mat in = Solid(8, 8, 10, 200, 30);
  EXPECT_TRUE(Identical(in, PaintStages::Brushstrokes(in, 3)));
}

TEST(PaintStagesTest, RecoverDetailIsANoOpAtLowSettings) {
  const cv::Mat painted = Noise(10, 10, 1);
  const cv::Mat original = Noise(10, 10, 2);
  EXPECT_TRUE(Identical(painted, PaintStages::RecoverDetail(painted, original, 0.4f, {})));
  EXPECT_TRUE(Identical(painted, PaintStages::RecoverDetail(painted, original, 0.0f, {})));
}

TEST(PaintStagesTest, RecoverDetailAddsNothingFromAFlatOriginal) {
  const cv::Mat painted = Noise(10, 10, 3);
  const cv::Mat original = Solid(10, 10, 90, 90, 90);
  EXPECT_TRUE(Identical(painted, PaintStages::RecoverDetail(painted, original, 1.0f, {})));
}

TEST(PaintStagesTest, RecoverDetailSharpensAStep) {
  const cv::Mat step = Step(16, 8);
  const cv::Mat out = PaintStages::RecoverDetail(step, step, 1.0f, {});
  EXPECT_GT(out.at<cv::Vec4b>(4, 8)[0], 220);
  EXPECT_LT(out.at<cv::Vec4b>(4, 7)[0], 30);
  // Far from the edge the high-pass is zero.
  EXPECT_EQ(out.at<cv::Vec4b>(4, 0)[0], 30);
  EXPECT_EQ(out.at<cv::Vec4b>(4, 15)[0], 220);
}

TEST(PaintStagesTest, DetailShapingAttenuatesNoise) {
  EXPECT_NEAR(PaintStages::ShapeDetail(5.0f), 0.5f, 1e-5f);
  EXPECT_NEAR(PaintStages::ShapeDetail(-5.0f), -0.5f, 1e-5f);
  EXPECT_LT(PaintStages::ShapeDetail(200.0f), 200.0f);
  EXPECT_GT(PaintStages::ShapeDetail(200.0f), 199.0f);
  EXPECT_EQ(PaintStages::DetailBlurRadius(1.0f), 1);
  EXPECT_EQ(PaintStages::DetailBlurRadius(0.0f), 4);
}

namespace {
bool InBox(const FaceRegion& f, int x, int y) {
  return f.Contains(x, y);
}
} // namespace

TEST(PaintStagesTest, BilateralWidensAndTightensInsideFaces) {
  const cv::Mat in = Noise(20, 16, 9);
  const FaceRegion box{5, 4, 8, 6};
  const PaintStages::BilateralParams base;
  PaintStages::BilateralParams faceParams = base;
  faceParams.radius = base.radius + base.faceRadiusBoost;
  faceParams.sigmaColor = base.sigmaColor * base.faceSigmaColorRatio;

  const cv::Mat hinted = PaintStages::Bilateral(in, base, {box});
  const cv::Mat plain = PaintStages::Bilateral(in, base, {});
  const cv::Mat faceOnly = PaintStages::Bilateral(in, faceParams, {});

  int changed = 0;
  for (int y = 0; y < in.rows; ++y) {
    for (int x = 0; x < in.cols; ++x) {
      const cv::Vec4b& got = hinted.at<cv::Vec4b>(y, x);
      if (InBox(box, x, y)) {
        EXPECT_EQ(got, faceOnly.at<cv::Vec4b>(y, x)) << x << "," << y;
        if (got != plain.at<cv::Vec4b>(y, x)) ++changed;
      } else {
        EXPECT_EQ(got, plain.at<cv::Vec4b>(y, x)) << x << "," << y;
      }
    }
  }
  EXPECT_GT(changed, 0);
}

TEST(PaintStagesTest, OilPaintHalvesTheRadiusInsideFaces) {
  const cv::Mat in = Noise(24, 20, 4);
  const FaceRegion box{6, 5, 10, 8};
  const cv::Mat hinted = PaintStages::OilPaint(in, 6, {box});
  const cv::Mat wide = PaintStages::OilPaint(in, 6, {});
  const cv::Mat narrow = PaintStages::OilPaint(in, 3, {});

  int changed = 0;
  for (int y = 0; y < in.rows; ++y) {
    for (int x = 0; x < in.cols; ++x) {
      const cv::Vec4b& got = hinted.at<cv::Vec4b>(y, x);
      if (InBox(box, x, y)) {
        EXPECT_EQ(got, narrow.at<cv::Vec4b>(y, x)) << x << "," << y;
        if (got != wide.at<cv::Vec4b>(y, x)) ++changed;
      } else {
        EXPECT_EQ(got, wide.at<cv::Vec4b>(y, x)) << x << "," << y;
      }
    }
  }
  EXPECT_GT(changed, 0);
}

TEST(PaintStagesTest, OilPaintFaceRadiusNeverDropsBelowTwo) {
  const cv::Mat in = Noise(16, 16, 5);
  const FaceRegion box{0, 0, 15, 15};
  EXPECT_TRUE(Identical(PaintStages::OilPaint(in, 3, {box}), PaintStages::OilPaint(in, 2, {})));
}

TEST(PaintStagesTest, RecoverDetailIsStrongerInsideFaces) {
  const cv::Mat step = Step(16, 8, 60, 160);
  const FaceRegion box{0, 0, 15, 3};
  const cv::Mat out = PaintStages::RecoverDetail(step, step, 1.0f, {box});

  // Radius 1 at full detail: the pixel right of the edge sees (60, 160, 160).
  const float highPass = 160.0f - (60.0f + 160.0f + 160.0f) / 3.0f;
  const float adjust = PaintStages::ShapeDetail(highPass) * 0.5f;
  const int outside = out.at<cv::Vec4b>(6, 8)[0] - 160;
  const int inside = out.at<cv::Vec4b>(1, 8)[0] - 160;
  EXPECT_EQ(outside, cv::saturate_cast<uchar>(160.0f + adjust) - 160);
  EXPECT_EQ(inside, cv::saturate_cast<uchar>(160.0f + adjust * 1.4f) - 160);
  EXPECT_GT(inside, outside);
  EXPECT_NEAR(static_cast<float>(inside), outside * 1.4f, 1.0f);
}
