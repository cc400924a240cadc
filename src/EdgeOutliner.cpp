#include "EdgeOutliner.h"

#include "ColorSpace.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float kEdgeThreshold = 0.15f;
constexpr float kEdgeRamp = 2.5f;
constexpr float kFineDetailEngage = 0.3f;
constexpr float kFineWeightScale = 0.6f;
constexpr int kWarmOutline = 20;
constexpr int kCoolOutline = -10;

// Outline colors (RGB)
const cv::Vec3b kSienna(58, 32, 22);
const cv::Vec3b kDarkTeal(18, 42, 46);
const cv::Vec3b kSepia(35, 25, 20);
} // namespace

EdgeOutliner::Params EdgeOutliner::FromSettings(float edgeStrength, float detailPreservation) {
  Params p;
  p.edgeStrength = ColorSpace::Clamp01(edgeStrength);
  p.fineDetail = detailPreservation > kFineDetailEngage;
  p.fineWeight = p.fineDetail ? kFineWeightScale * ColorSpace::Clamp01(detailPreservation) : 0.0f;
  return p;
}

cv::Mat EdgeOutliner::EdgeMap(const cv::Mat& rgba, bool fineDetail, float fineWeight) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  const int w = rgba.cols;
  const int h = rgba.rows;

  cv::Mat gray(rgba.size(), CV_32F);
  for (int y = 0; y < h; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    float* dst = gray.ptr<float>(y);
    for (int x = 0; x < w; ++x) dst[x] = ColorSpace::Luminance(src[x][0], src[x][1], src[x][2]);
  }

  cv::Mat edges(rgba.size(), CV_32F, cv::Scalar(0));
  float maxVal = 0.0f;

  for (int y = 1; y < h - 1; ++y) {
    const float* r0 = gray.ptr<float>(y - 1);
    const float* r1 = gray.ptr<float>(y);
    const float* r2 = gray.ptr<float>(y + 1);
    float* out = edges.ptr<float>(y);
    for (int x = 1; x < w - 1; ++x) {
      const float gx = -r0[x - 1] - 2.0f * r1[x - 1] - r2[x - 1] +
                        r0[x + 1] + 2.0f * r1[x + 1] + r2[x + 1];
      const float gy = -r0[x - 1] - 2.0f * r0[x] - r0[x + 1] +
                        r2[x - 1] + 2.0f * r2[x] + r2[x + 1];
      float v = std::sqrt(gx * gx + gy * gy);
      if (fineDetail) {
        const float lap = r0[x] + r2[x] + r1[x - 1] + r1[x + 1] - 4.0f * r1[x];
        v += std::fabs(lap) * fineWeight;
      }
      out[x] = v;
      maxVal = std::max(maxVal, v);
    }
  }

  if (maxVal > 0.0f) edges *= 1.0f / maxVal;
  return edges;
}

cv::Vec3b EdgeOutliner::OutlineColor(int r, int b) {
  const int warmth = r - b;
  if (warmth > kWarmOutline) return kSienna;
  if (warmth < kCoolOutline) return kDarkTeal;
  return kSepia;
}

float EdgeOutliner::OutlineAlpha(float edge, float edgeStrength) {
  if (edge <= kEdgeThreshold) return 0.0f;
  return std::min(1.0f, (edge - kEdgeThreshold) * kEdgeRamp) * edgeStrength;
}

cv::Mat EdgeOutliner::Apply(const cv::Mat& rgba, const Params& params) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  const cv::Mat edges = EdgeMap(rgba, params.fineDetail, params.fineWeight);

  cv::Mat out = rgba.clone();
  for (int y = 0; y < out.rows; ++y) {
    const float* e = edges.ptr<float>(y);
    cv::Vec4b* px = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < out.cols; ++x) {
      const float alpha = OutlineAlpha(e[x], params.edgeStrength);
      if (alpha <= 0.0f) continue;
      const cv::Vec3b ink = OutlineColor(px[x][0], px[x][2]);
      for (int c = 0; c < 3; ++c) {
        px[x][c] = cv::saturate_cast<uchar>(px[x][c] * (1.0f - alpha) + ink[c] * alpha);
      }
    }
  }
  return out;
}
