#include "CanvasEffects.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float kPi = 3.14159265358979f;
constexpr float kWarpPeriod = 3.2f;
constexpr float kWeftPeriod = 3.7f;
constexpr float kThreadAmplitude = 6.0f;
constexpr float kUndulationAmplitude = 4.0f;
} // namespace

float CanvasEffects::TextureOffset(int x, int y) {
  const float fx = static_cast<float>(x);
  const float fy = static_cast<float>(y);
  const float threads = std::sin(fx * 2.0f * kPi / kWarpPeriod) +
                        std::sin(fy * 2.0f * kPi / kWeftPeriod);
  const float undulation = std::sin(fx * 0.031f + fy * 0.017f) +
                           std::sin(fy * 0.023f - fx * 0.011f);
  return threads * kThreadAmplitude + undulation * kUndulationAmplitude;
}

cv::Mat CanvasEffects::Texture(const cv::Mat& rgba, float strength) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  if (strength <= 0.0f) return rgba.clone();

  cv::Mat out(rgba.size(), CV_8UC4);
  for (int y = 0; y < rgba.rows; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgba.cols; ++x) {
      const float t = TextureOffset(x, y) * strength;
      dst[x] = cv::Vec4b(cv::saturate_cast<uchar>(src[x][0] + t),
                         cv::saturate_cast<uchar>(src[x][1] + t),
                         cv::saturate_cast<uchar>(src[x][2] + t),
                         src[x][3]);
    }
  }
  return out;
}

cv::Mat CanvasEffects::Vignette(const cv::Mat& rgba, float strength) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  if (strength <= 0.0f) return rgba.clone();

  const float cx = rgba.cols * 0.5f;
  const float cy = rgba.rows * 0.5f;
  const float maxDist = std::sqrt(cx * cx + cy * cy);

  cv::Mat out(rgba.size(), CV_8UC4);
  for (int y = 0; y < rgba.rows; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    const float dy = (y + 0.5f) - cy;
    for (int x = 0; x < rgba.cols; ++x) {
      const float dx = (x + 0.5f) - cx;
      const float d = std::sqrt(dx * dx + dy * dy) / maxDist;
      const float factor = std::max(0.0f, 1.0f - d * d * strength);
      dst[x] = cv::Vec4b(cv::saturate_cast<uchar>(src[x][0] * factor),
                         cv::saturate_cast<uchar>(src[x][1] * factor),
                         cv::saturate_cast<uchar>(src[x][2] * factor),
                         src[x][3]);
    }
  }
  return out;
}
