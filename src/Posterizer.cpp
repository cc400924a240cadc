#include "Posterizer.h"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace {
constexpr int kMaxFaceLevels = 12;
constexpr float kCleanupDetailLimit = 0.5f;
} // namespace

uchar Posterizer::QuantizeValue(int value, int levels) {
  levels = std::max(2, levels);
  const double step = 255.0 / (levels - 1);
  const double q = std::round(std::round(value / step) * step);
  return cv::saturate_cast<uchar>(q);
}

int Posterizer::FaceLevels(int levels) {
  return std::min(levels + 2, kMaxFaceLevels);
}

int Posterizer::DetailBoostedLevels(int levels, float detailPreservation) {
  if (detailPreservation <= kCleanupDetailLimit) return levels;
  const int boost = static_cast<int>(std::lround((detailPreservation - 0.5f) * 4.0f));
  return levels + std::max(0, std::min(boost, 2));
}

cv::Mat Posterizer::Quantize(const cv::Mat& rgba, int levels, const FaceRegions& faces) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  levels = std::max(2, levels);
  const int faceLevels = FaceLevels(levels);

  // Lookup tables for both level counts.
  uchar lut[256];
  uchar faceLut[256];
  bool onGrid[256];
  bool onFaceGrid[256];
  for (int v = 0; v < 256; ++v) {
    lut[v] = QuantizeValue(v, levels);
    faceLut[v] = QuantizeValue(v, faceLevels);
    onGrid[v] = lut[v] == v;
    onFaceGrid[v] = faceLut[v] == v;
  }

  cv::Mat out(rgba.size(), CV_8UC4);
  for (int y = 0; y < rgba.rows; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgba.cols; ++x) {
      const cv::Vec4b& p = src[x];
      // Already posterized on either grid: leave it. Quantizing can flip the
      // skin test, so without this a second pass would pick the other table.
      if ((onGrid[p[0]] && onGrid[p[1]] && onGrid[p[2]]) ||
          (onFaceGrid[p[0]] && onFaceGrid[p[1]] && onFaceGrid[p[2]])) {
        dst[x] = p;
        continue;
      }
      const bool skin = faces::InsideAny(faces, x, y) || LooksLikeSkin(p[0], p[1], p[2]);
      const uchar* table = skin ? faceLut : lut;
      dst[x] = cv::Vec4b(table[p[0]], table[p[1]], table[p[2]], p[3]);
    }
  }
  return out;
}

cv::Mat Posterizer::Apply(const cv::Mat& rgba, int levels, float detailPreservation,
                          const FaceRegions& faces) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};

  if (detailPreservation > kCleanupDetailLimit) {
    return Quantize(rgba, DetailBoostedLevels(levels, detailPreservation), faces);
  }

  cv::Mat first = Quantize(rgba, levels, faces);

  // Cleanup: knock out single-pixel quantization noise, then re-quantize.
  cv::Mat softened;
  cv::blur(first, softened, cv::Size(3, 3), cv::Point(-1, -1), cv::BORDER_REPLICATE);
  cv::Mat out = Quantize(softened, levels, faces);

  // Blur touched alpha too; restore it.
  for (int y = 0; y < out.rows; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < out.cols; ++x) dst[x][3] = src[x][3];
  }
  return out;
}
