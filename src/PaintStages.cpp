#include "PaintStages.h"

#include "ColorSpace.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <opencv2/imgproc.hpp>

namespace {
inline int ClampInt(int v, int lo, int hi) { return std::max(lo, std::min(v, hi)); }

inline bool IsRgba(const cv::Mat& m) { return !m.empty() && m.type() == CV_8UC4; }

constexpr float kDetailEngageThreshold = 0.4f;
constexpr float kDetailNoiseFloor = 8.0f;
constexpr float kDetailNoiseScale = 0.1f;
constexpr float kDetailKnee = 30.0f;
constexpr float kDetailFaceBoost = 1.4f;
} // namespace

cv::Mat PaintStages::Bilateral(const cv::Mat& rgba, const BilateralParams& params,
                               const FaceRegions& faces) {
  if (!IsRgba(rgba)) return {};
  const int w = rgba.cols;
  const int h = rgba.rows;
  cv::Mat out(rgba.size(), CV_8UC4);

  const float twoSigmaSpace2 = 2.0f * params.sigmaSpace * params.sigmaSpace;

  for (int y = 0; y < h; ++y) {
    const cv::Vec4b* srcRow = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dstRow = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < w; ++x) {
      int radius = params.radius;
      float sigmaColor = params.sigmaColor;
      if (faces::InsideAny(faces, x, y)) {
        radius += params.faceRadiusBoost;
        sigmaColor *= params.faceSigmaColorRatio;
      }
      const float twoSigmaColor2 = 2.0f * sigmaColor * sigmaColor;

      const cv::Vec4b& c = srcRow[x];
      float sumR = 0.0f, sumG = 0.0f, sumB = 0.0f, sumW = 0.0f;

      for (int dy = -radius; dy <= radius; ++dy) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(ClampInt(y + dy, 0, h - 1));
        for (int dx = -radius; dx <= radius; ++dx) {
          const cv::Vec4b& n = row[ClampInt(x + dx, 0, w - 1)];
          const float dr = static_cast<float>(n[0]) - c[0];
          const float dg = static_cast<float>(n[1]) - c[1];
          const float db = static_cast<float>(n[2]) - c[2];
          const float colorDist2 = dr * dr + dg * dg + db * db;
          const float spatial2 = static_cast<float>(dx * dx + dy * dy);

          const float weight = std::exp(-spatial2 / twoSigmaSpace2) *
                               std::exp(-colorDist2 / twoSigmaColor2);
          sumR += n[0] * weight;
          sumG += n[1] * weight;
          sumB += n[2] * weight;
          sumW += weight;
        }
      }

      // The centre sample always contributes weight 1, so sumW >= 1.
      dstRow[x] = cv::Vec4b(cv::saturate_cast<uchar>(sumR / sumW),
                            cv::saturate_cast<uchar>(sumG / sumW),
                            cv::saturate_cast<uchar>(sumB / sumW),
                            c[3]);
    }
  }
  return out;
}

cv::Mat PaintStages::OilPaint(const cv::Mat& rgba, int radius, const FaceRegions& faces) {
  if (!IsRgba(rgba)) return {};
  radius = std::max(1, radius);
  const int w = rgba.cols;
  const int h = rgba.rows;
  cv::Mat out(rgba.size(), CV_8UC4);

  // Quadrant spans relative to the pixel, inclusive: TL, TR, BL, BR.
  struct Quadrant { int sx, ex, sy, ey; };

  for (int y = 0; y < h; ++y) {
    cv::Vec4b* dstRow = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < w; ++x) {
      int r = radius;
      if (faces::InsideAny(faces, x, y)) {
        r = std::max(2, static_cast<int>(std::floor(radius * 0.5)));
      }

      const Quadrant quadrants[4] = {
          {-r, 0, -r, 0},
          {0, r, -r, 0},
          {-r, 0, 0, r},
          {0, r, 0, r},
      };

      double bestVar = std::numeric_limits<double>::max();
      double bestR = 0.0, bestG = 0.0, bestB = 0.0;

      for (const Quadrant& q : quadrants) {
        double sumR = 0.0, sumG = 0.0, sumB = 0.0;
        double sumR2 = 0.0, sumG2 = 0.0, sumB2 = 0.0;
        int count = 0;

        for (int dy = q.sy; dy <= q.ey; ++dy) {
          const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(ClampInt(y + dy, 0, h - 1));
          for (int dx = q.sx; dx <= q.ex; ++dx) {
            const cv::Vec4b& p = row[ClampInt(x + dx, 0, w - 1)];
            sumR += p[0]; sumG += p[1]; sumB += p[2];
            sumR2 += p[0] * p[0]; sumG2 += p[1] * p[1]; sumB2 += p[2] * p[2];
            ++count;
          }
        }

        const double meanR = sumR / count;
        const double meanG = sumG / count;
        const double meanB = sumB / count;
        const double variance = (sumR2 / count - meanR * meanR) +
                                (sumG2 / count - meanG * meanG) +
                                (sumB2 / count - meanB * meanB);
        if (variance < bestVar) {
          bestVar = variance;
          bestR = meanR;
          bestG = meanG;
          bestB = meanB;
        }
      }

      dstRow[x] = cv::Vec4b(cv::saturate_cast<uchar>(bestR),
                            cv::saturate_cast<uchar>(bestG),
                            cv::saturate_cast<uchar>(bestB),
                            rgba.ptr<cv::Vec4b>(y)[x][3]);
    }
  }
  return out;
}

cv::Mat PaintStages::Brushstrokes(const cv::Mat& rgba, int strokeLength) {
  if (!IsRgba(rgba)) return {};
  strokeLength = std::max(0, strokeLength);
  const int w = rgba.cols;
  const int h = rgba.rows;
  cv::Mat out = rgba.clone();

  for (int y = 1; y < h - 1; ++y) {
    const cv::Vec4b* above = rgba.ptr<cv::Vec4b>(y - 1);
    const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
    const cv::Vec4b* below = rgba.ptr<cv::Vec4b>(y + 1);
    cv::Vec4b* dstRow = out.ptr<cv::Vec4b>(y);

    for (int x = 1; x < w - 1; ++x) {
      const cv::Vec4b& l = row[x - 1];
      const cv::Vec4b& r = row[x + 1];
      const cv::Vec4b& t = above[x];
      const cv::Vec4b& b = below[x];

      const float gx = static_cast<float>((r[0] - l[0]) + (r[1] - l[1]) + (r[2] - l[2]));
      const float gy = static_cast<float>((b[0] - t[0]) + (b[1] - t[1]) + (b[2] - t[2]));

      // Perpendicular to the gradient; a flat neighborhood collapses to (0,0).
      const float mag = std::sqrt(gx * gx + gy * gy) + 0.001f;
      const float dirX = -gy / mag;
      const float dirY = gx / mag;

      float sumR = 0.0f, sumG = 0.0f, sumB = 0.0f;
      int count = 0;
      for (int k = -strokeLength; k <= strokeLength; ++k) {
        const int nx = ClampInt(static_cast<int>(std::lround(x + dirX * k * 0.5f)), 0, w - 1);
        const int ny = ClampInt(static_cast<int>(std::lround(y + dirY * k * 0.5f)), 0, h - 1);
        const cv::Vec4b& s = rgba.ptr<cv::Vec4b>(ny)[nx];
        sumR += s[0];
        sumG += s[1];
        sumB += s[2];
        ++count;
      }

      dstRow[x] = cv::Vec4b(cv::saturate_cast<uchar>(sumR / count),
                            cv::saturate_cast<uchar>(sumG / count),
                            cv::saturate_cast<uchar>(sumB / count),
                            row[x][3]);
    }
  }
  return out;
}

int PaintStages::DetailBlurRadius(float detailPreservation) {
  const float d = ColorSpace::Clamp01(detailPreservation);
  return std::max(1, static_cast<int>(std::lround(1.0f + 3.0f * (1.0f - d))));
}

float PaintStages::ShapeDetail(float detail) {
  const float mag = std::fabs(detail);
  if (mag <= kDetailNoiseFloor) return detail * kDetailNoiseScale;
  return detail * (1.0f - std::exp(-mag / kDetailKnee));
}

cv::Mat PaintStages::RecoverDetail(const cv::Mat& painted, const cv::Mat& original,
                                   float detailPreservation, const FaceRegions& faces) {
  if (!IsRgba(painted) || !IsRgba(original)) return {};
  if (painted.size() != original.size()) return {};
  if (detailPreservation <= kDetailEngageThreshold) return painted.clone();

  const int w = painted.cols;
  const int h = painted.rows;

  cv::Mat luma(original.size(), CV_32F);
  for (int y = 0; y < h; ++y) {
    const cv::Vec4b* src = original.ptr<cv::Vec4b>(y);
    float* dst = luma.ptr<float>(y);
    for (int x = 0; x < w; ++x) {
      dst[x] = ColorSpace::Luminance(src[x][0], src[x][1], src[x][2]);
    }
  }

  // Separable box blur with replicated borders.
  const int k = 2 * DetailBlurRadius(detailPreservation) + 1;
  cv::Mat blurred;
  cv::blur(luma, blurred, cv::Size(k, k), cv::Point(-1, -1), cv::BORDER_REPLICATE);

  const float gain = detailPreservation * 0.5f;
  cv::Mat out = painted.clone();
  for (int y = 0; y < h; ++y) {
    const float* lumaRow = luma.ptr<float>(y);
    const float* blurRow = blurred.ptr<float>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < w; ++x) {
      // High-pass is luma - blur: adding it back restores detail the paint passes removed.
      float adjust = ShapeDetail(lumaRow[x] - blurRow[x]) * gain;
      if (faces::InsideAny(faces, x, y)) adjust *= kDetailFaceBoost;
      dst[x][0] = cv::saturate_cast<uchar>(dst[x][0] + adjust);
      dst[x][1] = cv::saturate_cast<uchar>(dst[x][1] + adjust);
      dst[x][2] = cv::saturate_cast<uchar>(dst[x][2] + adjust);
    }
  }
  return out;
}
