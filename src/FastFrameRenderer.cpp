#include "FastFrameRenderer.h"

#include "ColorSpace.h"
#include "PainterlyPipeline.h"
#include "PaletteMatcher.h"
#include "Posterizer.h"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace {
constexpr float kShadowLum = 85.0f;
constexpr float kHighlightLum = 170.0f;
constexpr float kHazeOpacity = 0.08f;
constexpr float kSplitToneOpacity = 0.18f;
constexpr float kVignetteStrength = 0.35f;
constexpr float kBackgroundDim = 0.82f;

const cv::Vec3f kHaze(236.0f, 220.0f, 190.0f);
const cv::Vec3f kShadowTone(40.0f, 90.0f, 100.0f);
const cv::Vec3f kHighlightTone(230.0f, 170.0f, 90.0f);
const cv::Vec3f kInk(35.0f, 25.0f, 20.0f);

inline float Screen(float a, float b) { return 255.0f - (255.0f - a) * (255.0f - b) / 255.0f; }

inline float Overlay(float a, float b) {
  return a < 128.0f ? 2.0f * a * b / 255.0f : 255.0f - 2.0f * (255.0f - a) * (255.0f - b) / 255.0f;
}

// Tone shift, quantize, S-curve and palette in one pass over the small frame.
void StylizeSmall(cv::Mat& small, const FilterParameters& p, const Palette& palette) {
  uchar lut[256];
  for (int v = 0; v < 256; ++v) lut[v] = Posterizer::QuantizeValue(v, p.posterizeLevels);

  for (int y = 0; y < small.rows; ++y) {
    cv::Vec4b* row = small.ptr<cv::Vec4b>(y);
    for (int x = 0; x < small.cols; ++x) {
      float r = row[x][0], g = row[x][1], b = row[x][2];
      const float lum = ColorSpace::Luminance(r, g, b);

      if (lum < kShadowLum) {
        const float k = (1.0f - lum / kShadowLum) * 14.0f;
        r -= k * 0.6f;
        g += k * 0.2f;
        b += k * 0.5f;
      } else if (lum > kHighlightLum) {
        const float k = (lum - kHighlightLum) / (255.0f - kHighlightLum) * 18.0f * p.warmth;
        r += k;
        g += k * 0.5f;
        b -= k * 0.6f;
      }

      int ch[3] = {cv::saturate_cast<uchar>(r), cv::saturate_cast<uchar>(g),
                   cv::saturate_cast<uchar>(b)};
      for (int c = 0; c < 3; ++c) {
        ch[c] = cv::saturate_cast<uchar>(FastFrameRenderer::SCurve(lut[ch[c]]));
      }

      if (!palette.empty()) {
        const PaletteMatcher::Match m = PaletteMatcher::FindTwoNearest(ch[0], ch[1], ch[2], palette);
        const cv::Vec3b& s = palette.swatches[m.nearest].rgb;
        ch[0] = s[0]; ch[1] = s[1]; ch[2] = s[2];
      }
      row[x] = cv::Vec4b(static_cast<uchar>(ch[0]), static_cast<uchar>(ch[1]),
                         static_cast<uchar>(ch[2]), row[x][3]);
    }
  }
}

// Outline pass on luminance. The comparison runs on squared magnitudes; the
// root is taken only for pixels that pass.
void InkEdges(cv::Mat& small, float edgeStrength) {
  if (edgeStrength <= 0.0f || small.cols < 3 || small.rows < 3) return;
  const float threshold = 24.0f + (1.0f - edgeStrength) * 40.0f;
  const float threshold2 = threshold * threshold;

  cv::Mat lum(small.size(), CV_32F);
  for (int y = 0; y < small.rows; ++y) {
    const cv::Vec4b* s = small.ptr<cv::Vec4b>(y);
    float* d = lum.ptr<float>(y);
    for (int x = 0; x < small.cols; ++x) d[x] = ColorSpace::Luminance(s[x][0], s[x][1], s[x][2]);
  }

  for (int y = 1; y < small.rows - 1; ++y) {
    const float* up = lum.ptr<float>(y - 1);
    const float* mid = lum.ptr<float>(y);
    const float* down = lum.ptr<float>(y + 1);
    cv::Vec4b* row = small.ptr<cv::Vec4b>(y);
    for (int x = 1; x < small.cols - 1; ++x) {
      const float gx = mid[x + 1] - mid[x - 1];
      const float gy = down[x] - up[x];
      const float g2 = gx * gx + gy * gy;
      if (g2 <= threshold2) continue;
      const float alpha = std::min(1.0f, (std::sqrt(g2) - threshold) / threshold) * edgeStrength * 0.7f;
      for (int c = 0; c < 3; ++c) {
        row[x][c] = cv::saturate_cast<uchar>(row[x][c] * (1.0f - alpha) + kInk[c] * alpha);
      }
    }
  }
}

// Full-resolution finishing: haze, split-tone and vignette.
void Finish(cv::Mat& frame, float intensity) {
  const float cx = frame.cols * 0.5f;
  const float cy = frame.rows * 0.5f;
  const float maxDist2 = cx * cx + cy * cy;
  const float vignette = kVignetteStrength * intensity;

  for (int y = 0; y < frame.rows; ++y) {
    cv::Vec4b* row = frame.ptr<cv::Vec4b>(y);
    const float dy = (y + 0.5f) - cy;
    for (int x = 0; x < frame.cols; ++x) {
      const float dx = (x + 0.5f) - cx;
      const float factor = std::max(0.0f, 1.0f - (dx * dx + dy * dy) / maxDist2 * vignette);
      const float lum = ColorSpace::Luminance(row[x][0], row[x][1], row[x][2]);
      const cv::Vec3f& tone = lum < 128.0f ? kShadowTone : kHighlightTone;
      for (int c = 0; c < 3; ++c) {
        float v = row[x][c];
        v += (Screen(v, kHaze[c]) - v) * kHazeOpacity;
        v += (Overlay(v, tone[c]) - v) * kSplitToneOpacity;
        row[x][c] = cv::saturate_cast<uchar>(v * factor);
      }
    }
  }
}

cv::Mat SoftBackground(const cv::Mat& frame) {
  const int k = (std::max(frame.cols, frame.rows) / 40) | 1;
  cv::Mat blurred;
  cv::GaussianBlur(frame, blurred, cv::Size(std::max(3, k), std::max(3, k)), 0.0, 0.0,
                   cv::BORDER_REPLICATE);
  for (int y = 0; y < blurred.rows; ++y) {
    cv::Vec4b* row = blurred.ptr<cv::Vec4b>(y);
    for (int x = 0; x < blurred.cols; ++x) {
      const float lum = ColorSpace::Luminance(row[x][0], row[x][1], row[x][2]);
      for (int c = 0; c < 3; ++c) {
        const float desat = row[x][c] + (lum - row[x][c]) * 0.3f;
        row[x][c] = cv::saturate_cast<uchar>(desat * kBackgroundDim);
      }
    }
  }
  return blurred;
}
} // namespace

float FastFrameRenderer::SCurve(float v) {
  const float t = ColorSpace::Clamp01(v / 255.0f);
  const float smooth = t * t * (3.0f - 2.0f * t);
  return (t + (smooth - t) * 0.5f) * 255.0f;
}

cv::Mat FastFrameRenderer::SubjectMask(const cv::Size& size, const FaceRegions& faces) {
  if (faces.empty() || size.area() <= 0) return cv::Mat(size, CV_32F, cv::Scalar(0));

  cv::Mat mask(size, CV_8U, cv::Scalar(0));
  const auto fill = [&mask](double cx, double cy, double ax, double ay) {
    cv::ellipse(mask, cv::Point(static_cast<int>(std::lround(cx)), static_cast<int>(std::lround(cy))),
                cv::Size(std::max(1, static_cast<int>(std::lround(ax))),
                         std::max(1, static_cast<int>(std::lround(ay)))),
                0.0, 0.0, 360.0, cv::Scalar(255), cv::FILLED);
  };

  int feather = 0;
  for (const FaceRegion& f : faces) {
    if (f.width <= 0 || f.height <= 0) continue;
    const double cx = f.x + f.width * 0.5;
    const double fw = f.width;
    const double fh = f.height;
    fill(cx, f.y + fh * 0.5, fw * 0.65, fh * 0.85); // head
    fill(cx, f.y + fh * 1.6, fw * 1.6, fh * 0.6);   // shoulders
    fill(cx, f.y + fh * 2.6, fw * 1.3, fh * 1.3);   // torso
    feather = std::max(feather, static_cast<int>(fw * 0.15));
  }

  cv::Mat maskF;
  mask.convertTo(maskF, CV_32F, 1.0 / 255.0);
  const double sigma = std::max(4, feather);
  cv::GaussianBlur(maskF, maskF, cv::Size(0, 0), sigma, sigma, cv::BORDER_REPLICATE);
  return maskF;
}

cv::Mat FastFrameRenderer::Render(const cv::Mat& frameRgba, const FilterParameters& params,
                                  const Palette& palette, const FaceRegions& faces) {
  if (frameRgba.empty() || frameRgba.type() != CV_8UC4) return {};
  const FilterParameters p = params.Sanitized();

  const cv::Size smallSize(std::max(1, static_cast<int>(std::lround(frameRgba.cols * kProcessingScale))),
                           std::max(1, static_cast<int>(std::lround(frameRgba.rows * kProcessingScale))));
  // Step 1: Downscale and soften.
  // Why: the per-pixel work scales with area; at 0.55 it costs about a third,
  // and the 3x3 blur stands in for the bilateral pass of the full pipeline.
  cv::Mat small;
  cv::resize(frameRgba, small, smallSize, 0, 0, cv::INTER_AREA);
  cv::blur(small, small, cv::Size(3, 3), cv::Point(-1, -1), cv::BORDER_REPLICATE);

  // Step 2: Tone shift, quantize, S-curve and palette in one fused loop.
  StylizeSmall(small, p, palette);
  InkEdges(small, p.edgeStrength);

  // Step 3: Back to full size, then haze, split-tone and vignette.
  // Why: finishing at full resolution keeps the vignette and tones free of
  // upscaling blockiness.
  cv::Mat styled;
  cv::resize(small, styled, frameRgba.size(), 0, 0, cv::INTER_LINEAR);
  Finish(styled, p.intensity);

  // Step 4 (optional): Keep the subject crisp over a softened, dimmed backdrop.
  if (!faces.empty()) {
    const cv::Mat mask = SubjectMask(styled.size(), faces);
    const cv::Mat backdrop = SoftBackground(styled);
    for (int y = 0; y < styled.rows; ++y) {
      const float* m = mask.ptr<float>(y);
      const cv::Vec4b* bg = backdrop.ptr<cv::Vec4b>(y);
      cv::Vec4b* fg = styled.ptr<cv::Vec4b>(y);
      for (int x = 0; x < styled.cols; ++x) {
        for (int c = 0; c < 3; ++c) {
          fg[x][c] = cv::saturate_cast<uchar>(fg[x][c] * m[x] + bg[x][c] * (1.0f - m[x]));
        }
      }
    }
  }

  // Alpha from the source frame.
  for (int y = 0; y < styled.rows; ++y) {
    const cv::Vec4b* src = frameRgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = styled.ptr<cv::Vec4b>(y);
    for (int x = 0; x < styled.cols; ++x) dst[x][3] = src[x][3];
  }
  return PainterlyPipeline::BlendWithSource(frameRgba, styled, p.intensity);
}
