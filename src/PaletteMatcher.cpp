#include "PaletteMatcher.h"

#include "ColorSpace.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <opencv2/core/utils/logger.hpp>

namespace {
constexpr float kLumWeight = 3.0f;
constexpr float kChannelWeight = 0.4f;
constexpr float kWarmthWeight = 0.08f;
constexpr float kDitherThreshold = 0.88f;
constexpr int kAutoSamplesPerSide = 120;

// Helper: compute squared Euclidean distance in RGB space
inline float ColorDistanceSquared(int r, int g, int b, const cv::Vec3b& c) {
  const float dr = static_cast<float>(r) - c[0];
  const float dg = static_cast<float>(g) - c[1];
  const float db = static_cast<float>(b) - c[2];
  return dr * dr + dg * dg + db * db;
}

inline std::uint32_t Mix(std::uint32_t h) {
  h ^= h >> 16;
  h *= 0x7feb352du;
  h ^= h >> 15;
  h *= 0x846ca68bu;
  h ^= h >> 16;
  return h;
}
} // namespace

float PaletteMatcher::Distance(int r, int g, int b, const Swatch& swatch) {
  const float lum = ColorSpace::Luminance(static_cast<float>(r), static_cast<float>(g),
                                          static_cast<float>(b));
  const float desiredWarmth = (lum / 255.0f - 0.4f) * 80.0f;
  const float dLum = lum - swatch.luminance;
  const float dWarm = swatch.warmth - desiredWarmth;
  return kLumWeight * dLum * dLum +
         kChannelWeight * ColorDistanceSquared(r, g, b, swatch.rgb) +
         kWarmthWeight * dWarm * dWarm;
}

PaletteMatcher::Match PaletteMatcher::FindTwoNearest(int r, int g, int b, const Palette& palette) {
  Match m;
  m.nearestDist = std::numeric_limits<float>::max();
  m.secondDist = std::numeric_limits<float>::max();
  bool exactHit = false;

  for (size_t i = 0; i < palette.swatches.size(); ++i) {
    const Swatch& s = palette.swatches[i];
    const float d = Distance(r, g, b, s);
    const bool exact = s.rgb[0] == r && s.rgb[1] == g && s.rgb[2] == b;
    if (exact && !exactHit) {
      // An exact swatch color always wins the top slot.
      exactHit = true;
      m.second = m.nearest;
      m.secondDist = m.nearestDist;
      m.nearest = static_cast<int>(i);
      m.nearestDist = d;
    } else if (!exactHit && d < m.nearestDist) {
      m.second = m.nearest;
      m.secondDist = m.nearestDist;
      m.nearest = static_cast<int>(i);
      m.nearestDist = d;
    } else if (d < m.secondDist) {
      m.second = static_cast<int>(i);
      m.secondDist = d;
    }
  }

  if (exactHit || m.second < 0 || m.secondDist <= 0.0f) {
    m.closeness = 1.0f;
  } else {
    m.closeness = 1.0f - m.nearestDist / m.secondDist;
  }
  return m;
}

float PaletteMatcher::DitherProbability(float closeness) {
  if (closeness > kDitherThreshold) return 0.0f;
  return std::min(0.5f, (kDitherThreshold - closeness) * 1.5f);
}

float PaletteMatcher::HashUnit(int x, int y, int r, int g, int b, unsigned int seed) {
  std::uint32_t h = Mix(static_cast<std::uint32_t>(seed) ^ 0x9e3779b9u);
  h = Mix(h ^ static_cast<std::uint32_t>(x) * 0x85ebca6bu);
  h = Mix(h ^ static_cast<std::uint32_t>(y) * 0xc2b2ae35u);
  h = Mix(h ^ (static_cast<std::uint32_t>(r) | (static_cast<std::uint32_t>(g) << 8) |
               (static_cast<std::uint32_t>(b) << 16)));
  return static_cast<float>(h >> 8) / 16777216.0f; // 24 bits -> [0,1)
}

cv::Vec3b PaletteMatcher::MatchPixel(int x, int y, int r, int g, int b, const Palette& palette,
                                     unsigned int seed) {
  if (palette.empty()) return cv::Vec3b(static_cast<uchar>(r), static_cast<uchar>(g),
                                        static_cast<uchar>(b));
  const Match m = FindTwoNearest(r, g, b, palette);
  const float p = DitherProbability(m.closeness);
  if (p > 0.0f && m.second >= 0 && HashUnit(x, y, r, g, b, seed) < p) {
    return palette.swatches[m.second].rgb;
  }
  return palette.swatches[m.nearest].rgb;
}

cv::Mat PaletteMatcher::Apply(const cv::Mat& rgba, const Palette& palette, unsigned int seed) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  if (palette.empty()) return rgba.clone();

  cv::Mat out(rgba.size(), CV_8UC4);
  for (int y = 0; y < rgba.rows; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgba.cols; ++x) {
      const cv::Vec4b& p = src[x];
      const cv::Vec3b c = MatchPixel(x, y, p[0], p[1], p[2], palette, seed);
      dst[x] = cv::Vec4b(c[0], c[1], c[2], p[3]);
    }
  }
  return out;
}

double PaletteMatcher::Score(const cv::Mat& rgba, const Palette& palette) {
  if (rgba.empty() || rgba.type() != CV_8UC4 || palette.empty()) {
    return std::numeric_limits<double>::infinity();
  }
  const int stride = std::max(1, std::min(rgba.cols, rgba.rows) / kAutoSamplesPerSide);

  double total = 0.0;
  long long samples = 0;
  for (int y = 0; y < rgba.rows; y += stride) {
    const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgba.cols; x += stride) {
      const cv::Vec4b& p = row[x];
      float best = std::numeric_limits<float>::max();
      for (const Swatch& s : palette.swatches) {
        best = std::min(best, ColorDistanceSquared(p[0], p[1], p[2], s.rgb));
      }
      total += best;
      ++samples;
    }
  }
  if (samples == 0) return std::numeric_limits<double>::infinity();
  return total / static_cast<double>(samples);
}

int PaletteMatcher::AutoDetect(const cv::Mat& rgba, const std::vector<Palette>& candidates) {
  int bestIdx = -1;
  double bestScore = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < candidates.size(); ++i) {
    const double score = Score(rgba, candidates[i]);
    CV_LOG_DEBUG(nullptr, "PaletteMatcher: score " << candidates[i].name << " = " << score);
    if (score < bestScore) {
      bestScore = score;
      bestIdx = static_cast<int>(i);
    }
  }
  return bestIdx;
}

bool PaletteMatcher::Resolve(const std::string& selection, const cv::Mat& reference,
                             Palette& outPalette, std::string& outError) {
  outError.clear();
  outPalette = Palette();

  if (selection.empty() || selection == "none") return true;

  if (selection == "auto") {
    const std::vector<Palette> all = PaletteCatalog::All();
    const int idx = AutoDetect(reference, all);
    if (idx < 0) {
      outError = "Palette auto-detection needs a non-empty RGBA reference image.";
      return false;
    }
    outPalette = all[idx];
    CV_LOG_INFO(nullptr, "PaletteMatcher: auto-selected palette '" << outPalette.name << "'");
    return true;
  }

  if (!PaletteCatalog::Find(selection, outPalette)) {
    outError = "Unknown palette '" + selection + "'.";
    return false;
  }
  return true;
}
