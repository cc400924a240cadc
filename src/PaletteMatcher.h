#pragma once

#include "PaletteCatalog.h"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

// PaletteMatcher: maps pixels onto a palette.
// Distance favors luminance agreement and a warmth target that runs cool in the
// shadows and warm in the highlights:
//   3.0 * dLum^2 + 0.4 * sum(dChannel^2) + 0.08 * (swatch.warmth - desired)^2
//   desired = (lum / 255 - 0.4) * 80
// When the two nearest swatches are close calls, a hashed per-pixel value picks
// the runner-up some of the time, which breaks up banding at palette boundaries.
class PaletteMatcher {
public:
  struct Match {
    int nearest = -1;
    int second = -1;
    float nearestDist = 0.0f;
    float secondDist = 0.0f;
    float closeness = 1.0f; // 1 - nearest/second; 1 means unambiguous
  };

  static float Distance(int r, int g, int b, const Swatch& swatch);

  // Two lowest-distance swatches. An exact RGB hit reports closeness 1.
  static Match FindTwoNearest(int r, int g, int b, const Palette& palette);

  // Probability of taking the runner-up: 0 above the 0.88 closeness threshold,
  // otherwise min(0.5, (0.88 - closeness) * 1.5).
  static float DitherProbability(float closeness);

  // Deterministic value in [0,1) from position, color and seed.
  static float HashUnit(int x, int y, int r, int g, int b, unsigned int seed);

  // Swatch chosen for one pixel (with dithering).
  static cv::Vec3b MatchPixel(int x, int y, int r, int g, int b, const Palette& palette,
                              unsigned int seed);

  // Whole raster. Alpha passes through; an empty palette returns a copy.
  static cv::Mat Apply(const cv::Mat& rgba, const Palette& palette, unsigned int seed);

  // Mean squared unweighted RGB distance to the nearest swatch over a sample
  // grid (about 120 samples across the shorter side). Infinity when no samples.
  static double Score(const cv::Mat& rgba, const Palette& palette);

  // Index of the best-scoring palette, or -1 when there is nothing to score.
  static int AutoDetect(const cv::Mat& rgba, const std::vector<Palette>& candidates);

  // Resolves a user selection against the catalog:
  // "none" -> empty palette, "auto" -> best fit for `reference`, otherwise by name.
  static bool Resolve(const std::string& selection, const cv::Mat& reference,
                      Palette& outPalette, std::string& outError);
};
