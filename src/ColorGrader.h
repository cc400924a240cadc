#pragma once

#include "ColorSpace.h"
#include "FilterParams.h"

#include <opencv2/core.hpp>

// Coarse hue buckets used to branch the grading rules.
enum class HueCategory {
  SkinWarm,
  YellowGold,
  Green,
  TealCyan,
  Blue,
  Purple,
  MagentaPink,
  Neutral
};

// ColorGrader:
// - Classifies each pixel into a HueCategory and a skin flag
//   (face box membership OR an HSL skin heuristic).
// - Skin gets a luminance-banded teal -> salmon -> amber -> pink hue ramp,
//   damped to 0.78 on close-up portraits (faces cover > 25% of the raster).
// - Everything else gets cool shadows, per-category midtones and golden highlights.
// - A global saturation scale saturation * 0.4 + 0.6 runs last.
class ColorGrader {
public:
  struct Params {
    float warmth = 0.35f;
    float saturation = 0.55f;
  };

  static cv::Mat Apply(const cv::Mat& rgba, const Params& params, const FaceRegions& faces);

  static HueCategory Classify(float hue, float saturation);

  // HSL skin heuristic, no face-box term.
  static bool LooksLikeSkin(int r, int g, int b, const Hsl& hsl);

  // 0.78 when the summed face area exceeds a quarter of the raster, else 1.0.
  static float SkinDampen(const FaceRegions& faces, const cv::Size& size);

  // Grades a single pixel. Output components are clamped (hue wrapped) to [0,1].
  static Hsl GradePixel(const Hsl& in, HueCategory category, bool skin,
                        const Params& params, float skinDampen);
};
