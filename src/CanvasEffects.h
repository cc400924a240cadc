#pragma once

#include <opencv2/core.hpp>

// Finishing passes: procedural canvas weave and radial vignette.
class CanvasEffects {
public:
  // Additive luminance perturbation: two orthogonal sine threads (periods of
  // about 3 to 4 px) plus two low-frequency undulations, scaled by `strength`
  // and added equally to R, G and B. No random noise.
  static cv::Mat Texture(const cv::Mat& rgba, float strength);

  // Texture offset at a pixel for strength 1.
  static float TextureOffset(int x, int y);

  // factor = 1 - (dist / maxDist)^2 * strength, floored at 0, measured from
  // pixel centres to the raster centre. Strength 0 returns an exact copy.
  static cv::Mat Vignette(const cv::Mat& rgba, float strength);
};
