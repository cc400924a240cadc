#pragma once

#include "FilterParams.h"

#include <opencv2/core.hpp>

// Posterizer / cel-shader.
// Quantizes each channel to `levels` evenly spaced values. Pixels inside a face
// box, or that look like skin, get min(levels + 2, 12) levels so skin does not band.
class Posterizer {
public:
  // One quantization pass, no cleanup. Pixels whose channels all sit on the
  // base grid or all on the face grid pass through, so Quantize is idempotent.
  static cv::Mat Quantize(const cv::Mat& rgba, int levels, const FaceRegions& faces);

  // Full stage: levels boost when detailPreservation > 0.5, otherwise a
  // radius-1 box blur followed by a second quantization at the same levels.
  static cv::Mat Apply(const cv::Mat& rgba, int levels, float detailPreservation,
                       const FaceRegions& faces);

  // round(round(value / step) * step), step = 255 / (levels - 1).
  static uchar QuantizeValue(int value, int levels);

  // R > G > B, R - B > 30, 80 < R < 240.
  static bool LooksLikeSkin(int r, int g, int b) {
    return r > g && g > b && (r - b) > 30 && r > 80 && r < 240;
  }

  static int FaceLevels(int levels);
  static int DetailBoostedLevels(int levels, float detailPreservation);
};
