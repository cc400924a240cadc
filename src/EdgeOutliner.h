#pragma once

#include <opencv2/core.hpp>

// EdgeOutliner: painted outlines from a multi-scale edge map.
// - Sobel magnitude on 0.299R + 0.587G + 0.114B, interior pixels only.
// - Optional fine-detail pass adds |4-neighbor Laplacian| * fineWeight.
// - Map normalized by its maximum (left at zero when the maximum is zero).
// - Above 0.15 the pixel is blended toward an outline color picked from the
//   underlying pixel's warmth (R - B): sienna, dark teal or sepia.
class EdgeOutliner {
public:
  struct Params {
    float edgeStrength = 0.6f;
    bool fineDetail = false;
    float fineWeight = 0.0f;
  };

  // Builds Params from the user-facing knobs.
  static Params FromSettings(float edgeStrength, float detailPreservation);

  // CV_32F edge map in [0,1], same size as the input.
  static cv::Mat EdgeMap(const cv::Mat& rgba, bool fineDetail, float fineWeight);

  static cv::Mat Apply(const cv::Mat& rgba, const Params& params);

  static cv::Vec3b OutlineColor(int r, int b);

  // Blend opacity for a normalized edge value.
  static float OutlineAlpha(float edge, float edgeStrength);
};
