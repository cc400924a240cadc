#pragma once

#include "FilterParams.h"

#include <opencv2/core.hpp>

// PaintStages: the painterly front half of the pipeline.
// All functions take and return 8-bit RGBA rasters (CV_8UC4) of identical size,
// never modify their inputs, and copy alpha through unchanged.
// Invalid input (empty or not CV_8UC4) yields an empty cv::Mat.
class PaintStages {
public:
  struct BilateralParams {
    int radius = 3;
    float sigmaSpace = 10.0f;
    float sigmaColor = 30.0f;
    int faceRadiusBoost = 1;        // added to the radius inside faces
    float faceSigmaColorRatio = 0.7f; // color sigma multiplier inside faces
  };

  // Edge-preserving pre-blur. Sampled coordinates clamp to the raster edges.
  static cv::Mat Bilateral(const cv::Mat& rgba, const BilateralParams& params,
                           const FaceRegions& faces);

  // Region-variance "oil paint": per pixel, the mean of the lowest-variance
  // quadrant of the radius-r neighborhood. Quadrants overlap on the centre row
  // and column. Inside faces the radius is halved (never below 2).
  static cv::Mat OilPaint(const cv::Mat& rgba, int radius, const FaceRegions& faces);

  // Smears color along the direction perpendicular to the local gradient.
  // Border rows/columns pass through unmodified.
  static cv::Mat Brushstrokes(const cv::Mat& rgba, int strokeLength);

  // Reinjects luminance high-pass detail of `original` into `painted`.
  // Both rasters must have the same size. Returns a copy of `painted` when
  // detailPreservation <= 0.4.
  static cv::Mat RecoverDetail(const cv::Mat& painted, const cv::Mat& original,
                               float detailPreservation, const FaceRegions& faces);

  // Box radius used by RecoverDetail; shrinks as the detail setting grows.
  static int DetailBlurRadius(float detailPreservation);

  // Shapes one high-pass sample: noise attenuation below the threshold,
  // saturating curve above it.
  static float ShapeDetail(float detail);
};
