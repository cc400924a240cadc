#pragma once

#include "FilterParams.h"

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

#include <string>

// FaceDetector: supplies face hints from a Haar/LBP cascade model.
// Failures never propagate: a model that cannot be loaded leaves the detector
// not ready, and detection on a detector that is not ready, with no hits, or
// after an OpenCV error returns an empty list.
class FaceDetector {
public:
  // Loads the cascade. Returns the readiness flag.
  bool Load(const std::string& cascadePath);

  bool IsReady() const { return ready_; }

  // Detects faces on an RGBA raster, in that raster's pixel coordinates.
  FaceRegions Detect(const cv::Mat& rgba);

private:
  cv::CascadeClassifier cascade_;
  bool ready_ = false;
};
