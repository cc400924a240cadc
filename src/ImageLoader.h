#pragma once

#include <opencv2/core.hpp>
#include <string>

// ImageLoader: minimal, pipeline-agnostic image I/O wrapper.
// OpenCV decodes to BGR(A); the painterly pipeline works on RGBA, so every
// conversion between the two happens here.
class ImageLoader {
public:
  // Loads any 8-bit gray/BGR/BGRA image as RGBA (CV_8UC4). Opaque sources get alpha 255.
  static bool LoadRgba(const std::string& path, cv::Mat& outRgba, std::string& outError);

  // Saves an RGBA image with cv::imwrite (alpha kept where the format supports it).
  static bool SaveRgba(const std::string& path, const cv::Mat& rgba, std::string& outError);

  // Converts an 8-bit gray/BGR/BGRA matrix (as decoded by OpenCV) to RGBA.
  static bool ToRgba(const cv::Mat& decoded, cv::Mat& outRgba, std::string& outError);
};
