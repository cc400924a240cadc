#include "ImageLoader.h"

#include <algorithm>
#include <cctype>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace {
// Formats without an alpha channel get BGR.
bool IsOpaqueFormat(const std::string& path) {
  const size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return false;
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == "jpg" || ext == "jpeg" || ext == "bmp" || ext == "ppm";
}
} // namespace

bool ImageLoader::ToRgba(const cv::Mat& decoded, cv::Mat& outRgba, std::string& outError) {
  outError.clear();
  outRgba.release();
  if (decoded.empty() || decoded.cols <= 0 || decoded.rows <= 0) {
    outError = "Image is empty (zero area).";
    return false;
  }
  if (decoded.depth() != CV_8U) {
    outError = "Only 8-bit images are supported.";
    return false;
  }
  switch (decoded.channels()) {
    case 1: cv::cvtColor(decoded, outRgba, cv::COLOR_GRAY2RGBA); break;
    case 3: cv::cvtColor(decoded, outRgba, cv::COLOR_BGR2RGBA); break;
    case 4: cv::cvtColor(decoded, outRgba, cv::COLOR_BGRA2RGBA); break;
    default:
      outError = "Unsupported channel count: " + std::to_string(decoded.channels());
      return false;
  }
  return true;
}

bool ImageLoader::LoadRgba(const std::string& path, cv::Mat& outRgba, std::string& outError) {
  outError.clear();
  outRgba.release();

  cv::Mat img;
  try {
    // IMREAD_UNCHANGED keeps alpha; 16-bit sources are rejected by ToRgba.
    img = cv::imread(path, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  if (img.empty()) {
    outError = "Failed to load image (empty). Check path and supported formats (png/jpg).";
    return false;
  }
  return ToRgba(img, outRgba, outError);
}

bool ImageLoader::SaveRgba(const std::string& path, const cv::Mat& rgba, std::string& outError) {
  outError.clear();
  if (rgba.empty()) {
    outError = "Nothing to save (image is empty).";
    return false;
  }
  if (rgba.type() != CV_8UC4) {
    outError = "Expected an 8-bit RGBA image.";
    return false;
  }
  try {
    cv::Mat encoded;
    cv::cvtColor(rgba, encoded, IsOpaqueFormat(path) ? cv::COLOR_RGBA2BGR : cv::COLOR_RGBA2BGRA);
    if (!cv::imwrite(path, encoded)) {
      outError = "cv::imwrite returned false. Check file extension and output path.";
      return false;
    }
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  return true;
}
