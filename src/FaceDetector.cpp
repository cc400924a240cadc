#include "FaceDetector.h"

#include <algorithm>
#include <cmath>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>

namespace {
// Detection runs on a copy no wider than this; boxes are scaled back.
constexpr int kDetectMaxSide = 416;
} // namespace

bool FaceDetector::Load(const std::string& cascadePath) {
  ready_ = false;
  if (cascadePath.empty()) {
    CV_LOG_INFO(nullptr, "FaceDetector: no model configured, continuing without face hints");
    return false;
  }
  try {
    ready_ = cascade_.load(cascadePath) && !cascade_.empty();
  } catch (const cv::Exception& e) {
    CV_LOG_WARNING(nullptr, "FaceDetector: OpenCV error loading model: " << e.what());
    ready_ = false;
  }
  if (!ready_) {
    CV_LOG_WARNING(nullptr, "FaceDetector: could not load model '" << cascadePath
                                << "', continuing without face hints");
  } else {
    CV_LOG_INFO(nullptr, "FaceDetector: model loaded from " << cascadePath);
  }
  return ready_;
}

FaceRegions FaceDetector::Detect(const cv::Mat& rgba) {
  if (!ready_) return {};
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};

  try {
    cv::Mat gray;
    cv::cvtColor(rgba, gray, cv::COLOR_RGBA2GRAY);

    const int longest = std::max(gray.cols, gray.rows);
    double scale = 1.0;
    if (longest > kDetectMaxSide) {
      scale = static_cast<double>(kDetectMaxSide) / longest;
      cv::resize(gray, gray, cv::Size(), scale, scale, cv::INTER_AREA);
    }
    cv::equalizeHist(gray, gray);

    std::vector<cv::Rect> hits;
    cascade_.detectMultiScale(gray, hits, 1.1, 4, 0, cv::Size(24, 24));

    FaceRegions out;
    out.reserve(hits.size());
    for (const cv::Rect& r : hits) {
      FaceRegion f;
      f.x = static_cast<int>(std::lround(r.x / scale));
      f.y = static_cast<int>(std::lround(r.y / scale));
      f.width = static_cast<int>(std::lround(r.width / scale));
      f.height = static_cast<int>(std::lround(r.height / scale));
      out.push_back(f);
    }
    CV_LOG_DEBUG(nullptr, "FaceDetector: " << out.size() << " face(s)");
    return out;
  } catch (const cv::Exception& e) {
    CV_LOG_WARNING(nullptr, "FaceDetector: detection failed: " << e.what());
    return {};
  }
}
