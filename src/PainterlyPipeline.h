#pragma once

#include "FilterParams.h"

#include <opencv2/core.hpp>

#include <functional>
#include <string>

// PainterlyPipeline: sequences the painterly stages on one raster.
//   bilateral -> oil paint -> brushstrokes -> detail recovery (optional)
//   -> posterize -> color grade -> palette (optional) -> outlines
//   -> canvas texture -> vignette -> blend with the source by intensity
//
// Single-threaded and cooperative: stages run back to back on the calling
// thread, and between stages the host gets a chance to run (Hooks::yield),
// to observe progress, and to cancel. A stage in flight is never interrupted.
class PainterlyPipeline {
public:
  using ProgressCallback = std::function<void(const std::string& label, float fraction)>;

  struct Hooks {
    ProgressCallback onProgress;        // monotonically increasing fraction in [0,1]
    std::function<void()> yield;        // hands control back to the host scheduler
    std::function<bool()> cancelRequested;
  };

  // Longest side processed at full quality; larger inputs are downscaled first.
  static constexpr int kMaxDimension = 1200;

  // Runs the full pipeline. `inputRgba` (CV_8UC4) is never modified.
  // On success `outRgba` holds a new raster with the processing dimensions
  // (the input size, or the downscaled size when the input exceeds kMaxDimension).
  // Returns false with outError set for invalid media or cancellation.
  static bool Run(const cv::Mat& inputRgba, const FilterParameters& params,
                  cv::Mat& outRgba, std::string& outError, const Hooks& hooks = Hooks());

  // Processing size for an input size, honoring kMaxDimension.
  static cv::Size ProcessingSize(const cv::Size& input);

  // Face regions mapped onto the processing raster, or none when the detector
  // never became ready.
  static FaceRegions PrepareRegions(const FilterParameters& params, const cv::Size& inputSize,
                                    const cv::Size& processingSize);

  // Per-channel linear blend: source * (1 - intensity) + filtered * intensity.
  // Alpha is taken from the filtered raster.
  static cv::Mat BlendWithSource(const cv::Mat& source, const cv::Mat& filtered, float intensity);
};
