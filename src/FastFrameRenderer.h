#pragma once

#include "FilterParams.h"
#include "PaletteCatalog.h"

#include <opencv2/core.hpp>

// FastFrameRenderer: reduced-cost painterly look for real-time video.
// Works on a ~55% downscale with one fused per-pixel loop (tone shift, quantize,
// S-curve, palette), a squared-gradient outline pass, then upsamples and
// finishes at full resolution with haze (screen), split-tone (overlay) and
// vignette (multiply). There is no bilateral, oil paint or brushstroke pass.
// With face hints, a feathered head/shoulders/torso mask keeps the subject
// crisp over a softened, dimmed copy of the frame.
class FastFrameRenderer {
public:
  static constexpr double kProcessingScale = 0.55;

  // `palette` may be empty (no palette step). Returns an RGBA raster the size of
  // `frameRgba`, or an empty cv::Mat for invalid input.
  static cv::Mat Render(const cv::Mat& frameRgba, const FilterParameters& params,
                        const Palette& palette, const FaceRegions& faces);

  // CV_32F mask in [0,1]: 1 on the subject, feathered toward 0 on the backdrop.
  static cv::Mat SubjectMask(const cv::Size& size, const FaceRegions& faces);

  // Smoothstep contrast curve blended half-way with the identity.
  static float SCurve(float v);
};
