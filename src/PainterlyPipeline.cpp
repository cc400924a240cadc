#include "PainterlyPipeline.h"

#include "CanvasEffects.h"
#include "ColorGrader.h"
#include "EdgeOutliner.h"
#include "PaintStages.h"
#include "PaletteMatcher.h"
#include "Posterizer.h"

#include <algorithm>
#include <cmath>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>

namespace {
constexpr float kVignetteScale = 0.4f;

// Reports progress, yields to the host, and checks for cancellation.
// Returns false when the caller asked to stop.
bool Checkpoint(const PainterlyPipeline::Hooks& hooks, const char* label, float fraction) {
  CV_LOG_DEBUG(nullptr, "PainterlyPipeline: " << label << " (" << fraction << ")");
  if (hooks.onProgress) hooks.onProgress(label, fraction);
  if (hooks.yield) hooks.yield();
  return !(hooks.cancelRequested && hooks.cancelRequested());
}
} // namespace

cv::Size PainterlyPipeline::ProcessingSize(const cv::Size& input) {
  const int longest = std::max(input.width, input.height);
  if (longest <= kMaxDimension) return input;
  const double scale = static_cast<double>(kMaxDimension) / longest;
  return cv::Size(std::max(1, static_cast<int>(std::lround(input.width * scale))),
                  std::max(1, static_cast<int>(std::lround(input.height * scale))));
}

FaceRegions PainterlyPipeline::PrepareRegions(const FilterParameters& params,
                                              const cv::Size& inputSize,
                                              const cv::Size& processingSize) {
  if (!params.faceDetectorReady || params.faceRegions.empty()) return {};
  const cv::Size detectedOn =
      params.faceSourceSize.area() > 0 ? params.faceSourceSize : inputSize;
  return faces::Rescale(params.faceRegions, detectedOn, processingSize);
}

cv::Mat PainterlyPipeline::BlendWithSource(const cv::Mat& source, const cv::Mat& filtered,
                                           float intensity) {
  if (source.empty() || filtered.empty() || source.size() != filtered.size() ||
      source.type() != CV_8UC4 || filtered.type() != CV_8UC4) {
    return {};
  }
  if (intensity >= 1.0f) return filtered.clone();

  const float keep = 1.0f - intensity;
  cv::Mat out(filtered.size(), CV_8UC4);
  for (int y = 0; y < out.rows; ++y) {
    const cv::Vec4b* s = source.ptr<cv::Vec4b>(y);
    const cv::Vec4b* f = filtered.ptr<cv::Vec4b>(y);
    cv::Vec4b* d = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < out.cols; ++x) {
      for (int c = 0; c < 3; ++c) {
        d[x][c] = cv::saturate_cast<uchar>(s[x][c] * keep + f[x][c] * intensity);
      }
      d[x][3] = f[x][3];
    }
  }
  return out;
}

bool PainterlyPipeline::Run(const cv::Mat& inputRgba, const FilterParameters& params,
                            cv::Mat& outRgba, std::string& outError, const Hooks& hooks) {
  outError.clear();
  outRgba.release();

  if (inputRgba.empty() || inputRgba.cols <= 0 || inputRgba.rows <= 0) {
    outError = "Input image is empty (zero area).";
    return false;
  }
  if (inputRgba.type() != CV_8UC4) {
    outError = "Input image must be 8-bit RGBA (CV_8UC4).";
    return false;
  }

  const FilterParameters p = params.Sanitized();

  // Untouched source for detail recovery and the final blend.
  const cv::Size procSize = ProcessingSize(inputRgba.size());
  cv::Mat source;
  if (procSize != inputRgba.size()) {
    cv::resize(inputRgba, source, procSize, 0, 0, cv::INTER_AREA);
    CV_LOG_INFO(nullptr, "PainterlyPipeline: downscaled " << inputRgba.cols << "x" << inputRgba.rows
                             << " to " << procSize.width << "x" << procSize.height);
  } else {
    source = inputRgba.clone();
  }

  const FaceRegions regions = PrepareRegions(p, inputRgba.size(), procSize);
  if (!p.faceDetectorReady && !p.faceRegions.empty()) {
    CV_LOG_INFO(nullptr, "PainterlyPipeline: face detector not ready, ignoring face hints");
  }

  // Palette is resolved before any pixel work so a bad name fails early.
  Palette palette;
  if (!PaletteMatcher::Resolve(p.palette, source, palette, outError)) return false;

  const auto cancelled = [&outError]() {
    outError = "Processing cancelled.";
    return false;
  };

  // Step 1: Edge-preserving pre-blur.
  // Why: flattens sensor noise and fine texture so the oil paint quadrants see
  // stable colors, while keeping the contours that later become outlines.
  if (!Checkpoint(hooks, "Smoothing with bilateral filter...", 0.05f)) return cancelled();
  cv::Mat work = PaintStages::Bilateral(source, PaintStages::BilateralParams(), regions);

  // Step 2: Oil paint (lowest-variance quadrant mean).
  // Why: turns smooth regions into flat dabs of paint without smearing across edges.
  if (!Checkpoint(hooks, "Applying oil paint effect...", 0.15f)) return cancelled();
  work = PaintStages::OilPaint(work, p.brushSize, regions);

  // Step 3: Brushstrokes along the local contour direction.
  if (!Checkpoint(hooks, "Simulating brushstrokes...", 0.30f)) return cancelled();
  work = PaintStages::Brushstrokes(work, std::max(2, p.brushSize - 1));

  // Step 4 (optional): Reinject high-pass detail from the source.
  // Why: eyes, text and hair lose legibility in the paint passes; a shaped
  // high-pass brings them back without restoring sensor noise.
  if (p.detailPreservation > 0.4f) {
    if (!Checkpoint(hooks, "Recovering fine detail...", 0.40f)) return cancelled();
    work = PaintStages::RecoverDetail(work, source, p.detailPreservation, regions);
  }

  // Step 5: Posterize. Skin keeps a few extra levels so faces do not band.
  if (!Checkpoint(hooks, "Applying cel-shading...", 0.50f)) return cancelled();
  work = Posterizer::Apply(work, p.posterizeLevels, p.detailPreservation, regions);

  // Step 6: Color grade (teal shadows, amber highlights, dedicated skin ramp).
  if (!Checkpoint(hooks, "Grading colors...", 0.60f)) return cancelled();
  ColorGrader::Params grade;
  grade.warmth = p.warmth;
  grade.saturation = p.saturation;
  work = ColorGrader::Apply(work, grade, regions);

  // Step 7 (optional): Palette limitation.
  // Why: runs after grading so the graded tones pick the swatches, and before
  // outlines so the ink color is taken from the final paint color.
  if (!palette.empty()) {
    if (!Checkpoint(hooks, "Matching palette...", 0.68f)) return cancelled();
    work = PaletteMatcher::Apply(work, palette, p.ditherSeed);
  }

  // Step 8: Painted outlines.
  if (!Checkpoint(hooks, "Detecting edges for outlines...", 0.75f)) return cancelled();
  work = EdgeOutliner::Apply(work, EdgeOutliner::FromSettings(p.edgeStrength, p.detailPreservation));

  // Step 9: Canvas weave and vignette, the finishing passes.
  if (!Checkpoint(hooks, "Adding canvas texture...", 0.85f)) return cancelled();
  work = CanvasEffects::Texture(work, p.textureStrength);

  if (!Checkpoint(hooks, "Applying vignette...", 0.92f)) return cancelled();
  work = CanvasEffects::Vignette(work, kVignetteScale * p.intensity);

  // Step 10: Intensity blend against the (possibly downscaled) source.
  outRgba = BlendWithSource(source, work, p.intensity);
  if (outRgba.empty()) {
    outError = "Processing failed (unexpected empty output).";
    return false;
  }
  if (hooks.onProgress) hooks.onProgress("Done!", 1.0f);
  return true;
}
