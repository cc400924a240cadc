#include "VideoStylizer.h"

#include "FaceDetector.h"
#include "FastFrameRenderer.h"
#include "FrameClock.h"
#include "ImageLoader.h"
#include "PainterlyPipeline.h"
#include "PaletteMatcher.h"

#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace {
constexpr double kFallbackFps = 30.0;
} // namespace

VideoExporter::~VideoExporter() {
  Stop();
}

bool VideoExporter::Open(const std::string& path, double fps, const cv::Size& frameSize,
                         std::string& outError, int fourcc) {
  outError.clear();
  if (frameSize.area() <= 0 || fps <= 0.0) {
    outError = "Video export needs a positive frame size and frame rate.";
    return false;
  }
  try {
    writer_.open(path, fourcc, fps, frameSize, true);
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  if (!writer_.isOpened()) {
    outError = "Unsupported video encoder or container for '" + path + "'.";
    return false;
  }
  frameSize_ = frameSize;
  stopped_ = false;
  framesWritten_ = 0;
  return true;
}

bool VideoExporter::Write(const cv::Mat& rgba, std::string& outError) {
  outError.clear();
  if (!IsOpen()) {
    outError = "Video exporter is not open.";
    return false;
  }
  if (rgba.type() != CV_8UC4 || rgba.size() != frameSize_) {
    outError = "Frame does not match the export size/format.";
    return false;
  }
  cv::Mat bgr;
  cv::cvtColor(rgba, bgr, cv::COLOR_RGBA2BGR);
  try {
    writer_.write(bgr);
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  ++framesWritten_;
  return true;
}

void VideoExporter::Stop() {
  if (writer_.isOpened()) writer_.release();
  stopped_ = true;
}

bool VideoStylizer::Run(const Options& options, FaceDetector* detector, std::string& outError,
                        const Hooks& hooks) {
  outError.clear();

  cv::VideoCapture capture;
  try {
    capture.open(options.inputPath);
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  if (!capture.isOpened()) {
    outError = "Could not open video '" + options.inputPath + "'.";
    return false;
  }

  double sourceFps = capture.get(cv::CAP_PROP_FPS);
  if (!(sourceFps > 0.0)) sourceFps = kFallbackFps;
  const double targetFps = options.targetFps > 0.0 ? std::min(options.targetFps, sourceFps) : sourceFps;

  const FilterParameters params = options.params.Sanitized();
  FrameClock clock(targetFps);
  VideoExporter exporter;
  Palette palette;
  FaceRegions regions;
  cv::Size procSize;

  cv::Mat decoded;
  cv::Mat frame;
  long long frameIndex = 0;
  int rendered = 0;

  for (;;) {
    if (hooks.stopRequested && hooks.stopRequested()) {
      CV_LOG_INFO(nullptr, "VideoStylizer: stop requested after " << rendered << " frame(s)");
      break;
    }
    if (!capture.read(decoded) || decoded.empty()) break;
    const double timestamp = static_cast<double>(frameIndex++) / sourceFps;

    if (!clock.TryBegin(timestamp)) continue;

    std::string err;
    if (!ImageLoader::ToRgba(decoded, frame, err)) {
      clock.Retire();
      exporter.Stop();
      outError = "Undecodable video frame: " + err;
      return false;
    }

    if (rendered == 0) {
      // First usable frame fixes the export size and the palette.
      procSize = PainterlyPipeline::ProcessingSize(frame.size());
      if (!PaletteMatcher::Resolve(params.palette, frame, palette, outError)) {
        clock.Retire();
        return false;
      }
      if (!exporter.Open(options.outputPath, targetFps, procSize, outError)) {
        clock.Retire();
        return false;
      }
    }
    if (frame.size() != procSize) {
      cv::resize(frame, frame, procSize, 0, 0, cv::INTER_AREA);
    }

    if (detector && detector->IsReady() && rendered % std::max(1, options.detectEvery) == 0) {
      regions = detector->Detect(frame);
    }

    const cv::Mat styled = FastFrameRenderer::Render(frame, params, palette, regions);
    if (!exporter.Write(styled, outError)) {
      clock.Retire();
      exporter.Stop();
      return false;
    }
    ++rendered;
    clock.Retire();
    if (hooks.onFrame) hooks.onFrame(rendered, timestamp);
  }

  exporter.Stop();
  if (rendered == 0) {
    outError = "Video contains no decodable frames.";
    return false;
  }
  CV_LOG_INFO(nullptr, "VideoStylizer: rendered " << rendered << " frame(s), skipped "
                           << clock.Skipped());
  return true;
}
