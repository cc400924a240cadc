#pragma once

#include "FilterParams.h"

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <functional>
#include <string>

class FaceDetector;

// VideoExporter: sequential consumer of rendered frames.
// Open fails fast when the container/codec is unavailable; Stop is a hard
// cancellation point after which nothing more is written.
class VideoExporter {
public:
  ~VideoExporter();

  bool Open(const std::string& path, double fps, const cv::Size& frameSize,
            std::string& outError, int fourcc = cv::VideoWriter::fourcc('m', 'p', '4', 'v'));

  // Appends one RGBA frame of the opened size.
  bool Write(const cv::Mat& rgba, std::string& outError);

  // Flushes and closes. Further writes fail.
  void Stop();

  bool IsOpen() const { return writer_.isOpened() && !stopped_; }
  int FramesWritten() const { return framesWritten_; }

private:
  cv::VideoWriter writer_;
  cv::Size frameSize_;
  bool stopped_ = false;
  int framesWritten_ = 0;
};

// VideoStylizer: drives the fast frame renderer over a video file.
// The playback clock admits frames at the target rate; face hints are refreshed
// every few rendered frames; the palette is resolved once on the first frame.
class VideoStylizer {
public:
  struct Options {
    std::string inputPath;
    std::string outputPath;
    double targetFps = 0.0;     // 0 = source frame rate
    int detectEvery = 15;       // rendered frames between face detections
    FilterParameters params;
  };

  struct Hooks {
    std::function<void(int framesRendered, double timestampSec)> onFrame;
    std::function<bool()> stopRequested;
  };

  // `detector` may be null. Returns false with outError for unreadable or empty
  // video and for export failures.
  static bool Run(const Options& options, FaceDetector* detector, std::string& outError,
                  const Hooks& hooks = Hooks());
};
