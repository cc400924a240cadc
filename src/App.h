#pragma once

#include "FaceDetector.h"
#include "FilterParams.h"

#include <opencv2/core/utility.hpp>

#include <string>

// App: command-line front end.
// Resolves settings (defaults <- --config file <- explicit flags), loads the
// face model when one is given, then stylizes either one image or one video.
class App {
public:
  App(int argc, const char* const argv[]);

  // Process exit code: 0 on success, 1 on a processing error, 2 on bad usage.
  int Run();

private:
  bool BuildParameters(FilterParameters& outParams);
  void LoadFaceModel();
  int RunImage(FilterParameters params);
  int RunVideo(const FilterParameters& params);
  void ListPalettes() const;
  void PrintProgress(const std::string& label, float fraction);

  cv::CommandLineParser parser_;
  FaceDetector detector_;
  std::string status_;
  int lastPercent_ = -1;
};
