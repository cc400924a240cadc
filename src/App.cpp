#include "App.h"

#include "ConfigStore.h"
#include "ImageLoader.h"
#include "PainterlyPipeline.h"
#include "PaletteCatalog.h"
#include "VideoStylizer.h"

#include <opencv2/core/utils/logger.hpp>

#include <csignal>
#include <iostream>

namespace {

const char* const kKeys =
    "{help h usage ? |      | print this message}"
    "{input i        |      | input image or video}"
    "{output o       |      | output image or video}"
    "{config c       |      | YAML/XML settings file to start from}"
    "{save-config    |      | write the effective settings to this file}"
    "{palette p      |      | none, auto or a catalog palette name}"
    "{list-palettes  |      | print the palette catalog and exit}"
    "{cascade        |      | face cascade model (Haar/LBP XML)}"
    "{video          |      | treat the input as a video and use the fast renderer}"
    "{fps            | 0    | target video frame rate (0 = source rate)}"
    "{intensity      |      | 0..1 blend with the original}"
    "{levels         |      | 3..16 posterize levels}"
    "{edges          |      | 0..1 outline strength}"
    "{brush          |      | 2..8 brush size}"
    "{warmth         |      | 0..1 amber push}"
    "{saturation     |      | 0..1 saturation}"
    "{texture        |      | 0..1 canvas texture}"
    "{detail         |      | 0..1 detail preservation}"
    "{seed           |      | palette dithering seed}"
    "{verbose v      |      | debug logging}";

volatile std::sig_atomic_t gInterrupted = 0;

void OnInterrupt(int) {
  gInterrupted = 1;
}

bool Interrupted() {
  return gInterrupted != 0;
}

} // namespace

App::App(int argc, const char* const argv[]) : parser_(argc, argv, kKeys) {
  parser_.about("painterly: painterly stylization for images and video");
}

int App::Run() {
  if (parser_.has("help")) {
    parser_.printMessage();
    return 0;
  }

  cv::utils::logging::setLogLevel(parser_.has("verbose")
                                      ? cv::utils::logging::LOG_LEVEL_DEBUG
                                      : cv::utils::logging::LOG_LEVEL_INFO);

  if (parser_.has("list-palettes")) {
    ListPalettes();
    return 0;
  }

  FilterParameters params;
  if (!BuildParameters(params)) {
    std::cerr << status_ << std::endl;
    return 2;
  }

  if (parser_.has("save-config")) {
    const std::string path = parser_.get<std::string>("save-config");
    if (!ConfigStore::Save(path, params, status_)) {
      std::cerr << status_ << std::endl;
      return 1;
    }
    if (!parser_.has("input")) return 0;
  }

  if (!parser_.has("input") || !parser_.has("output")) {
    std::cerr << "Both --input and --output are required." << std::endl;
    parser_.printMessage();
    return 2;
  }

  std::signal(SIGINT, OnInterrupt);
  LoadFaceModel();
  return parser_.has("video") ? RunVideo(params) : RunImage(params);
}

bool App::BuildParameters(FilterParameters& outParams) {
  FilterParameters params;
  if (parser_.has("config")) {
    if (!ConfigStore::Load(parser_.get<std::string>("config"), params, status_)) return false;
  }

  if (parser_.has("intensity")) params.intensity = parser_.get<float>("intensity");
  if (parser_.has("levels")) params.posterizeLevels = parser_.get<int>("levels");
  if (parser_.has("edges")) params.edgeStrength = parser_.get<float>("edges");
  if (parser_.has("brush")) params.brushSize = parser_.get<int>("brush");
  if (parser_.has("warmth")) params.warmth = parser_.get<float>("warmth");
  if (parser_.has("saturation")) params.saturation = parser_.get<float>("saturation");
  if (parser_.has("texture")) params.textureStrength = parser_.get<float>("texture");
  if (parser_.has("detail")) params.detailPreservation = parser_.get<float>("detail");
  if (parser_.has("palette")) params.palette = parser_.get<std::string>("palette");
  if (parser_.has("seed")) params.ditherSeed = parser_.get<unsigned int>("seed");

  if (!parser_.check()) {
    parser_.printErrors();
    status_ = "Invalid command-line arguments.";
    return false;
  }

  if (params.palette != "none" && params.palette != "auto") {
    Palette probe;
    if (!PaletteCatalog::Find(params.palette, probe)) {
      status_ = "Unknown palette '" + params.palette + "' (see --list-palettes).";
      return false;
    }
  }

  outParams = params.Sanitized();
  return true;
}

void App::LoadFaceModel() {
  if (!parser_.has("cascade")) {
    CV_LOG_INFO(nullptr, "App: no face model given, faces get no special treatment");
    return;
  }
  const std::string path = parser_.get<std::string>("cascade");
  if (!detector_.Load(path)) {
    CV_LOG_WARNING(nullptr, "App: face model '" << path << "' unavailable, continuing without faces");
  }
}

int App::RunImage(FilterParameters params) {
  const std::string inputPath = parser_.get<std::string>("input");
  const std::string outputPath = parser_.get<std::string>("output");

  cv::Mat input;
  if (!ImageLoader::LoadRgba(inputPath, input, status_)) {
    std::cerr << status_ << std::endl;
    return 1;
  }

  params.faceDetectorReady = detector_.IsReady();
  if (detector_.IsReady()) {
    params.faceRegions = detector_.Detect(input);
    params.faceSourceSize = input.size();
    CV_LOG_INFO(nullptr, "App: " << params.faceRegions.size() << " face(s) detected");
  }

  PainterlyPipeline::Hooks hooks;
  hooks.onProgress = [this](const std::string& label, float fraction) {
    PrintProgress(label, fraction);
  };
  hooks.cancelRequested = &Interrupted;

  cv::Mat output;
  if (!PainterlyPipeline::Run(input, params, output, status_, hooks)) {
    std::cout << std::endl;
    std::cerr << status_ << std::endl;
    return 1;
  }
  std::cout << std::endl;

  if (!ImageLoader::SaveRgba(outputPath, output, status_)) {
    std::cerr << status_ << std::endl;
    return 1;
  }
  std::cout << "Saved " << output.cols << "x" << output.rows << " to " << outputPath << std::endl;
  return 0;
}

int App::RunVideo(const FilterParameters& params) {
  VideoStylizer::Options options;
  options.inputPath = parser_.get<std::string>("input");
  options.outputPath = parser_.get<std::string>("output");
  options.targetFps = parser_.get<double>("fps");
  options.params = params;

  VideoStylizer::Hooks hooks;
  hooks.onFrame = [](int framesRendered, double timestampSec) {
    std::cout << "\rFrame " << framesRendered << " @ " << timestampSec << "s" << std::flush;
  };
  hooks.stopRequested = &Interrupted;

  const bool ok = VideoStylizer::Run(options, detector_.IsReady() ? &detector_ : nullptr,
                                     status_, hooks);
  std::cout << std::endl;
  if (!ok) {
    std::cerr << status_ << std::endl;
    return 1;
  }
  std::cout << "Saved " << options.outputPath << std::endl;
  return 0;
}

void App::ListPalettes() const {
  for (const Palette& palette : PaletteCatalog::All()) {
    std::cout << palette.name << " (" << palette.swatches.size() << " colors)" << std::endl;
  }
}

void App::PrintProgress(const std::string& label, float fraction) {
  const int percent = static_cast<int>(fraction * 100.0f + 0.5f);
  if (percent == lastPercent_) return;
  lastPercent_ = percent;
  std::cout << "\r[" << percent << "%] " << label << "          " << std::flush;
}
