#include "VideoStylizer.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace testing_util;

TEST(VideoExporterTest, WriteBeforeOpenFails) {
  VideoExporter exporter;
  std::string err;
  EXPECT_FALSE(exporter.IsOpen());
  EXPECT_FALSE(exporter.Write(Solid(8, 8, 1, 2, 3), err));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(exporter.FramesWritten(), 0);
}

TEST(VideoExporterTest, OpenRejectsDegenerateSettings) {
  VideoExporter exporter;
  std::string err;
  EXPECT_FALSE(exporter.Open("unused.avi", 30.0, cv::Size(0, 0), err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(exporter.Open("unused.avi", 0.0, cv::Size(16, 16), err));
}

TEST(VideoExporterTest, StopIsFinal) {
  VideoExporter exporter;
  exporter.Stop();
  std::string err;
  EXPECT_FALSE(exporter.IsOpen());
  EXPECT_FALSE(exporter.Write(Solid(8, 8, 1, 2, 3), err));
}

TEST(VideoStylizerTest, UnreadableVideoIsAnError) {
  VideoStylizer::Options options;
  options.inputPath = "does-not-exist.mp4";
  options.outputPath = "never-written.mp4";
  std::string err;
  EXPECT_FALSE(VideoStylizer::Run(options, nullptr, err));
  EXPECT_FALSE(err.empty());
}
