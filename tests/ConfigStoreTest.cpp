#include "ConfigStore.h"

#include <gtest/gtest.h>
#include <opencv2/core/utility.hpp>

#include <cstdio>
#include <fstream>

namespace {
class ConfigStoreTest : public ::testing::Test {
protected:
  void SetUp() override { path_ = cv::tempfile(".yml"); }
  void TearDown() override { std::remove(path_.c_str()); }

  void WriteRaw(const std::string& text) {
    std::ofstream out(path_);
    out << text;
  }

  std::string path_;
};
} // namespace

TEST_F(ConfigStoreTest, SavedSettingsLoadBack) {
  FilterParameters p;
  p.intensity = 0.5f;
  p.posterizeLevels = 11;
  p.edgeStrength = 0.25f;
  p.brushSize = 6;
  p.warmth = 0.9f;
  p.saturation = 0.1f;
  p.textureStrength = 0.0f;
  p.detailPreservation = 0.75f;
  p.palette = "coastal-morning";
  p.ditherSeed = 1234;

  std::string err;
  ASSERT_TRUE(ConfigStore::Save(path_, p, err)) << err;

  FilterParameters loaded;
  ASSERT_TRUE(ConfigStore::Load(path_, loaded, err)) << err;
  EXPECT_FLOAT_EQ(loaded.intensity, 0.5f);
  EXPECT_EQ(loaded.posterizeLevels, 11);
  EXPECT_FLOAT_EQ(loaded.edgeStrength, 0.25f);
  EXPECT_EQ(loaded.brushSize, 6);
  EXPECT_FLOAT_EQ(loaded.warmth, 0.9f);
  EXPECT_FLOAT_EQ(loaded.saturation, 0.1f);
  EXPECT_FLOAT_EQ(loaded.textureStrength, 0.0f);
  EXPECT_FLOAT_EQ(loaded.detailPreservation, 0.75f);
  EXPECT_EQ(loaded.palette, "coastal-morning");
  EXPECT_EQ(loaded.ditherSeed, 1234u);
}

TEST_F(ConfigStoreTest, MissingKeysKeepDefaultsAndValuesAreClamped) {
  WriteRaw("%YAML:1.0\n---\nwarmth: 0.9\nbrush_size: 50\n");
  FilterParameters loaded;
  std::string err;
  ASSERT_TRUE(ConfigStore::Load(path_, loaded, err)) << err;
  EXPECT_FLOAT_EQ(loaded.warmth, 0.9f);
  EXPECT_EQ(loaded.brushSize, 8);
  EXPECT_FLOAT_EQ(loaded.intensity, 0.85f);
  EXPECT_EQ(loaded.posterizeLevels, 8);
  EXPECT_EQ(loaded.palette, "none");
}

TEST_F(ConfigStoreTest, FaceHintsAreNotTouched) {
  WriteRaw("%YAML:1.0\n---\nintensity: 0.4\n");
  FilterParameters loaded;
  loaded.faceRegions = {{1, 2, 3, 4}};
  std::string err;
  ASSERT_TRUE(ConfigStore::Load(path_, loaded, err)) << err;
  ASSERT_EQ(loaded.faceRegions.size(), 1u);
  EXPECT_EQ(loaded.faceRegions[0].width, 3);
  EXPECT_FLOAT_EQ(loaded.intensity, 0.4f);
}

TEST_F(ConfigStoreTest, MissingFileIsAnError) {
  FilterParameters loaded;
  loaded.warmth = 0.2f;
  std::string err;
  EXPECT_FALSE(ConfigStore::Load(path_ + ".missing", loaded, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FLOAT_EQ(loaded.warmth, 0.2f);
}
