#include "PaletteCatalog.h"
#include "PaletteMatcher.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <cmath>
#include <set>

using namespace testing_util;

namespace {
Palette MakePalette(const std::vector<std::string>& hex) {
  std::string err;
  Palette p = Palette::FromHex("test", hex, err);
  EXPECT_TRUE(err.empty()) << err;
  return p;
}

bool InPalette(const cv::Vec4b& px, const Palette& palette) {
  for (const Swatch& s : palette.swatches) {
    if (s.rgb[0] == px[0] && s.rgb[1] == px[1] && s.rgb[2] == px[2]) return true;
  }
  return false;
}
} // namespace

TEST(PaletteCatalogTest, CatalogHasFiveDistinctPalettes) {
  const std::vector<Palette> all = PaletteCatalog::All();
  ASSERT_EQ(all.size(), 5u);
  std::set<std::string> names;
  for (const Palette& p : all) {
    names.insert(p.name);
    EXPECT_GE(p.swatches.size(), 9u) << p.name;
    EXPECT_LE(p.swatches.size(), 12u) << p.name;
  }
  EXPECT_EQ(names.size(), 5u);
}

TEST(PaletteCatalogTest, SwatchMetadataIsPrecomputed) {
  const Swatch s = Palette::MakeSwatch(cv::Vec3b(200, 100, 50));
  EXPECT_NEAR(s.luminance, 0.299f * 200 + 0.587f * 100 + 0.114f * 50, 1e-3f);
  EXPECT_FLOAT_EQ(s.warmth, 150.0f);
}

TEST(PaletteCatalogTest, FindIsCaseInsensitive) {
  Palette p;
  EXPECT_TRUE(PaletteCatalog::Find("Harbor-Fog", p));
  EXPECT_EQ(p.name, "harbor-fog");
  EXPECT_FALSE(PaletteCatalog::Find("no-such-palette", p));
}

TEST(PaletteCatalogTest, MalformedHexIsRejected) {
  std::string err;
  const Palette p = Palette::FromHex("bad", {"#112233", "#12345"}, err);
  EXPECT_TRUE(p.empty());
  EXPECT_FALSE(err.empty());
  const Palette q = Palette::FromHex("bad", {"#zz0000"}, err);
  EXPECT_TRUE(q.empty());
}

TEST(PaletteMatcherTest, ExactSwatchColorsMapToThemselves) {
  for (const Palette& palette : PaletteCatalog::All()) {
    for (const Swatch& s : palette.swatches) {
      const cv::Mat in = Solid(6, 6, s.rgb[0], s.rgb[1], s.rgb[2]);
      const cv::Mat out = PaletteMatcher::Apply(in, palette, 3);
      EXPECT_TRUE(Identical(in, out)) << palette.name;
    }
  }
}

TEST(PaletteMatcherTest, ExactHitReportsFullCloseness) {
  const Palette p = MakePalette({"#808080", "#818181"});
  const PaletteMatcher::Match m = PaletteMatcher::FindTwoNearest(0x81, 0x81, 0x81, p);
  EXPECT_EQ(m.nearest, 1);
  EXPECT_EQ(m.second, 0);
  EXPECT_FLOAT_EQ(m.closeness, 1.0f);
}

TEST(PaletteMatcherTest, ClosenessIsTheDistanceRatio) {
  const Palette p = MakePalette({"#000000", "#ffffff"});
  const PaletteMatcher::Match m = PaletteMatcher::FindTwoNearest(100, 100, 100, p);
  EXPECT_EQ(m.nearest, 0);
  EXPECT_EQ(m.second, 1);
  EXPECT_LE(m.nearestDist, m.secondDist);
  EXPECT_NEAR(m.closeness, 1.0f - m.nearestDist / m.secondDist, 1e-6f);
  EXPECT_GE(m.closeness, 0.0f);
  EXPECT_LE(m.closeness, 1.0f);
}

TEST(PaletteMatcherTest, DitherProbabilityCurve) {
  EXPECT_FLOAT_EQ(PaletteMatcher::DitherProbability(1.0f), 0.0f);
  EXPECT_FLOAT_EQ(PaletteMatcher::DitherProbability(0.9f), 0.0f);
  EXPECT_NEAR(PaletteMatcher::DitherProbability(0.8f), 0.12f, 1e-5f);
  EXPECT_FLOAT_EQ(PaletteMatcher::DitherProbability(0.0f), 0.5f);
}

TEST(PaletteMatcherTest, HashIsDeterministicAndInUnitRange) {
  for (int i = 0; i < 200; ++i) {
    const float h = PaletteMatcher::HashUnit(i, i * 3, i % 256, 7, 9, 42);
    EXPECT_GE(h, 0.0f);
    EXPECT_LT(h, 1.0f);
    EXPECT_EQ(h, PaletteMatcher::HashUnit(i, i * 3, i % 256, 7, 9, 42));
  }
}

TEST(PaletteMatcherTest, OutputUsesOnlyPaletteColorsAndIsDeterministic) {
  Palette palette;
  ASSERT_TRUE(PaletteCatalog::Find("revachol-dusk", palette));
  const cv::Mat in = Noise(24, 18);
  const cv::Mat a = PaletteMatcher::Apply(in, palette, 11);
  const cv::Mat b = PaletteMatcher::Apply(in, palette, 11);
  EXPECT_TRUE(Identical(a, b));
  EXPECT_TRUE(SameAlpha(in, a));
  for (int y = 0; y < a.rows; ++y) {
    for (int x = 0; x < a.cols; ++x) EXPECT_TRUE(InPalette(a.at<cv::Vec4b>(y, x), palette));
  }
}

TEST(PaletteMatcherTest, EmptyPaletteIsACopy) {
  const cv::Mat in = Noise(5, 5);
  EXPECT_TRUE(Identical(in, PaletteMatcher::Apply(in, Palette(), 0)));
}

TEST(PaletteMatcherTest, AutoDetectPrefersTheClosestPalette) {
  const std::vector<Palette> candidates = {MakePalette({"#0000ff", "#0000a0"}),
                                           MakePalette({"#ff0000", "#a00000"})};
  const cv::Mat red = Solid(40, 30, 250, 5, 5);
  EXPECT_EQ(PaletteMatcher::AutoDetect(red, candidates), 1);
  EXPECT_DOUBLE_EQ(PaletteMatcher::Score(Solid(8, 8, 255, 0, 0), candidates[1]), 0.0);
  EXPECT_EQ(PaletteMatcher::AutoDetect(cv::Mat(), candidates), -1);
  EXPECT_EQ(PaletteMatcher::AutoDetect(red, {}), -1);
  EXPECT_TRUE(std::isinf(PaletteMatcher::Score(cv::Mat(), candidates[0])));
}

TEST(PaletteMatcherTest, ResolveSelections) {
  Palette p;
  std::string err;
  EXPECT_TRUE(PaletteMatcher::Resolve("none", cv::Mat(), p, err));
  EXPECT_TRUE(p.empty());

  EXPECT_TRUE(PaletteMatcher::Resolve("tribunal-grey", cv::Mat(), p, err));
  EXPECT_EQ(p.name, "tribunal-grey");

  EXPECT_FALSE(PaletteMatcher::Resolve("mauve-dreams", cv::Mat(), p, err));
  EXPECT_FALSE(err.empty());

  EXPECT_FALSE(PaletteMatcher::Resolve("auto", cv::Mat(), p, err));

  EXPECT_TRUE(PaletteMatcher::Resolve("auto", Gradient(64, 48), p, err)) << err;
  EXPECT_FALSE(p.empty());
}
