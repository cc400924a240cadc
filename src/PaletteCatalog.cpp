#include "PaletteCatalog.h"

#include "ColorSpace.h"

#include <algorithm>
#include <cctype>
#include <opencv2/core/utils/logger.hpp>

namespace {
int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  return -1;
}

bool ParseHex(const std::string& text, cv::Vec3b& out) {
  std::string s = text;
  if (!s.empty() && s[0] == '#') s.erase(0, 1);
  if (s.size() != 6) return false;
  for (int i = 0; i < 3; ++i) {
    const int hi = HexDigit(s[2 * i]);
    const int lo = HexDigit(s[2 * i + 1]);
    if (hi < 0 || lo < 0) return false;
    out[i] = static_cast<uchar>(hi * 16 + lo);
  }
  return true;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
} // namespace

Swatch Palette::MakeSwatch(const cv::Vec3b& rgb) {
  Swatch s;
  s.rgb = rgb;
  s.luminance = ColorSpace::Luminance(rgb[0], rgb[1], rgb[2]);
  s.warmth = static_cast<float>(rgb[0]) - static_cast<float>(rgb[2]);
  return s;
}

Palette Palette::FromHex(const std::string& name, const std::vector<std::string>& hex,
                         std::string& outError) {
  outError.clear();
  Palette palette;
  palette.name = name;
  palette.swatches.reserve(hex.size());
  for (const std::string& entry : hex) {
    cv::Vec3b rgb;
    if (!ParseHex(entry, rgb)) {
      outError = "Invalid hex color '" + entry + "' in palette '" + name + "'.";
      return {};
    }
    palette.swatches.push_back(MakeSwatch(rgb));
  }
  return palette;
}

std::vector<PaletteCatalog::Preset> PaletteCatalog::AllPresets() {
  return {Preset::RevacholDusk, Preset::HarborFog, Preset::FadedEmber,
          Preset::TribunalGrey, Preset::CoastalMorning};
}

std::string PaletteCatalog::PresetName(Preset preset) {
  switch (preset) {
    case Preset::RevacholDusk: return "revachol-dusk";
    case Preset::HarborFog: return "harbor-fog";
    case Preset::FadedEmber: return "faded-ember";
    case Preset::TribunalGrey: return "tribunal-grey";
    case Preset::CoastalMorning: return "coastal-morning";
  }
  return {};
}

std::vector<std::string> PaletteCatalog::PresetHex(Preset preset) {
  switch (preset) {
    case Preset::RevacholDusk:
      // Dusk over the harbor: ochre and rust against deep teal.
      return {"#1b2a2f", "#2f4f4f", "#3e6b68", "#6f8f86", "#c9b38a", "#e3c27a",
              "#c8893f", "#a0522d", "#6b3a2a", "#3a2520", "#e8d9bd", "#8a7e72"};
    case Preset::HarborFog:
      return {"#1e2430", "#34404f", "#52657a", "#7f95a6", "#b7c4c9", "#e6e2d3",
              "#d9a65b", "#b5793a", "#6e4b36", "#423229"};
    case Preset::FadedEmber:
      return {"#24191a", "#4a2c24", "#7a3e2a", "#b4603a", "#d98e5a", "#ecc48f",
              "#a7a27a", "#6d7a5a", "#3f4d3d", "#2b3433", "#f2e4c9"};
    case Preset::TribunalGrey:
      // Mostly neutral; one burnt orange accent.
      return {"#161616", "#2e2c2a", "#4a4744", "#6a6661", "#8e8983", "#b4afa7",
              "#d7d2c8", "#a9582c", "#5b6e73", "#3d4b50"};
    case Preset::CoastalMorning:
      return {"#203a43", "#2f5d62", "#5e8b7e", "#a7c4bc", "#dfeeea", "#f2d7b6",
              "#e9a178", "#c86b5a", "#8c4a44", "#56423e", "#94a3a8"};
  }
  return {};
}

Palette PaletteCatalog::Get(Preset preset) {
  std::string err;
  Palette palette = Palette::FromHex(PresetName(preset), PresetHex(preset), err);
  if (!err.empty()) {
    CV_LOG_ERROR(nullptr, "PaletteCatalog: " << err);
  }
  return palette;
}

std::vector<std::string> PaletteCatalog::Names() {
  std::vector<std::string> names;
  for (Preset p : AllPresets()) names.push_back(PresetName(p));
  return names;
}

bool PaletteCatalog::Find(const std::string& name, Palette& outPalette) {
  const std::string wanted = Lower(name);
  for (Preset p : AllPresets()) {
    if (PresetName(p) == wanted) {
      outPalette = Get(p);
      return !outPalette.empty();
    }
  }
  return false;
}

std::vector<Palette> PaletteCatalog::All() {
  std::vector<Palette> palettes;
  for (Preset p : AllPresets()) palettes.push_back(Get(p));
  return palettes;
}
