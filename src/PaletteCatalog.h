#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

// One palette color with its matching metadata, computed once per selection.
struct Swatch {
  cv::Vec3b rgb;
  float luminance = 0.0f; // 0.299R + 0.587G + 0.114B
  float warmth = 0.0f;    // R - B
};

struct Palette {
  std::string name;
  std::vector<Swatch> swatches;

  bool empty() const { return swatches.empty(); }

  // Builds a palette from "#rrggbb" strings. Returns an empty palette and fills
  // outError when any entry is malformed.
  static Palette FromHex(const std::string& name, const std::vector<std::string>& hex,
                         std::string& outError);
  static Swatch MakeSwatch(const cv::Vec3b& rgb);
};

// PaletteCatalog: the fixed set of hand-authored painterly palettes.
// Each palette mixes warm and cool hues, 9 to 12 swatches.
class PaletteCatalog {
public:
  enum class Preset {
    RevacholDusk,   // ochre, rust and harbor teal
    HarborFog,      // slate blues with amber lamplight
    FadedEmber,     // burnt sienna and sage
    TribunalGrey,   // desaturated neutrals with one warm accent
    CoastalMorning, // pale teal, sand and coral
  };

  static std::vector<Preset> AllPresets();
  static std::string PresetName(Preset preset);

  // Hex strings for a preset, in palette order.
  static std::vector<std::string> PresetHex(Preset preset);

  // Palette for a preset with metadata precomputed.
  static Palette Get(Preset preset);

  static std::vector<std::string> Names();

  // Looks up a catalog palette by name (case-insensitive). False when unknown.
  static bool Find(const std::string& name, Palette& outPalette);

  static std::vector<Palette> All();
};
