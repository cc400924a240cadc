#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

// Axis-aligned face hint in raster pixel coordinates.
// Regions may overlap; lookups always take the first region that contains a pixel.
struct FaceRegion {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  // Inclusive on both edges.
  bool Contains(int px, int py) const {
    return px >= x && px <= x + width && py >= y && py <= y + height;
  }
};

using FaceRegions = std::vector<FaceRegion>;

namespace faces {

// Index of the first region containing (px, py), or -1.
int FindContaining(const FaceRegions& regions, int px, int py);

inline bool InsideAny(const FaceRegions& regions, int px, int py) {
  return FindContaining(regions, px, py) >= 0;
}

// Maps regions detected on a raster of size `from` onto a raster of size `to`.
FaceRegions Rescale(const FaceRegions& regions, const cv::Size& from, const cv::Size& to);

// Summed area of the regions (each clipped to the raster) over the pixel count.
double Coverage(const FaceRegions& regions, const cv::Size& size);

} // namespace faces

// Parameters for one pipeline run. Immutable while the run is in flight.
struct FilterParameters {
  float intensity = 0.85f;          // 0..1, blend against the unfiltered source
  int posterizeLevels = 8;          // 3..16 quantization levels per channel
  float edgeStrength = 0.6f;        // 0..1, painted outline opacity
  int brushSize = 4;                // 2..8, oil paint radius / stroke length
  float warmth = 0.35f;             // 0..1, amber push in the grader
  float saturation = 0.55f;         // 0..1, final saturation modulation
  float textureStrength = 0.3f;     // 0..1, canvas weave overlay
  float detailPreservation = 0.5f;  // 0..1, high-pass reinjection and fine edges
  std::string palette = "none";     // "none", "auto" or a catalog palette name
  unsigned int ditherSeed = 0;      // seed for the palette dithering hash

  // Face hints and the raster size they were detected on (empty size = processing size).
  FaceRegions faceRegions;
  cv::Size faceSourceSize;
  bool faceDetectorReady = true;    // regions are ignored when the detector never loaded

  // Copy with every field clamped into its documented range.
  FilterParameters Sanitized() const;
};
