#include "FilterParams.h"

#include <algorithm>
#include <cmath>

namespace {
inline int ClampInt(int v, int lo, int hi) { return std::max(lo, std::min(v, hi)); }
inline float ClampFloat(float v, float lo, float hi) {
  if (!(v == v)) return lo; // NaN
  return std::max(lo, std::min(v, hi));
}
} // namespace

namespace faces {

int FindContaining(const FaceRegions& regions, int px, int py) {
  for (size_t i = 0; i < regions.size(); ++i) {
    if (regions[i].Contains(px, py)) return static_cast<int>(i);
  }
  return -1;
}

FaceRegions Rescale(const FaceRegions& regions, const cv::Size& from, const cv::Size& to) {
  if (from.width <= 0 || from.height <= 0 || from == to) return regions;
  const double sx = static_cast<double>(to.width) / from.width;
  const double sy = static_cast<double>(to.height) / from.height;

  FaceRegions out;
  out.reserve(regions.size());
  for (const FaceRegion& f : regions) {
    FaceRegion r;
    r.x = static_cast<int>(std::lround(f.x * sx));
    r.y = static_cast<int>(std::lround(f.y * sy));
    r.width = static_cast<int>(std::lround(f.width * sx));
    r.height = static_cast<int>(std::lround(f.height * sy));
    out.push_back(r);
  }
  return out;
}

double Coverage(const FaceRegions& regions, const cv::Size& size) {
  const double total = static_cast<double>(size.width) * size.height;
  if (total <= 0.0) return 0.0;
  const cv::Rect bounds(0, 0, size.width, size.height);
  double area = 0.0;
  for (const FaceRegion& f : regions) {
    const cv::Rect clipped = cv::Rect(f.x, f.y, f.width, f.height) & bounds;
    area += static_cast<double>(clipped.area());
  }
  return area / total;
}

} // namespace faces

FilterParameters FilterParameters::Sanitized() const {
  FilterParameters p = *this;
  p.intensity = ClampFloat(p.intensity, 0.0f, 1.0f);
  p.posterizeLevels = ClampInt(p.posterizeLevels, 3, 16);
  p.edgeStrength = ClampFloat(p.edgeStrength, 0.0f, 1.0f);
  p.brushSize = ClampInt(p.brushSize, 2, 8);
  p.warmth = ClampFloat(p.warmth, 0.0f, 1.0f);
  p.saturation = ClampFloat(p.saturation, 0.0f, 1.0f);
  p.textureStrength = ClampFloat(p.textureStrength, 0.0f, 1.0f);
  p.detailPreservation = ClampFloat(p.detailPreservation, 0.0f, 1.0f);
  if (p.palette.empty()) p.palette = "none";
  return p;
}
