#include "ColorSpace.h"

#include <algorithm>
#include <cmath>

namespace {
float HueToChannel(float p, float q, float t) {
  if (t < 0.0f) t += 1.0f;
  if (t > 1.0f) t -= 1.0f;
  if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
  if (t < 0.5f) return q;
  if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
  return p;
}
} // namespace

Hsl ColorSpace::RgbToHsl(int r, int g, int b) {
  const float rf = r / 255.0f;
  const float gf = g / 255.0f;
  const float bf = b / 255.0f;
  const float mx = std::max(rf, std::max(gf, bf));
  const float mn = std::min(rf, std::min(gf, bf));

  Hsl out;
  out.l = (mx + mn) * 0.5f;
  if (mx == mn) return out; // achromatic

  const float d = mx - mn;
  out.s = out.l > 0.5f ? d / (2.0f - mx - mn) : d / (mx + mn);
  if (mx == rf) {
    out.h = ((gf - bf) / d + (gf < bf ? 6.0f : 0.0f)) / 6.0f;
  } else if (mx == gf) {
    out.h = ((bf - rf) / d + 2.0f) / 6.0f;
  } else {
    out.h = ((rf - gf) / d + 4.0f) / 6.0f;
  }
  return out;
}

cv::Vec3b ColorSpace::HslToRgb(const Hsl& hsl) {
  const float h = WrapHue(hsl.h);
  const float s = Clamp01(hsl.s);
  const float l = Clamp01(hsl.l);
  if (s == 0.0f) {
    const uchar v = cv::saturate_cast<uchar>(l * 255.0f);
    return cv::Vec3b(v, v, v);
  }
  const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
  const float p = 2.0f * l - q;
  return cv::Vec3b(
      cv::saturate_cast<uchar>(HueToChannel(p, q, h + 1.0f / 3.0f) * 255.0f),
      cv::saturate_cast<uchar>(HueToChannel(p, q, h) * 255.0f),
      cv::saturate_cast<uchar>(HueToChannel(p, q, h - 1.0f / 3.0f) * 255.0f));
}

float ColorSpace::LerpHue(float from, float to, float t) {
  float delta = to - from;
  if (delta > 0.5f) delta -= 1.0f;
  if (delta < -0.5f) delta += 1.0f;
  return WrapHue(from + delta * t);
}

float ColorSpace::WrapHue(float h) {
  h = std::fmod(h, 1.0f);
  if (h < 0.0f) h += 1.0f;
  if (h >= 1.0f) h = 0.0f;
  return h;
}
