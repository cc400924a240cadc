#pragma once

#include <opencv2/core.hpp>

// ColorSpace: RGB <-> HSL helpers shared by every color stage.
// HSL components are in [0,1]; RGB components are bytes in [0,255].
struct Hsl {
  float h = 0.0f;
  float s = 0.0f;
  float l = 0.0f;
};

class ColorSpace {
public:
  static Hsl RgbToHsl(int r, int g, int b);
  static cv::Vec3b HslToRgb(const Hsl& hsl);

  // Perceptual luminance 0.299R + 0.587G + 0.114B (same scale as the inputs).
  static float Luminance(float r, float g, float b) {
    return 0.299f * r + 0.587f * g + 0.114f * b;
  }

  // Interpolates along the shortest arc of the hue circle, result in [0,1).
  static float LerpHue(float from, float to, float t);

  static float WrapHue(float h);
  static float Clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }
};
