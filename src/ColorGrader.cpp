#include "ColorGrader.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float kNeutralSaturation = 0.08f;
constexpr double kCloseUpCoverage = 0.25;
constexpr float kCloseUpDampen = 0.78f;

// Target hues on the [0,1] circle.
constexpr float kTeal = 0.49f;
constexpr float kSalmon = 0.03f;
constexpr float kAmber = 0.07f;
constexpr float kWarmPink = 0.97f;
constexpr float kShadowBlue = 0.6f;
constexpr float kShadowTeal = 0.5f;
constexpr float kOchre = 0.08f;
constexpr float kGold = 0.12f;
constexpr float kSage = 0.25f;
constexpr float kSlightTeal = 0.55f;
constexpr float kDustyPurple = 0.78f;
constexpr float kNeutralWarm = 0.09f;
constexpr float kGolden = 0.11f;

bool IsCool(HueCategory c) {
  return c == HueCategory::TealCyan || c == HueCategory::Blue || c == HueCategory::Purple;
}

Hsl GradeSkin(Hsl p, float warmth) {
  const float l = p.l;
  if (l < 0.2f) {
    // Painted shadows on skin go teal.
    p.h = ColorSpace::LerpHue(p.h, kTeal, 0.25f + 0.25f * warmth);
    p.s *= 0.85f;
  } else if (l < 0.35f) {
    const float t = (l - 0.2f) / 0.15f;
    const float target = ColorSpace::LerpHue(kTeal, kSalmon, t);
    p.h = ColorSpace::LerpHue(p.h, target, 0.2f + 0.3f * warmth);
  } else if (l < 0.7f) {
    p.h = ColorSpace::LerpHue(p.h, kSalmon, 0.5f * warmth);
    p.s = p.s * 1.05f;
  } else if (l < 0.85f) {
    p.h = ColorSpace::LerpHue(p.h, kAmber, 0.45f * warmth);
    p.l = p.l + 0.04f * warmth;
  } else {
    p.h = ColorSpace::LerpHue(p.h, kWarmPink, 0.35f * warmth);
    p.s *= 0.5f;
  }
  return p;
}

Hsl GradeMidtone(Hsl p, HueCategory category, float warmth) {
  switch (category) {
    case HueCategory::SkinWarm:
      p.h = ColorSpace::LerpHue(p.h, kOchre, 0.4f * warmth);
      p.s *= 0.9f;
      break;
    case HueCategory::YellowGold:
      p.h = ColorSpace::LerpHue(p.h, kGold, 0.3f);
      p.s *= 0.9f;
      break;
    case HueCategory::Green:
      p.h = ColorSpace::LerpHue(p.h, kSage, 0.3f);
      p.s *= 0.65f;
      break;
    case HueCategory::TealCyan:
      p.s *= 1.1f;
      break;
    case HueCategory::Blue:
      p.h = ColorSpace::LerpHue(p.h, kSlightTeal, 0.2f);
      p.s *= 0.85f;
      break;
    case HueCategory::Purple:
      p.h = ColorSpace::LerpHue(p.h, kDustyPurple, 0.3f);
      p.s *= 0.6f;
      break;
    case HueCategory::MagentaPink:
      p.s *= 0.55f;
      break;
    case HueCategory::Neutral:
      p.h = kNeutralWarm;
      p.s = p.s + 0.05f * warmth;
      break;
  }
  return p;
}

Hsl GradeScene(Hsl p, HueCategory category, float warmth) {
  const float l = p.l;
  if (l < 0.12f) {
    p.h = ColorSpace::LerpHue(p.h, kShadowBlue, 0.35f);
    p.s *= 0.7f;
  } else if (l < 0.3f) {
    p.h = ColorSpace::LerpHue(p.h, kShadowTeal, 0.25f);
    p.s *= 0.85f;
  } else if (l < 0.65f) {
    p = GradeMidtone(p, category, warmth);
  } else if (l < 0.85f) {
    if (IsCool(category)) {
      p.s *= 0.75f;
    } else {
      p.h = ColorSpace::LerpHue(p.h, kGolden, 0.35f * warmth);
    }
  } else {
    p.h = ColorSpace::LerpHue(p.h, kGold, 0.3f * warmth);
    p.s *= 0.45f;
  }
  return p;
}
} // namespace

HueCategory ColorGrader::Classify(float hue, float saturation) {
  if (saturation < kNeutralSaturation) return HueCategory::Neutral;
  const float deg = ColorSpace::WrapHue(hue) * 360.0f;
  if (deg < 30.0f || deg >= 345.0f) return HueCategory::SkinWarm;
  if (deg < 65.0f) return HueCategory::YellowGold;
  if (deg < 160.0f) return HueCategory::Green;
  if (deg < 200.0f) return HueCategory::TealCyan;
  if (deg < 255.0f) return HueCategory::Blue;
  if (deg < 290.0f) return HueCategory::Purple;
  return HueCategory::MagentaPink;
}

bool ColorGrader::LooksLikeSkin(int r, int g, int b, const Hsl& hsl) {
  const bool warmBand = hsl.h < 0.14f || hsl.h > 0.95f;
  return hsl.l > 0.15f && hsl.l < 0.9f && hsl.s > 0.1f && warmBand &&
         r > g && r > b && (r - g) > 10;
}

float ColorGrader::SkinDampen(const FaceRegions& faces, const cv::Size& size) {
  return faces::Coverage(faces, size) > kCloseUpCoverage ? kCloseUpDampen : 1.0f;
}

Hsl ColorGrader::GradePixel(const Hsl& in, HueCategory category, bool skin,
                            const Params& params, float skinDampen) {
  Hsl p = skin ? GradeSkin(in, params.warmth * skinDampen)
               : GradeScene(in, category, params.warmth);

  p.s *= params.saturation * 0.4f + 0.6f;

  p.h = ColorSpace::WrapHue(p.h);
  p.s = ColorSpace::Clamp01(p.s);
  p.l = ColorSpace::Clamp01(p.l);
  return p;
}

cv::Mat ColorGrader::Apply(const cv::Mat& rgba, const Params& params, const FaceRegions& faces) {
  if (rgba.empty() || rgba.type() != CV_8UC4) return {};
  const float dampen = SkinDampen(faces, rgba.size());

  cv::Mat out(rgba.size(), CV_8UC4);
  for (int y = 0; y < rgba.rows; ++y) {
    const cv::Vec4b* src = rgba.ptr<cv::Vec4b>(y);
    cv::Vec4b* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgba.cols; ++x) {
      const cv::Vec4b& px = src[x];
      const Hsl hsl = ColorSpace::RgbToHsl(px[0], px[1], px[2]);
      const HueCategory category = Classify(hsl.h, hsl.s);
      const bool skin = faces::InsideAny(faces, x, y) || LooksLikeSkin(px[0], px[1], px[2], hsl);

      const cv::Vec3b rgb = ColorSpace::HslToRgb(GradePixel(hsl, category, skin, params, dampen));
      dst[x] = cv::Vec4b(rgb[0], rgb[1], rgb[2], px[3]);
    }
  }
  return out;
}
