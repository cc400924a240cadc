#pragma once

#include "FilterParams.h"

#include <string>

// ConfigStore: persists FilterParameters as YAML/XML through cv::FileStorage.
// Missing keys keep their defaults and every loaded value is range-clamped.
// Face hints are per-image and never persisted.
class ConfigStore {
public:
  static bool Save(const std::string& path, const FilterParameters& params, std::string& outError);

  // On failure `outParams` is left untouched.
  static bool Load(const std::string& path, FilterParameters& outParams, std::string& outError);
};
