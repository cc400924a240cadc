#include "ConfigStore.h"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

namespace {

template <typename T>
void ReadOr(const cv::FileNode& root, const char* key, T& value) {
  const cv::FileNode node = root[key];
  if (!node.empty()) node >> value;
}

void ReadFloat(const cv::FileNode& root, const char* key, float& value) {
  const cv::FileNode node = root[key];
  if (!node.empty() && node.isReal()) {
    value = static_cast<float>(static_cast<double>(node));
  } else if (!node.empty() && node.isInt()) {
    value = static_cast<float>(static_cast<int>(node));
  }
}

} // namespace

bool ConfigStore::Save(const std::string& path, const FilterParameters& params,
                       std::string& outError) {
  outError.clear();
  const FilterParameters p = params.Sanitized();
  try {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
      outError = "Failed to open config for writing: " + path;
      return false;
    }
    fs << "intensity" << p.intensity;
    fs << "posterize_levels" << p.posterizeLevels;
    fs << "edge_strength" << p.edgeStrength;
    fs << "brush_size" << p.brushSize;
    fs << "warmth" << p.warmth;
    fs << "saturation" << p.saturation;
    fs << "texture_strength" << p.textureStrength;
    fs << "detail_preservation" << p.detailPreservation;
    fs << "palette" << p.palette;
    fs << "dither_seed" << static_cast<int>(p.ditherSeed);
    fs.release();
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  CV_LOG_INFO(nullptr, "ConfigStore: saved settings to " << path);
  return true;
}

bool ConfigStore::Load(const std::string& path, FilterParameters& outParams,
                       std::string& outError) {
  outError.clear();
  FilterParameters p = outParams;
  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      outError = "Failed to open config for reading: " + path;
      return false;
    }
    const cv::FileNode root = fs.root();
    if (root.empty() || !root.isMap()) {
      outError = "Invalid or empty config file: " + path;
      return false;
    }

    ReadFloat(root, "intensity", p.intensity);
    ReadOr(root, "posterize_levels", p.posterizeLevels);
    ReadFloat(root, "edge_strength", p.edgeStrength);
    ReadOr(root, "brush_size", p.brushSize);
    ReadFloat(root, "warmth", p.warmth);
    ReadFloat(root, "saturation", p.saturation);
    ReadFloat(root, "texture_strength", p.textureStrength);
    ReadFloat(root, "detail_preservation", p.detailPreservation);
    ReadOr(root, "palette", p.palette);
    int seed = static_cast<int>(p.ditherSeed);
    ReadOr(root, "dither_seed", seed);
    p.ditherSeed = static_cast<unsigned int>(seed);
    fs.release();
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }

  const FilterParameters clamped = p.Sanitized();
  if (clamped.posterizeLevels != p.posterizeLevels || clamped.brushSize != p.brushSize) {
    CV_LOG_WARNING(nullptr, "ConfigStore: out-of-range values in " << path << " were clamped");
  }
  // p started as a copy of outParams, so the current face hints survive.
  outParams = clamped;
  CV_LOG_INFO(nullptr, "ConfigStore: loaded settings from " << path);
  return true;
}
