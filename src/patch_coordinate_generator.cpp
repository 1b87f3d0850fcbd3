#include <algorithm>
#include <string>

// Local includes
#include "ssd_augmentation/patch_coordinate_generator.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

PatchCoordinateGenerator::PatchCoordinateGenerator(const Config & config)
: config_(config)
{
  if (config_.min_scale <= 0.0) {
    throw ConfigError("min_scale must be positive, got " + std::to_string(config_.min_scale));
  }
  if (config_.min_scale > config_.max_scale) {
    throw ConfigError("min_scale (" + std::to_string(config_.min_scale) +
      ") must not exceed max_scale (" + std::to_string(config_.max_scale) + ")");
  }
  if (config_.min_aspect_ratio <= 0.0) {
    throw ConfigError("min_aspect_ratio must be positive, got " +
      std::to_string(config_.min_aspect_ratio));
  }
  if (config_.min_aspect_ratio > config_.max_aspect_ratio) {
    throw ConfigError("min_aspect_ratio (" + std::to_string(config_.min_aspect_ratio) +
      ") must not exceed max_aspect_ratio (" + std::to_string(config_.max_aspect_ratio) + ")");
  }
}

cv::Rect PatchCoordinateGenerator::operator()(
  int image_height, int image_width, RandomEngine & rng) const
{
  if (image_height <= 0 || image_width <= 0) {
    throw ConfigError("Reference image size must be positive, got " +
      std::to_string(image_height) + "x" + std::to_string(image_width));
  }

  cv::Size size = sample_size(image_height, image_width, rng);

  int ymin = sample_offset(image_height, size.height, rng);
  int xmin = sample_offset(image_width, size.width, rng);

  return cv::Rect(xmin, ymin, size.width, size.height);
}

cv::Size PatchCoordinateGenerator::sample_size(
  int image_height, int image_width, RandomEngine & rng) const
{
  const double min_scale = config_.min_scale;
  const double max_scale = config_.max_scale;
  int patch_height = 0;
  int patch_width = 0;

  switch (config_.match_mode) {
    case MatchMode::kIndependent:
      if (config_.scale_uniformly) {
        double scale = utils::sample_uniform(min_scale, max_scale, rng);
        patch_height = static_cast<int>(scale * image_height);
        patch_width = static_cast<int>(scale * image_width);
      } else {
        patch_height = static_cast<int>(
          utils::sample_uniform(min_scale, max_scale, rng) * image_height);
        patch_width = static_cast<int>(
          utils::sample_uniform(min_scale, max_scale, rng) * image_width);
        fit_aspect_ratio(patch_height, patch_width);
      }
      break;
    case MatchMode::kMatchWidthToHeight:
    {
      patch_height = static_cast<int>(
        utils::sample_uniform(min_scale, max_scale, rng) * image_height);
      double aspect_ratio = utils::sample_uniform(
        config_.min_aspect_ratio, config_.max_aspect_ratio, rng);
      patch_width = static_cast<int>(patch_height * aspect_ratio);
      fit_aspect_ratio(patch_height, patch_width);
      break;
    }
    case MatchMode::kMatchHeightToWidth:
    {
      patch_width = static_cast<int>(
        utils::sample_uniform(min_scale, max_scale, rng) * image_width);
      double aspect_ratio = utils::sample_uniform(
        config_.min_aspect_ratio, config_.max_aspect_ratio, rng);
      patch_height = static_cast<int>(patch_width / aspect_ratio);
      fit_aspect_ratio(patch_height, patch_width);
      break;
    }
  }

  // Tiny images: never go below one pixel per side
  return cv::Size(std::max(patch_width, 1), std::max(patch_height, 1));
}

void PatchCoordinateGenerator::fit_aspect_ratio(int & patch_height, int & patch_width) const
{
  if (patch_height <= 0 || patch_width <= 0) {
    return;
  }

  // Truncating the derived side can push w/h just outside the bounds.
  // Shrink the overlong side so the truncated ratio is back in range.
  double aspect_ratio = static_cast<double>(patch_width) / patch_height;
  if (aspect_ratio > config_.max_aspect_ratio) {
    patch_width = static_cast<int>(patch_height * config_.max_aspect_ratio);
  } else if (aspect_ratio < config_.min_aspect_ratio) {
    patch_height = static_cast<int>(patch_width / config_.min_aspect_ratio);
  }
}

int PatchCoordinateGenerator::sample_offset(int image_extent, int patch_extent, RandomEngine & rng)
{
  int range = image_extent - patch_extent;
  if (range >= 0) {
    return utils::sample_uniform_int(0, range, rng);
  }
  return utils::sample_uniform_int(range, 0, rng);
}

} // namespace ssd_augmentation
