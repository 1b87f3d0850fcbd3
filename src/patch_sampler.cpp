#include <iostream>
#include <string>
#include <utility>

// Local includes
#include "ssd_augmentation/patch_sampler.hpp"
#include "ssd_augmentation/box_utils.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

PatchSampler::PatchSampler(
  const PatchCoordinateGenerator & patch_coord_generator,
  std::optional<BoxFilter> box_filter,
  std::optional<ImageValidator> image_validator,
  std::optional<BoundGenerator> bound_generator,
  const Config & config)
: patch_coord_generator_(patch_coord_generator),
  box_filter_(std::move(box_filter)),
  image_validator_(std::move(image_validator)),
  bound_generator_(std::move(bound_generator)),
  config_(config)
{
  if (config_.prob < 0.0 || config_.prob > 1.0) {
    throw ConfigError("prob must be in [0, 1], got " + std::to_string(config_.prob));
  }
  if (config_.max_trials < 1) {
    throw ConfigError("max_trials must be at least 1, got " + std::to_string(config_.max_trials));
  }
  if (config_.max_attempts < 1) {
    throw ConfigError("max_attempts must be at least 1, got " +
      std::to_string(config_.max_attempts));
  }
}

Sample PatchSampler::operator()(const Sample & sample, RandomEngine & rng) const
{
  if (sample.image.empty()) {
    throw TypeMismatch("PatchSampler received an empty image");
  }

  auto patch = find_patch(sample, rng);
  if (!patch) {
    return sample;
  }
  return sample_patch(sample, *patch);
}

std::optional<cv::Rect> PatchSampler::find_patch(const Sample & sample, RandomEngine & rng) const
{
  const int image_height = sample.image.rows;
  const int image_width = sample.image.cols;

  for (int attempt = 0; attempt < config_.max_attempts; ++attempt) {
    if (!utils::sample_bernoulli(config_.prob, rng)) {
      return std::nullopt;
    }

    BoundPair bounds;
    if (bound_generator_) {
      bounds = (*bound_generator_)(rng);
    } else if (image_validator_) {
      bounds = image_validator_->config().bounds;
    }

    for (int trial = 0; trial < config_.max_trials; ++trial) {
      cv::Rect patch = patch_coord_generator_(image_height, image_width, rng);
      if (!image_validator_ || (*image_validator_)(sample.labels, patch, bounds)) {
        return patch;
      }
    }
  }

  if (config_.max_attempts > 1) {
    std::cerr << "[PatchSampler WARNING] No valid patch after " << config_.max_attempts
      << " attempts of " << config_.max_trials << " trials; returning input unchanged"
      << std::endl;
  }
  return std::nullopt;
}

Sample PatchSampler::sample_patch(const Sample & sample, const cv::Rect & patch) const
{
  const cv::Mat & image = sample.image;
  const cv::Rect image_rect(0, 0, image.cols, image.rows);
  const cv::Rect region = config_.clip_patch_to_image ? (patch & image_rect) : patch;

  Sample result;
  const cv::Rect overlap = region & image_rect;
  if (overlap == region) {
    result.image = image(region).clone();
  } else {
    result.image = cv::Mat(region.size(), image.type(), config_.background);
    if (!overlap.empty()) {
      image(overlap).copyTo(result.image(overlap - region.tl()));
    }
  }

  // A clipping filter already moved the boxes into the patch frame
  LabelSet labels = sample.labels;
  cv::Point origin = region.tl();
  if (box_filter_) {
    labels = (*box_filter_)(sample.labels, patch);
    if (box_filter_->clips_boxes()) {
      origin -= patch.tl();
    }
  }
  result.labels = utils::translate_labels(
    labels, static_cast<float>(-origin.x), static_cast<float>(-origin.y));

  return result;
}

} // namespace ssd_augmentation
