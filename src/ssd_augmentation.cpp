#include <iostream>
#include <optional>
#include <vector>

// OpenCV includes
#include <opencv2/imgproc.hpp>

// Local includes
#include "ssd_augmentation/ssd_augmentation.hpp"
#include "ssd_augmentation/bound_generator.hpp"
#include "ssd_augmentation/box_filter.hpp"
#include "ssd_augmentation/exception.hpp"
#include "ssd_augmentation/geometric_ops.hpp"
#include "ssd_augmentation/image_validator.hpp"
#include "ssd_augmentation/patch_coordinate_generator.hpp"
#include "ssd_augmentation/photometric_ops.hpp"


namespace ssd_augmentation
{

// SSDPhotometricDistortions

SSDPhotometricDistortions::SSDPhotometricDistortions()
{
  const ConvertColor rgb_to_hsv(ColorSpace::kRGB, ColorSpace::kHSV);
  const ConvertColor hsv_to_rgb(ColorSpace::kHSV, ColorSpace::kRGB);
  const ConvertDataType to_float(DataType::kFloat32);
  const ConvertDataType to_uint8(DataType::kUInt8);
  const ConvertTo3Channels to_3_channels;
  const RandomBrightness brightness(
    -config::SSD_BRIGHTNESS_DELTA, config::SSD_BRIGHTNESS_DELTA, config::SSD_DISTORTION_PROB);
  const RandomContrast contrast(
    config::SSD_CONTRAST_LOWER, config::SSD_CONTRAST_UPPER, config::SSD_DISTORTION_PROB);
  const RandomSaturation saturation(
    config::SSD_SATURATION_LOWER, config::SSD_SATURATION_UPPER, config::SSD_DISTORTION_PROB);
  const RandomHue hue(config::SSD_HUE_DELTA, config::SSD_DISTORTION_PROB);
  const RandomChannelSwap channel_swap(config::SSD_CHANNEL_SWAP_PROB);

  orderings_[0] = {"contrast_first", Compose({
    to_3_channels, to_float, brightness, contrast, to_uint8,
    rgb_to_hsv, to_float, saturation, hue, to_uint8, hsv_to_rgb,
    channel_swap})};

  orderings_[1] = {"contrast_last", Compose({
    to_3_channels, to_float, brightness, to_uint8,
    rgb_to_hsv, to_float, saturation, hue, to_uint8, hsv_to_rgb,
    to_float, contrast, to_uint8,
    channel_swap})};
}

Sample SSDPhotometricDistortions::operator()(const Sample & sample, RandomEngine & rng) const
{
  const auto & ordering = utils::sample_bernoulli(0.5, rng) ? orderings_[0] : orderings_[1];
  return ordering.sequence(sample, rng);
}

// SSDExpand

namespace
{

PatchSampler make_expand_sampler(const cv::Scalar & background)
{
  PatchCoordinateGenerator::Config generator_config;
  generator_config.match_mode = PatchCoordinateGenerator::MatchMode::kIndependent;
  generator_config.min_scale = config::SSD_EXPAND_MIN_SCALE;
  generator_config.max_scale = config::SSD_EXPAND_MAX_SCALE;
  generator_config.scale_uniformly = true;

  PatchSampler::Config sampler_config;
  sampler_config.prob = config::SSD_EXPAND_PROB;
  sampler_config.max_trials = 1;
  sampler_config.max_attempts = 1;
  sampler_config.clip_patch_to_image = false;
  sampler_config.background = background;

  return PatchSampler(PatchCoordinateGenerator(generator_config),
    std::nullopt, std::nullopt, std::nullopt, sampler_config);
}

PatchSampler make_crop_sampler(int max_attempts)
{
  // "Use the entire image" plus the minimum IoU thresholds of the paper
  std::vector<BoundPair> sample_space;
  sample_space.emplace_back(std::nullopt, std::nullopt);
  for (float min_iou : config::SSD_CROP_MIN_IOUS) {
    sample_space.emplace_back(min_iou, std::nullopt);
  }
  BoundGenerator bound_generator(BoundGenerator::Config(sample_space));

  PatchCoordinateGenerator::Config generator_config;
  generator_config.match_mode = PatchCoordinateGenerator::MatchMode::kIndependent;
  generator_config.min_scale = config::SSD_CROP_MIN_SCALE;
  generator_config.max_scale = config::SSD_CROP_MAX_SCALE;
  generator_config.scale_uniformly = false;
  generator_config.min_aspect_ratio = config::SSD_CROP_MIN_ASPECT_RATIO;
  generator_config.max_aspect_ratio = config::SSD_CROP_MAX_ASPECT_RATIO;

  BoxFilter::Config filter_config;
  filter_config.overlap_criterion = OverlapCriterion::kCenterPoint;
  filter_config.clip_boxes = false;

  ImageValidator::Config validator_config;
  validator_config.overlap_criterion = OverlapCriterion::kIoU;
  validator_config.min_boxes_required = 1;

  PatchSampler::Config sampler_config;
  sampler_config.prob = config::SSD_CROP_PROB;
  sampler_config.max_trials = config::SSD_CROP_MAX_TRIALS;
  sampler_config.max_attempts = max_attempts;
  sampler_config.clip_patch_to_image = true;

  return PatchSampler(PatchCoordinateGenerator(generator_config),
    BoxFilter(filter_config), ImageValidator(validator_config), bound_generator,
    sampler_config);
}

} // namespace

SSDExpand::SSDExpand(const cv::Scalar & background)
: expand_(make_expand_sampler(background))
{
}

Sample SSDExpand::operator()(const Sample & sample, RandomEngine & rng) const
{
  return expand_(sample, rng);
}

// SSDRandomCrop

SSDRandomCrop::SSDRandomCrop(int max_attempts)
: random_crop_(make_crop_sampler(max_attempts))
{
}

Sample SSDRandomCrop::operator()(const Sample & sample, RandomEngine & rng) const
{
  return random_crop_(sample, rng);
}

// SSDDataAugmentation

SSDDataAugmentation::SSDDataAugmentation(const Config & config)
: config_(config), rng_(config.seed)
{
  sequence_.add(SSDPhotometricDistortions())
    .add(SSDExpand(config_.background))
    .add(SSDRandomCrop(config_.crop_max_attempts))
    .add(RandomFlip(FlipAxis::kHorizontal, config::SSD_FLIP_PROB))
    .add(ResizeRandomInterp(config_.height, config_.width));
  if (config_.clip_boxes_to_output) {
    sequence_.add(ClipBoxes());
  }

  if (config_.verbose) {
    std::cout << "SSDDataAugmentation initialized with:" << std::endl;
    std::cout << "  Output size: " << config_.height << "x" << config_.width << std::endl;
    std::cout << "  Background: [" << config_.background[0] << ", "
      << config_.background[1] << ", " << config_.background[2] << "]" << std::endl;
    std::cout << "  Crop max attempts: " << config_.crop_max_attempts << std::endl;
    std::cout << "  Clip boxes to output: " << std::boolalpha
      << config_.clip_boxes_to_output << std::endl;
    std::cout << "  Stages: " << sequence_.size() << std::endl;
  }
}

Sample SSDDataAugmentation::augment(const cv::Mat & image, const LabelSet & labels)
{
  return (*this)(Sample{image, labels}, rng_);
}

Sample SSDDataAugmentation::operator()(const Sample & sample, RandomEngine & rng) const
{
  if (sample.image.empty()) {
    throw TypeMismatch("SSDDataAugmentation received an empty image");
  }
  return sequence_(sample, rng);
}

} // namespace ssd_augmentation
